#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

namespace seedgen {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base, the including file overlays it
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

// Accepts `key = "name"` or `key = ["name", "alias"]`
std::vector<std::string> toml_name_list(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* s = tbl[key].as_string()) {
        result.emplace_back(s->get());
    } else if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* item = elem.as_string()) {
                result.emplace_back(item->get());
            }
        }
    }
    return result;
}

const toml::array* rule_array(const toml::table& root, const std::string_view kind) {
    return root["assemblers"][kind].as_array();
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

DatabaseConfig ConfigLoader::extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto db = root["database"];
    cfg.connection_string = db["connection_string"].value_or(cfg.connection_string);
    cfg.schema = db["schema"].value_or(cfg.schema);
    return cfg;
}

OutputConfig ConfigLoader::extract_output(const toml::table& root) {
    OutputConfig cfg;
    cfg.dir = root["output"]["dir"].value_or(cfg.dir);
    return cfg;
}

GenerationConfig ConfigLoader::extract_generation(const toml::table& root) {
    GenerationConfig cfg;
    const auto g = root["generation"];
    const int64_t seed = g["seed"].value_or(static_cast<int64_t>(cfg.seed));
    if (seed < 0) {
        throw std::runtime_error(std::format("generation.seed must be >= 0, got {}", seed));
    }
    cfg.seed = static_cast<uint64_t>(seed);
    cfg.truncate_first = g["truncate_first"].value_or(cfg.truncate_first);
    cfg.load = g["load"].value_or(cfg.load);
    cfg.sync_sequences = g["sync_sequences"].value_or(cfg.sync_sequences);
    cfg.enum_null_probability = g["enum_null_probability"].value_or(cfg.enum_null_probability);
    cfg.unique_retry_budget = g["unique_retry_budget"].value_or(cfg.unique_retry_budget);
    cfg.unique_derive_budget = g["unique_derive_budget"].value_or(cfg.unique_derive_budget);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    cfg.level = root["logging"]["level"].value_or(cfg.level);
    return cfg;
}

std::map<std::string, int64_t> ConfigLoader::extract_row_counts(const toml::table& root) {
    std::map<std::string, int64_t> counts;
    const auto* tbl = root["row_counts"].as_table();
    if (!tbl) return counts;

    for (const auto& [key, val] : *tbl) {
        const auto count = val.value<int64_t>();
        if (!count) {
            throw std::runtime_error(
                std::format("row_counts.{} must be an integer", key.str()));
        }
        counts[std::string(key.str())] = *count;
    }
    return counts;
}

AssemblerRules ConfigLoader::extract_assemblers(const toml::table& root) {
    AssemblerRules rules;

    if (const auto* arr = rule_array(root, "junction")) {
        for (const auto& elem : *arr) {
            const auto* t = elem.as_table();
            if (!t) continue;
            JunctionRule rule;
            rule.table = (*t)["table"].value_or(std::string{});
            rule.left_columns = toml_name_list(*t, "left");
            rule.right_columns = toml_name_list(*t, "right");
            rule.fanout_min = (*t)["fanout_min"].value_or(rule.fanout_min);
            rule.fanout_max = (*t)["fanout_max"].value_or(rule.fanout_max);
            rules.junction.push_back(std::move(rule));
        }
    }

    if (const auto* arr = rule_array(root, "date_range")) {
        for (const auto& elem : *arr) {
            const auto* t = elem.as_table();
            if (!t) continue;
            DateRangeRule rule;
            rule.table = (*t)["table"].value_or(std::string{});
            rule.parent_columns = toml_name_list(*t, "parent");
            rule.date_columns = toml_name_list(*t, "date");
            rule.window_start_days = (*t)["window_start_days"].value_or(rule.window_start_days);
            rule.window_end_days = (*t)["window_end_days"].value_or(rule.window_end_days);
            rules.date_range.push_back(std::move(rule));
        }
    }

    if (const auto* arr = rule_array(root, "status_lifecycle")) {
        for (const auto& elem : *arr) {
            const auto* t = elem.as_table();
            if (!t) continue;
            StatusLifecycleRule rule;
            rule.table = (*t)["table"].value_or(std::string{});
            rule.status_columns = toml_name_list(*t, "status");
            rule.checkin_columns = toml_name_list(*t, "checkin");
            rule.checkout_columns = toml_name_list(*t, "checkout");
            rule.checkin_window_days = (*t)["checkin_window_days"].value_or(rule.checkin_window_days);
            rules.status_lifecycle.push_back(std::move(rule));
        }
    }

    return rules;
}

// ---- Shared extraction + validation ----------------------------------------

SeedConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    SeedConfig config;
    config.database = extract_database(tbl);
    config.output = extract_output(tbl);
    config.generation = extract_generation(tbl);
    config.logging = extract_logging(tbl);
    config.row_counts = extract_row_counts(tbl);
    config.assemblers = extract_assemblers(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(SeedConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const SeedConfig& config) {
    std::vector<std::string> errors;

    if (config.database.connection_string.empty()) {
        errors.push_back("database.connection_string must not be empty");
    }
    if (config.database.schema.empty()) {
        errors.push_back("database.schema must not be empty");
    }
    if (config.output.dir.empty()) {
        errors.push_back("output.dir must not be empty");
    }

    const auto& gen = config.generation;
    if (gen.enum_null_probability < 0.0 || gen.enum_null_probability > 1.0) {
        errors.push_back(std::format(
            "generation.enum_null_probability must be in [0, 1], got {}", gen.enum_null_probability));
    }
    if (gen.unique_retry_budget < 0) {
        errors.push_back("generation.unique_retry_budget must be >= 0");
    }
    if (gen.unique_derive_budget <= 0) {
        errors.push_back("generation.unique_derive_budget must be > 0");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' is not one of debug, info, warn, error",
            config.logging.level));
    }

    for (const auto& [table, count] : config.row_counts) {
        if (count < 0) {
            errors.push_back(std::format("row_counts.{} must be >= 0, got {}", table, count));
        }
    }

    for (size_t i = 0; i < config.assemblers.junction.size(); ++i) {
        const auto& r = config.assemblers.junction[i];
        if (r.table.empty()) {
            errors.push_back(std::format("assemblers.junction[{}].table must not be empty", i));
        }
        if (r.left_columns.empty() || r.right_columns.empty()) {
            errors.push_back(std::format("assemblers.junction[{}] needs left and right columns", i));
        }
        if (r.fanout_min < 0 || r.fanout_min > r.fanout_max) {
            errors.push_back(std::format(
                "assemblers.junction[{}] fanout must satisfy 0 <= min <= max, got {}..{}",
                i, r.fanout_min, r.fanout_max));
        }
    }

    for (size_t i = 0; i < config.assemblers.date_range.size(); ++i) {
        const auto& r = config.assemblers.date_range[i];
        if (r.table.empty()) {
            errors.push_back(std::format("assemblers.date_range[{}].table must not be empty", i));
        }
        if (r.parent_columns.empty() || r.date_columns.empty()) {
            errors.push_back(std::format("assemblers.date_range[{}] needs parent and date columns", i));
        }
        if (r.window_start_days > r.window_end_days) {
            errors.push_back(std::format(
                "assemblers.date_range[{}] window_start_days ({}) > window_end_days ({})",
                i, r.window_start_days, r.window_end_days));
        }
    }

    for (size_t i = 0; i < config.assemblers.status_lifecycle.size(); ++i) {
        const auto& r = config.assemblers.status_lifecycle[i];
        if (r.table.empty()) {
            errors.push_back(std::format("assemblers.status_lifecycle[{}].table must not be empty", i));
        }
        if (r.status_columns.empty() || r.checkin_columns.empty() || r.checkout_columns.empty()) {
            errors.push_back(std::format(
                "assemblers.status_lifecycle[{}] needs status, checkin and checkout columns", i));
        }
        if (r.checkin_window_days <= 0) {
            errors.push_back(std::format(
                "assemblers.status_lifecycle[{}].checkin_window_days must be > 0", i));
        }
    }

    return errors;
}

} // namespace seedgen
