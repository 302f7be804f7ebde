#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace seedgen {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads seedgen.toml
 *
 * String values may reference environment variables as ${NAME} (unset
 * expands to empty). A top-level `include = "base.toml"` (or an array of
 * paths, relative to the including file) is merged underneath the
 * including file: scalars in the including file win, arrays of tables
 * are concatenated.
 *
 * Assembler rule column fields accept a single string or an array of
 * candidate names; the first one present in the table is used.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        SeedConfig config;

        static LoadResult ok(SeedConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to seedgen.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string (no include support)
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check cross-field constraints
     * @return One message per violation, empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const SeedConfig& config);

private:
    static DatabaseConfig extract_database(const toml::table& root);
    static OutputConfig extract_output(const toml::table& root);
    static GenerationConfig extract_generation(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static std::map<std::string, int64_t> extract_row_counts(const toml::table& root);
    static AssemblerRules extract_assemblers(const toml::table& root);

    static SeedConfig extract_all_sections(const toml::table& tbl);
    static LoadResult validate_and_return(SeedConfig config);
};

} // namespace seedgen
