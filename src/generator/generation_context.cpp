#include "generator/generation_context.hpp"
#include "generator/value_pools.hpp"
#include "core/utils.hpp"
#include <format>

namespace seedgen {

namespace {

constexpr char kKeySep = '\x1f';

// Window for created_at / updated_at style columns
constexpr int64_t kRecentWindowSeconds = 730LL * 24 * 3600;

} // anonymous namespace

GenerationContext::GenerationContext()
    : GenerationContext(Config{}) {}

GenerationContext::GenerationContext(const Config& config)
    : GenerationContext(config, calendar::today(), calendar::now()) {}

GenerationContext::GenerationContext(const Config& config, calendar::Date anchor, calendar::Timestamp now)
    : config_(config),
      rng_(config.seed),
      anchor_(anchor),
      now_(now) {}

// ============================================================================
// Random draws
// ============================================================================

int64_t GenerationContext::uniform_int(int64_t lo, int64_t hi) {
    if (hi <= lo) return lo;
    std::uniform_int_distribution<int64_t> dis(lo, hi);
    return dis(rng_);
}

double GenerationContext::uniform_real(double lo, double hi) {
    if (hi <= lo) return lo;
    std::uniform_real_distribution<double> dis(lo, hi);
    return dis(rng_);
}

bool GenerationContext::chance(double p) {
    if (p <= 0.0) return false;
    if (p >= 1.0) return true;
    std::bernoulli_distribution dis(p);
    return dis(rng_);
}

const std::vector<std::string>& GenerationContext::enum_labels(const std::string& enum_type) const {
    static const std::vector<std::string> kEmpty;
    const auto it = enums_.find(utils::to_lower(enum_type));
    return it != enums_.end() ? it->second : kEmpty;
}

// ============================================================================
// Registries
// ============================================================================

std::string GenerationContext::registry_key(const std::string& table, const std::string& column,
                                            std::string_view scope) {
    std::string key = utils::to_lower(table);
    key += kKeySep;
    key += column;
    key += kKeySep;
    key += scope;
    return key;
}

std::string GenerationContext::row_key(const std::string& table, int64_t row) {
    return std::format("{}{}{}", utils::to_lower(table), kKeySep, row);
}

bool GenerationContext::claim_unique(const std::string& table, const std::string& column,
                                     const std::string& value, std::string_view scope) {
    return unique_registry_[registry_key(table, column, scope)].insert(value).second;
}

bool GenerationContext::is_claimed(const std::string& table, const std::string& column,
                                   const std::string& value, std::string_view scope) const {
    const auto it = unique_registry_.find(registry_key(table, column, scope));
    return it != unique_registry_.end() && it->second.contains(value);
}

Location GenerationContext::make_location() {
    const auto& seed = pick(pools::kLocations);

    Location loc;
    loc.city = seed.city;
    loc.state = seed.state;
    loc.country = seed.country;
    loc.timezone = seed.timezone;

    loc.postal_code = std::format("{}{:03d}", seed.postal_prefix, uniform_int(0, 999));
    loc.street1 = std::format("{} {}", uniform_int(10, 9999), pick(pools::kStreetNames));

    switch (uniform_int(0, 2)) {
        case 0: break;
        case 1: loc.street2 = std::format("Apt {}", uniform_int(1, 999)); break;
        default: loc.street2 = std::format("Suite {}", uniform_int(100, 1999)); break;
    }
    return loc;
}

const Location& GenerationContext::location_for(const std::string& table, int64_t row) {
    const std::string key = row_key(table, row);
    auto it = location_cache_.find(key);
    if (it == location_cache_.end()) {
        it = location_cache_.emplace(key, make_location()).first;
    }
    return it->second;
}

calendar::Timestamp GenerationContext::row_created_at(const std::string& table, int64_t row) {
    const std::string key = row_key(table, row);
    auto it = row_created_at_.find(key);
    if (it == row_created_at_.end()) {
        const auto offset = std::chrono::seconds{uniform_int(0, kRecentWindowSeconds)};
        it = row_created_at_.emplace(key, now_ - offset).first;
    }
    return it->second;
}

std::string GenerationContext::next_from_unique_pool(const std::string& table, const std::string& column,
                                                     std::span<const std::string_view> base) {
    if (base.empty()) {
        return utils::random_hex(rng_, 6);
    }

    const std::string key = registry_key(table, column, "pool");
    auto it = unique_pools_.find(key);
    if (it == unique_pools_.end()) {
        std::vector<std::string> pool(base.begin(), base.end());
        shuffle(pool);
        it = unique_pools_.emplace(key, std::move(pool)).first;
    }

    auto& pool = it->second;
    if (!pool.empty()) {
        std::string value = std::move(pool.back());
        pool.pop_back();
        return value;
    }
    return std::format("{}_{}", pick(base), utils::random_hex(rng_, 6));
}

void GenerationContext::end_table(const std::string& table) {
    std::string prefix = utils::to_lower(table);
    prefix += kKeySep;

    const auto has_prefix = [&prefix](const auto& entry) {
        return entry.first.starts_with(prefix);
    };
    std::erase_if(location_cache_, has_prefix);
    std::erase_if(row_created_at_, has_prefix);
}

} // namespace seedgen
