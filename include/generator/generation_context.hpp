#pragma once

#include "core/calendar.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "generator/reference_key_pool.hpp"
#include <algorithm>
#include <cstdint>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace seedgen {

/**
 * @brief Address fields drawn together for one (table, row)
 */
struct Location {
    std::string city;
    std::string state;
    std::string country;
    std::string postal_code;
    std::string timezone;
    std::string street1;
    std::optional<std::string> street2;
};

/**
 * @brief Mutable state shared by every generator in a run
 *
 * Owns the random engine, the reference key pools, and the registries
 * that make values unique or consistent across columns: seen values per
 * (table, column), the location cache per (table, row), the row-scoped
 * creation timestamp per (table, row) and the shuffled unique pools.
 *
 * Single writer: one pipeline thread drives the whole run.
 */
class GenerationContext {
public:
    struct Config {
        uint64_t seed = 42;
        double enum_null_probability = 0.03;
        size_t unique_retry_budget = 50;
        size_t unique_derive_budget = 1000;
    };

    GenerationContext();
    explicit GenerationContext(const Config& config);

    /**
     * @brief Pin the clock (tests use this for reproducible dates)
     */
    GenerationContext(const Config& config, calendar::Date anchor, calendar::Timestamp now);

    // ========================================================================
    // Random draws
    // ========================================================================

    [[nodiscard]] std::mt19937_64& rng() { return rng_; }

    // Inclusive on both ends
    [[nodiscard]] int64_t uniform_int(int64_t lo, int64_t hi);
    [[nodiscard]] double uniform_real(double lo, double hi);
    [[nodiscard]] bool chance(double p);

    // @throws SeedError GENERATION_ERROR on an empty sequence
    template<typename Seq>
    [[nodiscard]] const auto& pick(const Seq& seq) {
        if (std::size(seq) == 0) {
            throw SeedError(ErrorCategory::GENERATION_ERROR, "Cannot pick from an empty sequence");
        }
        return seq[static_cast<size_t>(uniform_int(0, static_cast<int64_t>(std::size(seq)) - 1))];
    }

    template<typename T>
    void shuffle(std::vector<T>& items) {
        std::shuffle(items.begin(), items.end(), rng_);
    }

    // ========================================================================
    // Clock
    // ========================================================================

    [[nodiscard]] calendar::Date anchor_date() const { return anchor_; }
    [[nodiscard]] calendar::Timestamp now() const { return now_; }

    // ========================================================================
    // Schema-wide inputs
    // ========================================================================

    [[nodiscard]] const Config& config() const { return config_; }
    [[nodiscard]] ReferenceKeyPool& key_pool() { return key_pool_; }
    [[nodiscard]] const ReferenceKeyPool& key_pool() const { return key_pool_; }

    void set_enums(EnumCatalog enums) { enums_ = std::move(enums); }
    [[nodiscard]] const EnumCatalog& enums() const { return enums_; }

    // Labels of an enum type, empty if unknown
    [[nodiscard]] const std::vector<std::string>& enum_labels(const std::string& enum_type) const;

    // ========================================================================
    // Registries
    // ========================================================================

    /**
     * @brief Record a value in a (table, column, scope) uniqueness set
     * @return false if the value was already present
     *
     * The scope separates constraint enforcement from values the
     * synthesizer keeps unique on its own (emails, name tokens).
     */
    bool claim_unique(const std::string& table, const std::string& column,
                      const std::string& value, std::string_view scope = "constraint");

    [[nodiscard]] bool is_claimed(const std::string& table, const std::string& column,
                                  const std::string& value, std::string_view scope = "constraint") const;

    [[nodiscard]] const Location& location_for(const std::string& table, int64_t row);

    /**
     * @brief Creation timestamp shared by created_at and updated_at of a row
     *
     * Drawn from the last two years on first use, then reused.
     */
    [[nodiscard]] calendar::Timestamp row_created_at(const std::string& table, int64_t row);

    /**
     * @brief Next value of a shuffled non-repeating pool for (table, column)
     *
     * Each base value is handed out once in shuffled order; afterwards a
     * random base value with a `_xxxxxx` hex suffix is returned.
     */
    [[nodiscard]] std::string next_from_unique_pool(const std::string& table, const std::string& column,
                                                    std::span<const std::string_view> base);

    /**
     * @brief Drop per-row caches of a finished table
     */
    void end_table(const std::string& table);

private:
    static std::string registry_key(const std::string& table, const std::string& column,
                                    std::string_view scope);
    static std::string row_key(const std::string& table, int64_t row);

    Location make_location();

    Config config_;
    std::mt19937_64 rng_;
    calendar::Date anchor_;
    calendar::Timestamp now_;

    ReferenceKeyPool key_pool_;
    EnumCatalog enums_;

    std::unordered_map<std::string, std::unordered_set<std::string>> unique_registry_;
    std::unordered_map<std::string, Location> location_cache_;
    std::unordered_map<std::string, calendar::Timestamp> row_created_at_;
    std::unordered_map<std::string, std::vector<std::string>> unique_pools_;
};

} // namespace seedgen
