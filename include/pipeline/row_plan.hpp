#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace seedgen {

/**
 * @brief Requested row count per table
 *
 * Counts come from name heuristics over the lowercased table name (first
 * match wins), then per-table overrides from [row_counts]. An override
 * naming a table that is not in the schema is logged and ignored.
 */
class RowPlan {
public:
    RowPlan() = default;

    [[nodiscard]] static RowPlan build(const std::vector<std::string>& tables,
                                       const std::map<std::string, int64_t>& overrides);

    [[nodiscard]] static int64_t default_count(const std::string& table);

    // 0 for tables not in the plan
    [[nodiscard]] int64_t count_for(const std::string& table) const;

    [[nodiscard]] size_t size() const { return counts_.size(); }
    [[nodiscard]] const std::vector<std::string>& ignored_overrides() const { return ignored_; }

private:
    std::unordered_map<std::string, int64_t> counts_;    // lowercased table -> rows
    std::vector<std::string> ignored_;
};

} // namespace seedgen
