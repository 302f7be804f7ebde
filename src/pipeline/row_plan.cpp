#include "pipeline/row_plan.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <array>
#include <format>
#include <string_view>

namespace seedgen {

namespace {

template<size_t N>
bool contains_any(const std::string& name, const std::array<std::string_view, N>& needles) {
    return std::any_of(needles.begin(), needles.end(),
        [&](std::string_view needle) { return utils::contains(name, needle); });
}

constexpr std::array<std::string_view, 8> kReferenceTables = {
    "lookup", "type", "status", "code", "catalog", "policy", "rate_plan", "rate_calendar"};
constexpr std::array<std::string_view, 4> kMoneyTables = {
    "payment", "invoice", "transaction", "charge"};
constexpr std::array<std::string_view, 2> kReversalTables = {"refund", "cancellation"};

} // anonymous namespace

int64_t RowPlan::default_count(const std::string& table) {
    const std::string name = utils::to_lower(table);

    if (contains_any(name, kReferenceTables)) return 50;
    if (name == "hotel") return 12;
    if (name == "room") return 1000;
    if (utils::contains(name, "customer")) return 30000;
    if (utils::contains(name, "booking")) return 70000;
    if (contains_any(name, kMoneyTables)) return 60000;
    if (contains_any(name, kReversalTables)) return 8000;
    return 2000;
}

RowPlan RowPlan::build(const std::vector<std::string>& tables,
                       const std::map<std::string, int64_t>& overrides) {
    RowPlan plan;
    for (const auto& table : tables) {
        plan.counts_[utils::to_lower(table)] = default_count(table);
    }

    for (const auto& [table, count] : overrides) {
        const auto it = plan.counts_.find(utils::to_lower(table));
        if (it == plan.counts_.end()) {
            utils::log::warn(std::format("row_counts override for unknown table '{}' ignored", table));
            plan.ignored_.push_back(table);
            continue;
        }
        it->second = count;
    }
    return plan;
}

int64_t RowPlan::count_for(const std::string& table) const {
    const auto it = counts_.find(utils::to_lower(table));
    return it != counts_.end() ? it->second : 0;
}

} // namespace seedgen
