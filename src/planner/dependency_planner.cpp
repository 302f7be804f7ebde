#include "planner/dependency_planner.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>
#include <map>
#include <set>

namespace seedgen {

LoadPlan DependencyPlanner::plan(const std::vector<std::string>& tables,
                                 const std::vector<ForeignKey>& foreign_keys) {
    // Lowercased name -> catalog spelling. Ordered maps give the tie-break.
    std::map<std::string, std::string> spelling;
    for (const auto& t : tables) {
        spelling.emplace(utils::to_lower(t), t);
    }

    std::map<std::string, std::set<std::string>> deps;     // child -> parents
    std::map<std::string, std::set<std::string>> rdeps;    // parent -> children
    for (const auto& [key, _] : spelling) {
        deps[key];
        rdeps[key];
    }

    for (const auto& fk : foreign_keys) {
        const std::string child = utils::to_lower(fk.table);
        const std::string parent = utils::to_lower(fk.ref_table);
        if (child == parent) continue;
        if (!spelling.contains(child) || !spelling.contains(parent)) continue;
        deps[child].insert(parent);
        rdeps[parent].insert(child);
    }

    std::set<std::string> ready;
    for (const auto& [key, parents] : deps) {
        if (parents.empty()) ready.insert(key);
    }

    LoadPlan plan;
    plan.order.reserve(spelling.size());
    std::set<std::string> placed;

    while (!ready.empty()) {
        const std::string next = *ready.begin();
        ready.erase(ready.begin());
        plan.order.push_back(spelling.at(next));
        placed.insert(next);

        for (const auto& child : rdeps[next]) {
            auto& pending = deps[child];
            pending.erase(next);
            if (pending.empty() && !placed.contains(child)) {
                ready.insert(child);
            }
        }
    }

    for (const auto& [key, name] : spelling) {
        if (!placed.contains(key)) {
            plan.order.push_back(name);
            plan.cyclic_tables.push_back(name);
        }
    }

    if (!plan.cyclic_tables.empty()) {
        utils::log::warn(std::format(
            "Foreign-key cycle among [{}]: loading in name order, child rows may reference "
            "tables that are still empty", utils::join(plan.cyclic_tables, ", ")));
    }

    return plan;
}

} // namespace seedgen
