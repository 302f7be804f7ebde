#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace seedgen {

/**
 * @brief Load order for one run
 */
struct LoadPlan {
    std::vector<std::string> order;           // Every input table exactly once
    std::vector<std::string> cyclic_tables;   // Tail of `order` left over by an FK cycle
};

/**
 * @brief Topological ordering of tables by foreign-key dependency
 *
 * Kahn's algorithm with a lexicographic tie-break, so the same schema
 * always yields the same order. Edges with an endpoint outside the table
 * set are ignored, and a self-referencing key never makes a table wait on
 * itself. Tables still blocked once the queue drains sit on a cross-table
 * cycle: they are appended in lexicographic order and listed in
 * LoadPlan::cyclic_tables. No cycle breaking is attempted.
 *
 * A self-referencing table is ordered like any other. Its self FK samples
 * the table's own key pool, which is empty on a fresh load: the column is
 * NULL when nullable and a CAPACITY_ERROR when NOT NULL.
 */
class DependencyPlanner {
public:
    [[nodiscard]] static LoadPlan plan(const std::vector<std::string>& tables,
                                       const std::vector<ForeignKey>& foreign_keys);
};

} // namespace seedgen
