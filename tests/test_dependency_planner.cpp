#include <catch2/catch_test_macros.hpp>
#include "planner/dependency_planner.hpp"

#include <algorithm>

using namespace seedgen;

namespace {

ForeignKey fk(const std::string& table, const std::string& column,
              const std::string& ref_table, const std::string& ref_column = "id") {
    return ForeignKey{table, column, ref_table, ref_column};
}

size_t position(const LoadPlan& plan, const std::string& table) {
    return static_cast<size_t>(std::find(plan.order.begin(), plan.order.end(), table) - plan.order.begin());
}

} // namespace

TEST_CASE("DependencyPlanner - three-table chain", "[planner]") {
    const auto plan = DependencyPlanner::plan(
        {"grandchild", "child", "parent"},
        {fk("child", "parent_id", "parent"), fk("grandchild", "child_id", "child")});

    REQUIRE(plan.order == std::vector<std::string>{"parent", "child", "grandchild"});
    CHECK(plan.cyclic_tables.empty());
}

TEST_CASE("DependencyPlanner - independent tables in name order", "[planner]") {
    const auto plan = DependencyPlanner::plan({"zeta", "alpha", "mid"}, {});
    CHECK(plan.order == std::vector<std::string>{"alpha", "mid", "zeta"});
}

TEST_CASE("DependencyPlanner - parent before child on every edge", "[planner]") {
    const std::vector<ForeignKey> fks = {
        fk("room", "hotel_id", "hotel"),
        fk("room", "room_type_id", "room_type"),
        fk("booking", "customer_id", "customer"),
        fk("booking", "hotel_id", "hotel"),
        fk("booking_room", "booking_id", "booking"),
        fk("booking_room", "room_id", "room"),
        fk("payment", "booking_id", "booking"),
    };
    const auto plan = DependencyPlanner::plan(
        {"payment", "booking_room", "booking", "room", "room_type", "hotel", "customer"}, fks);

    REQUIRE(plan.order.size() == 7);
    for (const auto& edge : fks) {
        CHECK(position(plan, edge.ref_table) < position(plan, edge.table));
    }
}

TEST_CASE("DependencyPlanner - self reference does not block a table", "[planner]") {
    const auto plan = DependencyPlanner::plan(
        {"employee", "department"},
        {fk("employee", "manager_id", "employee"), fk("employee", "department_id", "department")});

    CHECK(plan.order == std::vector<std::string>{"department", "employee"});
    CHECK(plan.cyclic_tables.empty());
}

TEST_CASE("DependencyPlanner - edges leaving the table set are ignored", "[planner]") {
    const auto plan = DependencyPlanner::plan(
        {"booking"}, {fk("booking", "customer_id", "customer")});
    CHECK(plan.order == std::vector<std::string>{"booking"});
}

TEST_CASE("DependencyPlanner - cycle members appended in name order", "[planner]") {
    const auto plan = DependencyPlanner::plan(
        {"b", "a", "root", "c"},
        {fk("a", "b_id", "b"), fk("b", "a_id", "a"), fk("c", "root_id", "root")});

    CHECK(plan.order == std::vector<std::string>{"root", "c", "a", "b"});
    CHECK(plan.cyclic_tables == std::vector<std::string>{"a", "b"});
}

TEST_CASE("DependencyPlanner - catalog spelling is preserved", "[planner]") {
    const auto plan = DependencyPlanner::plan(
        {"Child", "Parent"}, {fk("child", "parent_id", "PARENT")});
    CHECK(plan.order == std::vector<std::string>{"Parent", "Child"});
}
