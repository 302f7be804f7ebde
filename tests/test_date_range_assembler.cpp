#include <catch2/catch_test_macros.hpp>
#include "assembler/date_range_assembler.hpp"
#include "core/calendar.hpp"
#include "core/error.hpp"

#include <map>
#include <set>
#include <utility>

using namespace seedgen;
using namespace std::chrono;

namespace {

const calendar::Date kAnchor = sys_days{year{2025} / March / 1};

GenerationContext make_ctx() {
    return GenerationContext(GenerationContext::Config{}, kAnchor, calendar::Timestamp{kAnchor});
}

TableSpec rate_calendar_spec() {
    TableSpec spec;
    spec.table = "rate_calendar";
    spec.columns = {
        Column("rate_calendar", "room_type_id", TypeFamily::INTEGER, false),
        Column("rate_calendar", "stay_date", TypeFamily::DATE, false),
        Column("rate_calendar", "price", TypeFamily::NUMERIC, false),
    };
    spec.foreign_keys.emplace("room_type_id",
        ForeignKey{"rate_calendar", "room_type_id", "room_type", "room_type_id"});
    return spec;
}

DateRangeRule rule(int start, int end) {
    DateRangeRule r;
    r.table = "rate_calendar";
    r.parent_columns = {"room_type_id"};
    r.date_columns = {"stay_date", "date"};
    r.window_start_days = start;
    r.window_end_days = end;
    return r;
}

void seed_room_types(GenerationContext& ctx, int n) {
    std::vector<std::string> keys;
    for (int i = 1; i <= n; ++i) keys.push_back(std::to_string(i));
    ctx.key_pool().set("room_type", keys);
}

} // namespace

TEST_CASE("DateRangeAssembler - rows spread evenly across parents", "[date_range]") {
    auto ctx = make_ctx();
    seed_room_types(ctx, 4);

    DateRangeAssembler assembler(rule(-30, 30));
    const auto table = assembler.assemble(rate_calendar_spec(), 10, ctx);
    REQUIRE(table.rows.size() == 10);

    std::map<std::string, size_t> per_parent;
    for (const auto& row : table.rows) {
        ++per_parent[*row[0]];
    }
    REQUIRE(per_parent.size() == 4);
    for (const auto& [parent, count] : per_parent) {
        CHECK(count >= 2);
        CHECK(count <= 3);
    }
}

TEST_CASE("DateRangeAssembler - (parent, date) is unique and inside the window", "[date_range]") {
    auto ctx = make_ctx();
    seed_room_types(ctx, 3);

    DateRangeAssembler assembler(rule(-10, 10));
    const auto table = assembler.assemble(rate_calendar_spec(), 60, ctx);

    std::set<std::pair<std::string, std::string>> keys;
    for (const auto& row : table.rows) {
        CHECK(keys.emplace(*row[0], *row[1]).second);
        const auto day = calendar::parse_date(*row[1]);
        REQUIRE(day.has_value());
        CHECK(*day >= kAnchor - days{10});
        CHECK(*day <= kAnchor + days{10});
        CHECK(row[2].has_value());
    }
}

TEST_CASE("DateRangeAssembler - a window of one day per parent", "[date_range]") {
    auto ctx = make_ctx();
    seed_room_types(ctx, 5);

    DateRangeAssembler assembler(rule(0, 0));
    const auto table = assembler.assemble(rate_calendar_spec(), 5, ctx);
    for (const auto& row : table.rows) {
        CHECK(row[1] == "2025-03-01");
    }
}

TEST_CASE("DateRangeAssembler - more rows than parent-days is a capacity error", "[date_range]") {
    auto ctx = make_ctx();
    seed_room_types(ctx, 2);

    DateRangeAssembler assembler(rule(0, 4));
    try {
        (void)assembler.assemble(rate_calendar_spec(), 11, ctx);
        FAIL("expected SeedError");
    } catch (const SeedError& e) {
        CHECK(e.category() == ErrorCategory::CAPACITY_ERROR);
        CHECK(std::string(e.what()).find("available 10") != std::string::npos);
    }
}

TEST_CASE("DateRangeAssembler - zero rows", "[date_range]") {
    auto ctx = make_ctx();
    seed_room_types(ctx, 2);
    DateRangeAssembler assembler(rule(0, 4));
    CHECK(assembler.assemble(rate_calendar_spec(), 0, ctx).rows.empty());
}

TEST_CASE("DateRangeAssembler - schema problems", "[date_range]") {
    auto ctx = make_ctx();
    seed_room_types(ctx, 2);

    SECTION("missing date column") {
        auto r = rule(0, 4);
        r.date_columns = {"night"};
        DateRangeAssembler assembler(r);
        try {
            (void)assembler.assemble(rate_calendar_spec(), 1, ctx);
            FAIL("expected SeedError");
        } catch (const SeedError& e) {
            CHECK(e.category() == ErrorCategory::SCHEMA_ERROR);
        }
    }

    SECTION("parent is not a foreign key") {
        auto spec = rate_calendar_spec();
        spec.foreign_keys.clear();
        DateRangeAssembler assembler(rule(0, 4));
        CHECK_THROWS_AS(assembler.assemble(spec, 1, ctx), SeedError);
    }

    SECTION("UNIQUE date column") {
        auto spec = rate_calendar_spec();
        spec.unique_columns.insert("stay_date");
        DateRangeAssembler assembler(rule(0, 4));
        try {
            (void)assembler.assemble(spec, 4, ctx);
            FAIL("expected SeedError");
        } catch (const SeedError& e) {
            CHECK(e.category() == ErrorCategory::SCHEMA_ERROR);
            CHECK(std::string(e.what()).find("rate_calendar.stay_date is UNIQUE") != std::string::npos);
        }
    }
}
