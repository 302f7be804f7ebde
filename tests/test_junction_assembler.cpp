#include <catch2/catch_test_macros.hpp>
#include "assembler/junction_assembler.hpp"
#include "core/error.hpp"

#include <set>
#include <utility>

using namespace seedgen;

namespace {

TableSpec booking_room_spec() {
    TableSpec spec;
    spec.table = "booking_room";
    spec.columns = {
        Column("booking_room", "booking_id", TypeFamily::INTEGER, false),
        Column("booking_room", "room_id", TypeFamily::INTEGER, false),
        Column("booking_room", "rate", TypeFamily::NUMERIC, true),
    };
    spec.foreign_keys.emplace("booking_id", ForeignKey{"booking_room", "booking_id", "booking", "booking_id"});
    spec.foreign_keys.emplace("room_id", ForeignKey{"booking_room", "room_id", "room", "room_id"});
    return spec;
}

JunctionRule booking_room_rule() {
    JunctionRule rule;
    rule.table = "booking_room";
    rule.left_columns = {"booking_id"};
    rule.right_columns = {"room_id"};
    return rule;
}

void seed_parents(GenerationContext& ctx, int bookings, int rooms) {
    std::vector<std::string> b;
    std::vector<std::string> r;
    for (int i = 1; i <= bookings; ++i) b.push_back(std::to_string(i));
    for (int i = 1; i <= rooms; ++i) r.push_back(std::to_string(100 + i));
    ctx.key_pool().set("booking", b);
    ctx.key_pool().set("room", r);
}

} // namespace

TEST_CASE("JunctionAssembler - pairs are unique and reference parents", "[junction]") {
    GenerationContext ctx;
    seed_parents(ctx, 40, 25);

    JunctionAssembler assembler(booking_room_rule());
    const auto table = assembler.assemble(booking_room_spec(), 600, ctx);

    REQUIRE(table.rows.size() == 600);
    std::set<std::pair<std::string, std::string>> pairs;
    for (const auto& row : table.rows) {
        const int booking = std::stoi(*row[0]);
        const int room = std::stoi(*row[1]);
        CHECK(booking >= 1);
        CHECK(booking <= 40);
        CHECK(room >= 101);
        CHECK(room <= 125);
        CHECK(pairs.emplace(*row[0], *row[1]).second);
    }
}

TEST_CASE("JunctionAssembler - full product is reachable", "[junction]") {
    GenerationContext ctx;
    seed_parents(ctx, 3, 3);

    JunctionAssembler assembler(booking_room_rule());
    const auto table = assembler.assemble(booking_room_spec(), 9, ctx);

    std::set<std::pair<std::string, std::string>> pairs;
    for (const auto& row : table.rows) {
        pairs.emplace(*row[0], *row[1]);
    }
    CHECK(pairs.size() == 9);
}

TEST_CASE("JunctionAssembler - more rows than pairs is a capacity error", "[junction]") {
    GenerationContext ctx;
    seed_parents(ctx, 3, 3);

    JunctionAssembler assembler(booking_room_rule());
    try {
        (void)assembler.assemble(booking_room_spec(), 10, ctx);
        FAIL("expected SeedError");
    } catch (const SeedError& e) {
        CHECK(e.category() == ErrorCategory::CAPACITY_ERROR);
        const std::string msg = e.what();
        CHECK(msg.find("requested 10") != std::string::npos);
        CHECK(msg.find("available 9") != std::string::npos);
    }
}

TEST_CASE("JunctionAssembler - columns must exist and be foreign keys", "[junction]") {
    GenerationContext ctx;
    seed_parents(ctx, 3, 3);

    SECTION("missing column") {
        auto rule = booking_room_rule();
        rule.right_columns = {"suite_id"};
        JunctionAssembler assembler(rule);
        try {
            (void)assembler.assemble(booking_room_spec(), 1, ctx);
            FAIL("expected SeedError");
        } catch (const SeedError& e) {
            CHECK(e.category() == ErrorCategory::SCHEMA_ERROR);
        }
    }

    SECTION("plain column") {
        auto spec = booking_room_spec();
        spec.foreign_keys.erase("room_id");
        JunctionAssembler assembler(booking_room_rule());
        CHECK_THROWS_AS(assembler.assemble(spec, 1, ctx), SeedError);
    }
}

TEST_CASE("JunctionAssembler - UNIQUE side is rejected", "[junction]") {
    GenerationContext ctx;
    seed_parents(ctx, 5, 5);

    auto spec = booking_room_spec();
    spec.unique_columns.insert("booking_id");

    JunctionAssembler assembler(booking_room_rule());
    try {
        (void)assembler.assemble(spec, 5, ctx);
        FAIL("expected SeedError");
    } catch (const SeedError& e) {
        CHECK(e.category() == ErrorCategory::SCHEMA_ERROR);
        CHECK(std::string(e.what()).find("booking_room.booking_id is UNIQUE") != std::string::npos);
    }
}

TEST_CASE("JunctionAssembler - first matching candidate column is used", "[junction]") {
    GenerationContext ctx;
    seed_parents(ctx, 5, 5);

    auto rule = booking_room_rule();
    rule.left_columns = {"reservation_id", "BOOKING_ID"};
    JunctionAssembler assembler(rule);
    const auto table = assembler.assemble(booking_room_spec(), 10, ctx);
    CHECK(table.rows.size() == 10);
}
