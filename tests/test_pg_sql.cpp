#include <catch2/catch_test_macros.hpp>
#include "db/postgresql/pg_sql.hpp"

using namespace seedgen;

TEST_CASE("PgSql - quote_identifier doubles embedded quotes", "[pg_sql]") {
    CHECK(pg::quote_identifier("booking") == "\"booking\"");
    CHECK(pg::quote_identifier("Mixed Case") == "\"Mixed Case\"");
    CHECK(pg::quote_identifier("we\"ird") == "\"we\"\"ird\"");
}

TEST_CASE("PgSql - quote_literal doubles single quotes", "[pg_sql]") {
    CHECK(pg::quote_literal("public") == "'public'");
    CHECK(pg::quote_literal("o'hare") == "'o''hare'");
    CHECK(pg::quote_literal("") == "''");
}

TEST_CASE("PgSql - qualified name and column list", "[pg_sql]") {
    CHECK(pg::qualified_name("public", "room_night") == "\"public\".\"room_night\"");
    CHECK(pg::column_list({"room_id", "night_date"}) == "\"room_id\", \"night_date\"");
    CHECK(pg::column_list({}).empty());
}
