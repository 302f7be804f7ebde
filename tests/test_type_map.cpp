#include <catch2/catch_test_macros.hpp>
#include "db/postgresql/pg_type_map.hpp"

using namespace seedgen;

TEST_CASE("PgTypeMap - classify by data_type", "[type_map]") {
    const EnumCatalog enums;
    CHECK(PgTypeMap::classify("integer", "int4", enums) == TypeFamily::INTEGER);
    CHECK(PgTypeMap::classify("bigint", "int8", enums) == TypeFamily::INTEGER);
    CHECK(PgTypeMap::classify("smallint", "int2", enums) == TypeFamily::INTEGER);
    CHECK(PgTypeMap::classify("numeric", "numeric", enums) == TypeFamily::NUMERIC);
    CHECK(PgTypeMap::classify("character varying", "varchar", enums) == TypeFamily::TEXT);
    CHECK(PgTypeMap::classify("text", "text", enums) == TypeFamily::TEXT);
    CHECK(PgTypeMap::classify("boolean", "bool", enums) == TypeFamily::BOOLEAN);
    CHECK(PgTypeMap::classify("date", "date", enums) == TypeFamily::DATE);
    CHECK(PgTypeMap::classify("timestamp with time zone", "timestamptz", enums) == TypeFamily::TIMESTAMP);
    CHECK(PgTypeMap::classify("timestamp without time zone", "timestamp", enums) == TypeFamily::TIMESTAMP);
    CHECK(PgTypeMap::classify("uuid", "uuid", enums) == TypeFamily::UUID);
}

TEST_CASE("PgTypeMap - enum catalog wins for user-defined types", "[type_map]") {
    const EnumCatalog enums{{"booking_status", {"PENDING", "CONFIRMED"}}};
    CHECK(PgTypeMap::classify("USER-DEFINED", "booking_status", enums) == TypeFamily::ENUM);
    CHECK(PgTypeMap::classify("USER-DEFINED", "Booking_Status", enums) == TypeFamily::ENUM);
    CHECK(PgTypeMap::classify("USER-DEFINED", "geometry", enums) == TypeFamily::OTHER);
}

TEST_CASE("PgTypeMap - unknown types are OTHER", "[type_map]") {
    const EnumCatalog enums;
    CHECK(PgTypeMap::classify("jsonb", "jsonb", enums) == TypeFamily::OTHER);
    CHECK(PgTypeMap::classify("bytea", "bytea", enums) == TypeFamily::OTHER);
}

TEST_CASE("PgTypeMap - integer widths", "[type_map]") {
    CHECK(PgTypeMap::integer_bytes("int2") == 2);
    CHECK(PgTypeMap::integer_bytes("int4") == 4);
    CHECK(PgTypeMap::integer_bytes("int8") == 8);
    CHECK(PgTypeMap::integer_bytes("numeric") == 0);
    CHECK(integer_max_for(2) == 32767);
    CHECK(integer_max_for(4) == 2147483647);
}
