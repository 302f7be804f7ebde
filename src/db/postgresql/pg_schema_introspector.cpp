#include "db/postgresql/pg_schema_introspector.hpp"
#include "db/postgresql/pg_sql.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <format>

namespace seedgen {

namespace {

const std::string& cell_or_empty(const std::optional<std::string>& cell) {
    static const std::string kEmpty;
    return cell ? *cell : kEmpty;
}

std::optional<int> cell_to_int(const std::optional<std::string>& cell) {
    if (!cell) return std::nullopt;
    return utils::try_parse_int<int>(*cell);
}

} // anonymous namespace

DbResultSet PgSchemaIntrospector::query(const std::string& what, const std::string& sql) {
    auto result = conn_.execute(sql);
    if (!result.success) {
        throw SeedError(ErrorCategory::SCHEMA_ERROR,
            std::format("Catalog query for {} failed: {}", what, result.error_message));
    }
    return result;
}

SchemaSnapshot PgSchemaIntrospector::introspect(const std::string& schema) {
    if (!conn_.is_connected()) {
        throw SeedError(ErrorCategory::SCHEMA_ERROR, "Database connection is not open");
    }

    SchemaSnapshot snap;
    snap.schema = schema;

    // Enums come before columns: classification needs the catalog
    load_tables(snap);
    load_enums(snap);
    load_columns(snap);
    load_primary_keys(snap);
    load_foreign_keys(snap);
    load_unique_columns(snap);

    utils::log::info(std::format(
        "Introspected schema '{}': {} tables, {} foreign keys, {} enum types",
        schema, snap.tables.size(), snap.foreign_keys.size(), snap.enums.size()));
    return snap;
}

void PgSchemaIntrospector::load_tables(SchemaSnapshot& snap) {
    const auto res = query("tables", std::format(
        "SELECT table_name "
        "FROM information_schema.tables "
        "WHERE table_schema = {} AND table_type = 'BASE TABLE' "
        "ORDER BY table_name",
        pg::quote_literal(snap.schema)));

    snap.tables.reserve(res.rows.size());
    for (const auto& row : res.rows) {
        snap.tables.push_back(cell_or_empty(row.at(0)));
    }
}

void PgSchemaIntrospector::load_enums(SchemaSnapshot& snap) {
    const auto res = query("enum labels",
        "SELECT t.typname, e.enumlabel "
        "FROM pg_type t "
        "JOIN pg_enum e ON t.oid = e.enumtypid "
        "ORDER BY t.typname, e.enumsortorder");

    for (const auto& row : res.rows) {
        snap.enums[utils::to_lower(cell_or_empty(row.at(0)))].push_back(cell_or_empty(row.at(1)));
    }
}

void PgSchemaIntrospector::load_columns(SchemaSnapshot& snap) {
    const auto res = query("columns", std::format(
        "SELECT table_name, column_name, data_type, udt_name, is_nullable, "
        "       character_maximum_length, numeric_precision, numeric_scale "
        "FROM information_schema.columns "
        "WHERE table_schema = {} "
        "ORDER BY table_name, ordinal_position",
        pg::quote_literal(snap.schema)));

    // Column indices in the result set (matching the SELECT order)
    static constexpr size_t COL_TABLE     = 0;
    static constexpr size_t COL_COLUMN    = 1;
    static constexpr size_t COL_DATA_TYPE = 2;
    static constexpr size_t COL_UDT       = 3;
    static constexpr size_t COL_NULLABLE  = 4;
    static constexpr size_t COL_MAX_LEN   = 5;
    static constexpr size_t COL_PRECISION = 6;
    static constexpr size_t COL_SCALE     = 7;

    for (const auto& row : res.rows) {
        Column col;
        col.table = cell_or_empty(row.at(COL_TABLE));
        col.name = cell_or_empty(row.at(COL_COLUMN));
        col.data_type = cell_or_empty(row.at(COL_DATA_TYPE));
        col.udt_name = cell_or_empty(row.at(COL_UDT));
        col.nullable = cell_or_empty(row.at(COL_NULLABLE)) == "YES";
        col.max_length = cell_to_int(row.at(COL_MAX_LEN));
        col.numeric_precision = cell_to_int(row.at(COL_PRECISION));
        col.numeric_scale = cell_to_int(row.at(COL_SCALE));
        col.family = PgTypeMap::classify(col.data_type, col.udt_name, snap.enums);
        col.integer_bytes = PgTypeMap::integer_bytes(col.udt_name);
        if (col.family == TypeFamily::ENUM) {
            col.enum_type = utils::to_lower(col.udt_name);
        } else if (col.family == TypeFamily::OTHER) {
            utils::log::debug(std::format("{}.{}: type {} maps to {}, no values synthesized",
                col.table, col.name, col.udt_name, type_family_to_string(col.family)));
        }

        snap.columns[utils::to_lower(col.table)].push_back(std::move(col));
    }
}

void PgSchemaIntrospector::load_primary_keys(SchemaSnapshot& snap) {
    const auto res = query("primary keys", std::format(
        "SELECT tc.table_name, kcu.column_name "
        "FROM information_schema.table_constraints tc "
        "JOIN information_schema.key_column_usage kcu "
        "  ON tc.constraint_name = kcu.constraint_name "
        " AND tc.table_schema = kcu.table_schema "
        "WHERE tc.table_schema = {} AND tc.constraint_type = 'PRIMARY KEY' "
        "ORDER BY tc.table_name, kcu.ordinal_position",
        pg::quote_literal(snap.schema)));

    for (const auto& row : res.rows) {
        const std::string& table = cell_or_empty(row.at(0));
        auto& pk = snap.primary_keys[utils::to_lower(table)];
        pk.table = table;
        pk.columns.push_back(cell_or_empty(row.at(1)));
    }
}

void PgSchemaIntrospector::load_foreign_keys(SchemaSnapshot& snap) {
    const auto res = query("foreign keys", std::format(
        "SELECT tc.table_name, kcu.column_name, "
        "       ccu.table_name AS ref_table_name, ccu.column_name AS ref_column_name "
        "FROM information_schema.table_constraints tc "
        "JOIN information_schema.key_column_usage kcu "
        "  ON tc.constraint_name = kcu.constraint_name "
        " AND tc.table_schema = kcu.table_schema "
        "JOIN information_schema.constraint_column_usage ccu "
        "  ON ccu.constraint_name = tc.constraint_name "
        " AND ccu.table_schema = tc.table_schema "
        "WHERE tc.table_schema = {} AND tc.constraint_type = 'FOREIGN KEY' "
        "ORDER BY tc.table_name, kcu.column_name",
        pg::quote_literal(snap.schema)));

    snap.foreign_keys.reserve(res.rows.size());
    for (const auto& row : res.rows) {
        snap.foreign_keys.push_back(ForeignKey{
            cell_or_empty(row.at(0)), cell_or_empty(row.at(1)),
            cell_or_empty(row.at(2)), cell_or_empty(row.at(3))});
    }
}

void PgSchemaIntrospector::load_unique_columns(SchemaSnapshot& snap) {
    // Composite UNIQUE constraints are left to bespoke assemblers
    const auto res = query("unique constraints", std::format(
        "WITH uniq AS ("
        "  SELECT tc.table_schema, tc.table_name, tc.constraint_name, "
        "         COUNT(kcu.column_name) AS col_count "
        "  FROM information_schema.table_constraints tc "
        "  JOIN information_schema.key_column_usage kcu "
        "    ON tc.constraint_name = kcu.constraint_name "
        "   AND tc.table_schema = kcu.table_schema "
        "  WHERE tc.table_schema = {} AND tc.constraint_type = 'UNIQUE' "
        "  GROUP BY 1, 2, 3"
        ") "
        "SELECT kcu.table_name, kcu.column_name "
        "FROM uniq "
        "JOIN information_schema.key_column_usage kcu "
        "  ON uniq.constraint_name = kcu.constraint_name "
        " AND uniq.table_schema = kcu.table_schema "
        "WHERE uniq.col_count = 1",
        pg::quote_literal(snap.schema)));

    for (const auto& row : res.rows) {
        snap.unique_columns[utils::to_lower(cell_or_empty(row.at(0)))]
            .insert(cell_or_empty(row.at(1)));
    }
}

} // namespace seedgen
