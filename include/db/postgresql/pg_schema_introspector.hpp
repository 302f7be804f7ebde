#pragma once

#include "db/idb_connection.hpp"
#include "schema/schema_introspector.hpp"

namespace seedgen {

/**
 * @brief PostgreSQL schema introspector
 *
 * Runs five catalog queries over an existing connection: base tables,
 * columns, primary keys, foreign keys and single-column UNIQUE
 * constraints, plus pg_enum for enum labels. The connection is borrowed
 * and must outlive the introspector.
 */
class PgSchemaIntrospector : public ISchemaIntrospector {
public:
    explicit PgSchemaIntrospector(IDbConnection& conn) : conn_(conn) {}
    ~PgSchemaIntrospector() override = default;

    [[nodiscard]] SchemaSnapshot introspect(const std::string& schema) override;

private:
    DbResultSet query(const std::string& what, const std::string& sql);

    void load_tables(SchemaSnapshot& snap);
    void load_enums(SchemaSnapshot& snap);
    void load_columns(SchemaSnapshot& snap);
    void load_primary_keys(SchemaSnapshot& snap);
    void load_foreign_keys(SchemaSnapshot& snap);
    void load_unique_columns(SchemaSnapshot& snap);

    IDbConnection& conn_;
};

} // namespace seedgen
