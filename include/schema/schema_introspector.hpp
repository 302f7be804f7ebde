#pragma once

#include "core/types.hpp"
#include <string>

namespace seedgen {

/**
 * @brief Abstract schema introspector
 *
 * Each backend reads its own catalog (information_schema + pg_catalog
 * for PostgreSQL) and produces a SchemaSnapshot.
 */
class ISchemaIntrospector {
public:
    virtual ~ISchemaIntrospector() = default;

    /**
     * @brief Read tables, columns, keys, enums and unique constraints
     * @param schema Schema name (e.g. "public")
     * @return Populated snapshot; table keys are lowercased
     * @throws SeedError(SCHEMA_ERROR) when any catalog query fails
     */
    [[nodiscard]] virtual SchemaSnapshot introspect(const std::string& schema) = 0;
};

} // namespace seedgen
