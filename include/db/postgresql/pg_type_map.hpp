#pragma once

#include "core/column_type.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <string>

namespace seedgen {

/**
 * @brief PostgreSQL type mapping utilities
 *
 * Maps information_schema (data_type, udt_name) pairs to TypeFamily.
 */
class PgTypeMap {
public:
    /**
     * @brief Classify a column type
     * @param data_type information_schema.columns.data_type (any case)
     * @param udt_name information_schema.columns.udt_name (any case)
     * @param enums Enum catalog; a udt_name found here is an ENUM column
     */
    [[nodiscard]] static TypeFamily classify(const std::string& data_type,
                                             const std::string& udt_name,
                                             const EnumCatalog& enums);

    /**
     * @brief Storage width of an integer type (2, 4 or 8), 0 if not an integer
     */
    [[nodiscard]] static uint8_t integer_bytes(const std::string& udt_name);
};

} // namespace seedgen
