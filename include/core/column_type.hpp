#pragma once

#include <cstdint>
#include <limits>
#include <string>

namespace seedgen {

/**
 * @brief Type family a column is generated from
 *
 * Mapped from the catalog's data_type/udt_name pair by PgTypeMap.
 * OTHER columns get no synthesized value; the assembler substitutes
 * a sentinel when the column is non-nullable.
 */
enum class TypeFamily : uint8_t {
    OTHER = 0,
    INTEGER,
    NUMERIC,
    TEXT,
    BOOLEAN,
    DATE,
    TIMESTAMP,
    UUID,
    ENUM,
};

[[nodiscard]] inline const char* type_family_to_string(TypeFamily family) {
    switch (family) {
        case TypeFamily::OTHER: return "OTHER";
        case TypeFamily::INTEGER: return "INTEGER";
        case TypeFamily::NUMERIC: return "NUMERIC";
        case TypeFamily::TEXT: return "TEXT";
        case TypeFamily::BOOLEAN: return "BOOLEAN";
        case TypeFamily::DATE: return "DATE";
        case TypeFamily::TIMESTAMP: return "TIMESTAMP";
        case TypeFamily::UUID: return "UUID";
        case TypeFamily::ENUM: return "ENUM";
        default: return "OTHER";
    }
}

// Largest value of a 2/4/8-byte integer column (8 bytes when unknown)
[[nodiscard]] inline int64_t integer_max_for(uint8_t bytes) {
    switch (bytes) {
        case 2: return std::numeric_limits<int16_t>::max();
        case 4: return std::numeric_limits<int32_t>::max();
        default: return std::numeric_limits<int64_t>::max();
    }
}

} // namespace seedgen
