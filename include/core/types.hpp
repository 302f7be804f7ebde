#pragma once

#include "core/column_type.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace seedgen {

// ============================================================================
// Schema Metadata (immutable once introspected)
// ============================================================================

struct Column {
    std::string table;              // Table name as stored in the catalog
    std::string name;               // Column name as stored in the catalog
    std::string data_type;          // information_schema data_type ("integer", "USER-DEFINED", ...)
    std::string udt_name;           // Underlying type name ("int4", "booking_status", ...)
    TypeFamily family;
    uint8_t integer_bytes;          // 2/4/8 for INTEGER columns, 0 otherwise
    bool nullable;
    std::optional<int> max_length;          // character_maximum_length
    std::optional<int> numeric_precision;
    std::optional<int> numeric_scale;
    std::optional<std::string> enum_type;   // Lowercased enum type name

    Column() : family(TypeFamily::OTHER), integer_bytes(0), nullable(true) {}
    Column(std::string t, std::string n, TypeFamily f, bool is_nullable = true)
        : table(std::move(t)), name(std::move(n)), family(f),
          integer_bytes(f == TypeFamily::INTEGER ? 4 : 0), nullable(is_nullable) {}
};

struct PrimaryKey {
    std::string table;
    std::vector<std::string> columns;   // Ordered by key position

    [[nodiscard]] bool is_single_column() const { return columns.size() == 1; }
};

struct ForeignKey {
    std::string table;
    std::string column;
    std::string ref_table;
    std::string ref_column;
};

// Enum type name (lowercased) -> labels in declaration order
using EnumCatalog = std::unordered_map<std::string, std::vector<std::string>>;

/**
 * @brief Everything the generator knows about one schema
 *
 * All maps are keyed by the lowercased table name so that lookups are
 * case-insensitive over table identity. `tables` keeps catalog spelling
 * because that is what has to be quoted in SQL.
 */
struct SchemaSnapshot {
    std::string schema;
    std::vector<std::string> tables;
    std::unordered_map<std::string, std::vector<Column>> columns;
    std::unordered_map<std::string, PrimaryKey> primary_keys;
    std::vector<ForeignKey> foreign_keys;
    EnumCatalog enums;
    std::unordered_map<std::string, std::unordered_set<std::string>> unique_columns;

    [[nodiscard]] const std::vector<Column>& columns_of(const std::string& table) const;
    [[nodiscard]] const PrimaryKey* primary_key_of(const std::string& table) const;
    [[nodiscard]] const std::unordered_set<std::string>& unique_columns_of(const std::string& table) const;
    [[nodiscard]] std::vector<ForeignKey> foreign_keys_of(const std::string& table) const;
};

// ============================================================================
// Generated Data
// ============================================================================

// Absent = SQL NULL
using Cell = std::optional<std::string>;
using Row = std::vector<Cell>;

struct GeneratedTable {
    std::string table;
    std::vector<std::string> column_names;
    std::vector<Row> rows;

    [[nodiscard]] std::optional<size_t> column_position(const std::string& column) const {
        for (size_t i = 0; i < column_names.size(); ++i) {
            if (column_names[i] == column) return i;
        }
        return std::nullopt;
    }
};

} // namespace seedgen
