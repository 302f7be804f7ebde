#pragma once

#include <string>
#include <vector>

namespace seedgen::pg {

// "name" with embedded double quotes doubled
[[nodiscard]] inline std::string quote_identifier(const std::string& name) {
    std::string out;
    out.reserve(name.size() + 2);
    out += '"';
    for (const char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

// 'value' with embedded single quotes doubled
[[nodiscard]] inline std::string quote_literal(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out += '\'';
    for (const char c : value) {
        if (c == '\'') out += '\'';
        out += c;
    }
    out += '\'';
    return out;
}

// "schema"."table"
[[nodiscard]] inline std::string qualified_name(const std::string& schema, const std::string& table) {
    return quote_identifier(schema) + "." + quote_identifier(table);
}

// "a", "b", "c"
[[nodiscard]] inline std::string column_list(const std::vector<std::string>& columns) {
    std::string out;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) out += ", ";
        out += quote_identifier(columns[i]);
    }
    return out;
}

} // namespace seedgen::pg
