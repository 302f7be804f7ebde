#pragma once

#include "core/calendar.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>

namespace seedgen::temporal {

// DATE columns get YYYY-MM-DD, everything else a full timestamp
[[nodiscard]] inline std::string format_for(const Column& column, calendar::Timestamp ts) {
    if (column.family == TypeFamily::DATE) {
        return calendar::format_date(std::chrono::floor<std::chrono::days>(ts));
    }
    return calendar::format_timestamp(ts);
}

[[nodiscard]] inline std::optional<calendar::Timestamp> parse(const std::string& value) {
    if (auto ts = calendar::parse_timestamp(value)) return ts;
    if (auto d = calendar::parse_date(value)) return calendar::Timestamp{*d};
    return std::nullopt;
}

/**
 * @brief Force end = start + 1 day when both are set and end < start
 * @return true if the row was changed
 */
inline bool repair_pair(Row& row, size_t start_idx, size_t end_idx, const Column& end_column) {
    if (!row[start_idx] || !row[end_idx]) return false;

    const auto start = parse(*row[start_idx]);
    const auto end = parse(*row[end_idx]);
    if (!start || !end || *end >= *start) return false;

    row[end_idx] = format_for(end_column, *start + std::chrono::days{1});
    return true;
}

} // namespace seedgen::temporal
