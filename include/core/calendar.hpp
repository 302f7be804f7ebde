#pragma once

#include "core/utils.hpp"
#include <chrono>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace seedgen::calendar {

using Date = std::chrono::sys_days;
using Timestamp = std::chrono::sys_seconds;

[[nodiscard]] inline Date today() {
    return std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
}

[[nodiscard]] inline Timestamp now() {
    return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
}

// YYYY-MM-DD
[[nodiscard]] inline std::string format_date(Date d) {
    const std::chrono::year_month_day ymd{d};
    return std::format("{:04d}-{:02d}-{:02d}",
        static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()));
}

// YYYY-MM-DD HH:MM:SS+00 (UTC, accepted by both timestamp and timestamptz)
[[nodiscard]] inline std::string format_timestamp(Timestamp ts) {
    const auto day = std::chrono::floor<std::chrono::days>(ts);
    const std::chrono::hh_mm_ss hms{ts - day};
    return std::format("{} {:02d}:{:02d}:{:02d}+00",
        format_date(day),
        static_cast<int>(hms.hours().count()),
        static_cast<int>(hms.minutes().count()),
        static_cast<int>(hms.seconds().count()));
}

[[nodiscard]] inline std::optional<Date> parse_date(std::string_view s) {
    if (s.size() < 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
    const auto y = utils::try_parse_int<int>(s.substr(0, 4));
    const auto m = utils::try_parse_int<unsigned>(s.substr(5, 2));
    const auto d = utils::try_parse_int<unsigned>(s.substr(8, 2));
    if (!y || !m || !d) return std::nullopt;

    const std::chrono::year_month_day ymd{
        std::chrono::year{*y}, std::chrono::month{*m}, std::chrono::day{*d}};
    if (!ymd.ok()) return std::nullopt;
    return Date{ymd};
}

/**
 * @brief Parse the output of format_timestamp (offset suffix is ignored)
 */
[[nodiscard]] inline std::optional<Timestamp> parse_timestamp(std::string_view s) {
    const auto date = parse_date(s);
    if (!date) return std::nullopt;
    if (s.size() < 19 || (s[10] != ' ' && s[10] != 'T') || s[13] != ':' || s[16] != ':') {
        return std::nullopt;
    }
    const auto hh = utils::try_parse_int<int>(s.substr(11, 2));
    const auto mm = utils::try_parse_int<int>(s.substr(14, 2));
    const auto ss = utils::try_parse_int<int>(s.substr(17, 2));
    if (!hh || !mm || !ss) return std::nullopt;

    return Timestamp{*date} + std::chrono::hours{*hh} +
           std::chrono::minutes{*mm} + std::chrono::seconds{*ss};
}

} // namespace seedgen::calendar
