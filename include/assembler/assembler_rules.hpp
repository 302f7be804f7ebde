#pragma once

#include <string>
#include <vector>

namespace seedgen {

// Column fields list candidate names; the first one present in the table is used.

/**
 * @brief Association table with UNIQUE(left, right)
 */
struct JunctionRule {
    std::string table;
    std::vector<std::string> left_columns;
    std::vector<std::string> right_columns;
    int fanout_min = 1;     // Right keys tried per left key
    int fanout_max = 3;
};

/**
 * @brief Per-parent calendar table with UNIQUE(parent, date)
 */
struct DateRangeRule {
    std::string table;
    std::vector<std::string> parent_columns;
    std::vector<std::string> date_columns;
    int window_start_days = -730;   // Relative to the anchor date, inclusive
    int window_end_days = 365;
};

/**
 * @brief Status-driven pair of lifecycle timestamps
 */
struct StatusLifecycleRule {
    std::string table;
    std::vector<std::string> status_columns;
    std::vector<std::string> checkin_columns;
    std::vector<std::string> checkout_columns;
    int checkin_window_days = 180;  // Check-in drawn from [now - window, now]
};

struct AssemblerRules {
    std::vector<JunctionRule> junction;
    std::vector<DateRangeRule> date_range;
    std::vector<StatusLifecycleRule> status_lifecycle;
};

} // namespace seedgen
