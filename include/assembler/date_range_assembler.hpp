#pragma once

#include "assembler/assembler_rules.hpp"
#include "assembler/itable_assembler.hpp"

namespace seedgen {

/**
 * @brief Per-parent calendar rows with UNIQUE(parent, date)
 *
 * Each parent key receives row_count / |P| rows, the remainder going one
 * extra row to the first parents of a shuffled order. A parent's dates
 * are distinct offsets sampled without replacement from the window
 * [anchor + window_start_days, anchor + window_end_days].
 */
class DateRangeAssembler : public ITableAssembler {
public:
    explicit DateRangeAssembler(DateRangeRule rule) : rule_(std::move(rule)) {}

    [[nodiscard]] GeneratedTable assemble(const TableSpec& spec, size_t row_count,
                                          GenerationContext& ctx) override;

    [[nodiscard]] std::string name() const override { return "date_range"; }

    [[nodiscard]] const DateRangeRule& rule() const { return rule_; }

private:
    DateRangeRule rule_;
};

} // namespace seedgen
