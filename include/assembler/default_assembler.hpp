#pragma once

#include "assembler/itable_assembler.hpp"
#include <string>
#include <vector>

namespace seedgen {

/**
 * @brief Generic assembler: RowFiller plus start/end date coherence
 *
 * Looks for known start/end column pairs. For each pair present, the
 * start is drawn relative to the anchor date and the end is start plus a
 * positive span, so end >= start by construction. A repair pass after
 * filling forces end = start + 1 day on any inverted pair.
 */
class DefaultAssembler : public ITableAssembler {
public:
    struct DatePairRule {
        std::vector<std::string> start_columns;
        std::vector<std::string> end_columns;
        int start_min_days;
        int start_max_days;
        int span_min_days;
        int span_max_days;
    };

    DefaultAssembler();
    explicit DefaultAssembler(std::vector<DatePairRule> rules);

    [[nodiscard]] GeneratedTable assemble(const TableSpec& spec, size_t row_count,
                                          GenerationContext& ctx) override;

    [[nodiscard]] std::string name() const override { return "default"; }

    [[nodiscard]] static std::vector<DatePairRule> default_rules();

private:
    std::vector<DatePairRule> rules_;
};

} // namespace seedgen
