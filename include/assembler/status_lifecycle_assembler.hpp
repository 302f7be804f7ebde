#pragma once

#include "assembler/assembler_rules.hpp"
#include "assembler/itable_assembler.hpp"
#include <string>

namespace seedgen {

/**
 * @brief Lifecycle timestamps driven by a status label
 *
 * Samples a status per row and sets the check-in / check-out pair to
 * match it:
 *   cancelled               both NULL
 *   completed, checked-out  check-in, then check-out 1..10 days,
 *                           0..6 hours and 0..59 minutes later
 *   in progress, checked-in check-in only
 *   anything else           both NULL
 */
class StatusLifecycleAssembler : public ITableAssembler {
public:
    enum class Phase { CANCELLED, COMPLETED, IN_PROGRESS, OTHER };

    explicit StatusLifecycleAssembler(StatusLifecycleRule rule) : rule_(std::move(rule)) {}

    [[nodiscard]] GeneratedTable assemble(const TableSpec& spec, size_t row_count,
                                          GenerationContext& ctx) override;

    [[nodiscard]] std::string name() const override { return "status_lifecycle"; }

    /**
     * @brief Classify a status label by its words (case-insensitive)
     *
     * CANCEL* is cancelled; a word OUT, CHECKOUT or COMPLETED means
     * completed; a word IN or CHECKIN (so IN_PROGRESS, CHECKED_IN) means
     * in progress. PENDING has no such word and is OTHER.
     */
    [[nodiscard]] static Phase classify(const std::string& label);

    [[nodiscard]] const StatusLifecycleRule& rule() const { return rule_; }

private:
    StatusLifecycleRule rule_;
};

} // namespace seedgen
