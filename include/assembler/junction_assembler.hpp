#pragma once

#include "assembler/assembler_rules.hpp"
#include "assembler/itable_assembler.hpp"

namespace seedgen {

/**
 * @brief Association table with a composite UNIQUE(left, right) key
 *
 * Both columns must be foreign keys; their parents' key pools span the
 * space of |A| x |B| pairs. Rows are produced by a random fan-out (each
 * shuffled left key tries fanout_min..fanout_max random right keys,
 * skipping pairs already taken) and, if that stalls, a deterministic
 * sweep of the remaining product.
 */
class JunctionAssembler : public ITableAssembler {
public:
    explicit JunctionAssembler(JunctionRule rule) : rule_(std::move(rule)) {}

    [[nodiscard]] GeneratedTable assemble(const TableSpec& spec, size_t row_count,
                                          GenerationContext& ctx) override;

    [[nodiscard]] std::string name() const override { return "junction"; }

    [[nodiscard]] const JunctionRule& rule() const { return rule_; }

private:
    JunctionRule rule_;
};

} // namespace seedgen
