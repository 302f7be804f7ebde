#pragma once

#include "core/types.hpp"
#include "generator/generation_context.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace seedgen {

/**
 * @brief Retry-then-derive repair for single-column UNIQUE columns
 *
 * A candidate is accepted once it is claimed in the context's
 * (table, column) registry. On a collision the value is first regenerated
 * with shifted ordinals (`ordinal + attempt`, up to unique_retry_budget
 * times), then derived from the colliding value (up to
 * unique_derive_budget times):
 *
 *   integer    value + ordinal * 1000 + attempt
 *   numeric    value + (ordinal * 1000 + attempt) units of the last decimal
 *   text       prefix cut to max_length - 7, then "_" and 6 hex chars
 *   date       shifted by `attempt` days
 *   timestamp  shifted by `attempt` seconds
 *   uuid       fresh random UUID
 *
 * Boolean and enum columns cannot be derived: once every label is taken
 * the column's domain is exhausted and a CAPACITY_ERROR is raised.
 * NULL never collides.
 */
class UniquenessStrategy {
public:
    using Regenerate = std::function<Cell(int64_t row_ordinal)>;

    explicit UniquenessStrategy(GenerationContext& ctx) : ctx_(ctx) {}

    /**
     * @brief Return a value for `column` not yet used in this run
     * @throws SeedError CAPACITY_ERROR (boolean/enum exhausted) or
     *         GENERATION_ERROR (derive budget exhausted)
     */
    [[nodiscard]] Cell enforce(const Column& column, Cell value, int64_t row_ordinal,
                               const Regenerate& regenerate);

    /**
     * @brief Derived variant of `value`, or nullopt for non-derivable families
     */
    [[nodiscard]] static std::optional<std::string> derive(const Column& column, const std::string& value,
                                                           int64_t row_ordinal, size_t attempt,
                                                           GenerationContext& ctx);

private:
    [[nodiscard]] Cell claim_from_domain(const Column& column, int64_t row_ordinal);

    GenerationContext& ctx_;
};

} // namespace seedgen
