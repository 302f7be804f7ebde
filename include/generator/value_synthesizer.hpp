#pragma once

#include "core/types.hpp"
#include "generator/generation_context.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace seedgen {

/**
 * @brief Produces one plausible value for a column
 *
 * Decisions are driven by the column's type family and its name, in a
 * fixed order: enum, audit timestamps, dates, timestamps, integers, UUIDs,
 * booleans, numerics, text. Anything else yields NULL and is left to the
 * assembler's sentinel.
 *
 * Stateless: all randomness and registries live in the GenerationContext.
 * Values are rendered in PostgreSQL's CSV input format.
 */
class ValueSynthesizer {
public:
    [[nodiscard]] Cell synthesize(const Column& column, int64_t row_ordinal, GenerationContext& ctx) const;

private:
    [[nodiscard]] Cell enum_value(const Column& column, GenerationContext& ctx) const;
    [[nodiscard]] Cell audit_timestamp(const Column& column, const std::string& name,
                                       int64_t row_ordinal, GenerationContext& ctx) const;
    [[nodiscard]] std::string integer_value(const Column& column, const std::string& name,
                                            int64_t row_ordinal, GenerationContext& ctx) const;
    [[nodiscard]] std::string boolean_value(const std::string& name, GenerationContext& ctx) const;
    [[nodiscard]] std::string numeric_value(const Column& column, const std::string& name,
                                            GenerationContext& ctx) const;
    [[nodiscard]] std::string text_value(const Column& column, const std::string& name,
                                         int64_t row_ordinal, GenerationContext& ctx) const;

    [[nodiscard]] std::string unique_email(const Column& column, GenerationContext& ctx) const;
    [[nodiscard]] std::string unique_token(const Column& column, GenerationContext& ctx) const;
    [[nodiscard]] std::string sentence(size_t words, GenerationContext& ctx) const;
};

// Fixed-point rendering with exactly `scale` decimals
[[nodiscard]] std::string format_numeric(double value, int scale);

// Declared scale of a numeric column, 2 when unconstrained
[[nodiscard]] int numeric_scale_of(const Column& column);

/**
 * @brief Largest value of numeric(p, s) in units of 10^-s, i.e. 10^p - 1
 *
 * nullopt when the precision is undeclared or too wide for int64.
 */
[[nodiscard]] std::optional<int64_t> numeric_max_units(const Column& column);

} // namespace seedgen
