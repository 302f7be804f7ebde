#include "generator/uniqueness_strategy.hpp"
#include "generator/value_synthesizer.hpp"
#include "core/calendar.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <charconv>
#include <cmath>
#include <format>

namespace seedgen {

namespace {

constexpr size_t kSuffixHexLen = 6;
constexpr size_t kDefaultTextLength = 255;

std::string derive_text(const Column& column, const std::string& value, GenerationContext& ctx) {
    const size_t max_len = column.max_length && *column.max_length > 0
        ? static_cast<size_t>(*column.max_length) : kDefaultTextLength;

    // Too narrow for prefix + "_" + suffix: the whole value becomes hex
    if (max_len <= kSuffixHexLen + 1) {
        return utils::random_hex(ctx.rng(), max_len);
    }

    const size_t keep = max_len - (kSuffixHexLen + 1);
    return std::format("{}_{}", value.substr(0, keep), utils::random_hex(ctx.rng(), kSuffixHexLen));
}

std::string derive_integer(const Column& column, const std::string& value,
                           int64_t row_ordinal, size_t attempt) {
    const int64_t base = utils::try_parse_int<int64_t>(value).value_or(0);
    const int64_t max = integer_max_for(column.integer_bytes);

    int64_t derived = base + row_ordinal * 1000 + static_cast<int64_t>(attempt);
    if (derived > max || derived < 0) {
        derived = 1 + (row_ordinal * 1000 + static_cast<int64_t>(attempt)) % max;
    }
    return std::to_string(derived);
}

std::string derive_numeric(const Column& column, const std::string& value,
                           int64_t row_ordinal, size_t attempt) {
    const int scale = numeric_scale_of(column);
    double base = 0.0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), base);
    if (ec != std::errc{}) {
        base = 0.0;
    }

    // Work in units of the last decimal so the wrap below is exact
    const double step = std::pow(10.0, -scale);
    const int64_t offset = row_ordinal * 1000 + static_cast<int64_t>(attempt);
    int64_t units = std::llround(base / step) + offset;

    // Same wrap as integers, into [0, 10^p - 1] units
    if (const auto max_units = numeric_max_units(column); max_units && (units > *max_units || units < 0)) {
        units = offset % (*max_units + 1);
    }
    return format_numeric(static_cast<double>(units) * step, scale);
}

} // anonymous namespace

std::optional<std::string> UniquenessStrategy::derive(const Column& column, const std::string& value,
                                                      int64_t row_ordinal, size_t attempt,
                                                      GenerationContext& ctx) {
    switch (column.family) {
        case TypeFamily::BOOLEAN:
        case TypeFamily::ENUM:
            return std::nullopt;

        case TypeFamily::INTEGER:
            return derive_integer(column, value, row_ordinal, attempt);

        case TypeFamily::NUMERIC:
            return derive_numeric(column, value, row_ordinal, attempt);

        case TypeFamily::DATE: {
            const auto base = calendar::parse_date(value).value_or(ctx.anchor_date());
            return calendar::format_date(base + std::chrono::days{static_cast<int64_t>(attempt)});
        }

        case TypeFamily::TIMESTAMP: {
            const auto base = calendar::parse_timestamp(value).value_or(ctx.now());
            return calendar::format_timestamp(base + std::chrono::seconds{static_cast<int64_t>(attempt)});
        }

        case TypeFamily::UUID:
            return utils::generate_uuid(ctx.rng());

        default:
            return derive_text(column, value, ctx);
    }
}

Cell UniquenessStrategy::claim_from_domain(const Column& column, int64_t row_ordinal) {
    std::vector<std::string> domain;
    if (column.family == TypeFamily::BOOLEAN) {
        domain = {"true", "false"};
    } else if (column.enum_type) {
        domain = ctx_.enum_labels(*column.enum_type);
    }

    for (const auto& candidate : domain) {
        if (ctx_.claim_unique(column.table, column.name, candidate)) {
            return candidate;
        }
    }

    if (column.nullable) {
        return std::nullopt;
    }
    throw SeedError(ErrorCategory::CAPACITY_ERROR, std::format(
        "{}.{} is UNIQUE with {} distinct values; row {} needs one more (requested > available)",
        column.table, column.name, domain.size(), row_ordinal));
}

Cell UniquenessStrategy::enforce(const Column& column, Cell value, int64_t row_ordinal,
                                 const Regenerate& regenerate) {
    if (!value) return value;
    if (ctx_.claim_unique(column.table, column.name, *value)) {
        return value;
    }

    const auto& cfg = ctx_.config();

    for (size_t attempt = 1; attempt <= cfg.unique_retry_budget; ++attempt) {
        Cell candidate = regenerate(row_ordinal + static_cast<int64_t>(attempt));
        if (candidate && ctx_.claim_unique(column.table, column.name, *candidate)) {
            return candidate;
        }
    }

    if (column.family == TypeFamily::BOOLEAN || column.family == TypeFamily::ENUM) {
        return claim_from_domain(column, row_ordinal);
    }

    for (size_t attempt = 1; attempt <= cfg.unique_derive_budget; ++attempt) {
        auto derived = derive(column, *value, row_ordinal, attempt, ctx_);
        if (derived && ctx_.claim_unique(column.table, column.name, *derived)) {
            return derived;
        }
    }

    throw SeedError(ErrorCategory::GENERATION_ERROR, std::format(
        "Could not find an unused value for {}.{} at row {} after {} retries and {} derivations",
        column.table, column.name, row_ordinal, cfg.unique_retry_budget, cfg.unique_derive_budget));
}

} // namespace seedgen
