#include "generator/value_synthesizer.hpp"
#include "generator/value_pools.hpp"
#include "core/calendar.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <initializer_list>
#include <string_view>

namespace seedgen {

namespace {

constexpr int64_t kDaySeconds = 24 * 3600;
constexpr size_t kDefaultTextLength = 255;
constexpr int kDefaultNumericScale = 2;

bool name_is(const std::string& name, std::initializer_list<std::string_view> options) {
    return std::any_of(options.begin(), options.end(),
        [&name](std::string_view opt) { return name == opt; });
}

bool name_has(const std::string& name, std::initializer_list<std::string_view> fragments) {
    return std::any_of(fragments.begin(), fragments.end(),
        [&name](std::string_view frag) { return utils::contains(name, frag); });
}

size_t text_limit(const Column& column) {
    return column.max_length && *column.max_length > 0
        ? static_cast<size_t>(*column.max_length) : kDefaultTextLength;
}

std::string title_case(std::string_view word) {
    std::string out(word);
    if (!out.empty()) {
        out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    }
    return out;
}

} // anonymous namespace

std::string format_numeric(double value, int scale) {
    return std::format("{:.{}f}", value, std::max(scale, 0));
}

int numeric_scale_of(const Column& column) {
    return column.numeric_scale.value_or(kDefaultNumericScale);
}

std::optional<int64_t> numeric_max_units(const Column& column) {
    constexpr int kMaxInt64Digits = 18;
    if (!column.numeric_precision || *column.numeric_precision <= 0 ||
        *column.numeric_precision > kMaxInt64Digits) {
        return std::nullopt;
    }
    int64_t units = 1;
    for (int i = 0; i < *column.numeric_precision; ++i) units *= 10;
    return units - 1;
}

// ============================================================================
// Dispatch
// ============================================================================

Cell ValueSynthesizer::synthesize(const Column& column, int64_t row_ordinal, GenerationContext& ctx) const {
    const std::string name = utils::to_lower(column.name);

    if (column.family == TypeFamily::ENUM) {
        return enum_value(column, ctx);
    }

    const bool temporal = column.family == TypeFamily::DATE || column.family == TypeFamily::TIMESTAMP;
    if (temporal && name_is(name, {"created_at", "updated_at", "loaded_at", "ingested_at"})) {
        return audit_timestamp(column, name, row_ordinal, ctx);
    }

    switch (column.family) {
        case TypeFamily::DATE: {
            const auto offset = std::chrono::days{ctx.uniform_int(-730, 365)};
            return calendar::format_date(ctx.anchor_date() + offset);
        }
        case TypeFamily::TIMESTAMP: {
            const auto offset = std::chrono::seconds{ctx.uniform_int(0, 730 * kDaySeconds)};
            return calendar::format_timestamp(ctx.now() - offset);
        }
        case TypeFamily::INTEGER:
            return integer_value(column, name, row_ordinal, ctx);
        case TypeFamily::UUID:
            return utils::generate_uuid(ctx.rng());
        case TypeFamily::BOOLEAN:
            return boolean_value(name, ctx);
        case TypeFamily::NUMERIC:
            return numeric_value(column, name, ctx);
        case TypeFamily::TEXT:
            return text_value(column, name, row_ordinal, ctx);
        default:
            return std::nullopt;
    }
}

// ============================================================================
// Per-family generators
// ============================================================================

Cell ValueSynthesizer::enum_value(const Column& column, GenerationContext& ctx) const {
    if (!column.enum_type) return std::nullopt;
    const auto& labels = ctx.enum_labels(*column.enum_type);
    if (labels.empty()) return std::nullopt;

    if (column.nullable && ctx.chance(ctx.config().enum_null_probability)) {
        return std::nullopt;
    }
    return ctx.pick(labels);
}

Cell ValueSynthesizer::audit_timestamp(const Column& column, const std::string& name,
                                       int64_t row_ordinal, GenerationContext& ctx) const {
    calendar::Timestamp ts;
    if (name == "created_at") {
        ts = ctx.row_created_at(column.table, row_ordinal);
    } else if (name == "updated_at") {
        ts = ctx.row_created_at(column.table, row_ordinal) +
             std::chrono::days{ctx.uniform_int(0, 180)};
    } else {
        ts = ctx.now() - std::chrono::seconds{ctx.uniform_int(0, 730 * kDaySeconds)};
    }

    if (column.family == TypeFamily::DATE) {
        return calendar::format_date(std::chrono::floor<std::chrono::days>(ts));
    }
    return calendar::format_timestamp(ts);
}

std::string ValueSynthesizer::integer_value(const Column& column, const std::string& name,
                                            int64_t row_ordinal, GenerationContext& ctx) const {
    int64_t value;
    if (name == "id" || utils::ends_with(name, "_id")) {
        value = row_ordinal;
    } else if (name_has(name, {"rating", "stars", "score"})) {
        value = ctx.uniform_int(1, 5);
    } else if (name_has(name, {"count", "qty", "quantity", "nights", "floor", "occupancy"})) {
        value = ctx.uniform_int(1, 10);
    } else {
        value = ctx.uniform_int(1, std::min<int64_t>(100000, integer_max_for(column.integer_bytes)));
    }
    return std::to_string(std::min(value, integer_max_for(column.integer_bytes)));
}

std::string ValueSynthesizer::boolean_value(const std::string& name, GenerationContext& ctx) const {
    const bool flag_like = name.starts_with("is_") || utils::ends_with(name, "_flag");
    return utils::booltostr(ctx.chance(flag_like ? 0.85 : 0.5));
}

std::string ValueSynthesizer::numeric_value(const Column& column, const std::string& name,
                                            GenerationContext& ctx) const {
    const int scale = numeric_scale_of(column);
    const std::string table = utils::to_lower(column.table);

    double lo = 0.0;
    double hi = 1000.0;
    if (utils::contains(name, "percent") || utils::ends_with(name, "_pct")) {
        hi = 100.0;
    } else if (name_has(name, {"ratio", "fraction"})) {
        hi = 1.0;
    } else if (table == "promotion" &&
               name_is(name, {"value", "discount_value", "discount_amount", "discount"})) {
        lo = 5.0;
        hi = 50.0;
    } else if (name_has(name, {"amount", "price", "rate", "cost", "fee", "total", "tax"})) {
        lo = 20.0;
        hi = 2000.0;
    }

    // numeric(p, s) holds at most (10^p - 1) * 10^-s; narrow the range before drawing
    if (const auto units = numeric_max_units(column)) {
        const double limit = static_cast<double>(*units) * std::pow(10.0, -scale);
        hi = std::min(hi, limit);
        lo = std::min(lo, hi);
    }
    return format_numeric(ctx.uniform_real(lo, hi), scale);
}

std::string ValueSynthesizer::text_value(const Column& column, const std::string& name,
                                         int64_t row_ordinal, GenerationContext& ctx) const {
    const size_t max_len = text_limit(column);
    const std::string table = utils::to_lower(column.table);

    // Location fields stay consistent within a row
    if (name_is(name, {"city", "state", "country", "postal_code", "zipcode", "zip",
                       "address_line1", "address_line2", "street", "street1", "street2"}) ||
        utils::contains(name, "timezone")) {
        const Location& loc = ctx.location_for(column.table, row_ordinal);
        std::string value;
        if (utils::contains(name, "timezone")) value = loc.timezone;
        else if (name == "city") value = loc.city;
        else if (name == "state") value = loc.state;
        else if (name == "country") value = loc.country;
        else if (name_is(name, {"postal_code", "zipcode", "zip"})) value = loc.postal_code;
        else if (name_is(name, {"address_line1", "street", "street1"})) value = loc.street1;
        else value = loc.street2.value_or("");
        return utils::truncate(std::move(value), max_len);
    }

    if (table == "hotel" && name_is(name, {"name", "hotel_name"})) {
        const Location& loc = ctx.location_for(column.table, row_ordinal);
        const auto brand = ctx.pick(pools::kHotelBrands);
        const auto suffix = ctx.pick(pools::kHotelSuffixes);
        return utils::truncate(std::format("{} {} {}", brand, loc.city, suffix), max_len);
    }

    if (table == "room_type" && name_is(name, {"name", "room_type_name"})) {
        return utils::truncate(
            ctx.next_from_unique_pool(column.table, column.name, pools::kRoomTypeNames), max_len);
    }

    if (name_is(name, {"phone", "phone_number"})) {
        const Location& loc = ctx.location_for(column.table, row_ordinal);
        std::string phone = loc.country == "IN"
            ? std::format("+91-{}{:09d}", ctx.uniform_int(6, 9), ctx.uniform_int(0, 999999999))
            : std::format("+1-{:03d}-{:03d}-{:04d}", ctx.uniform_int(201, 989),
                          ctx.uniform_int(200, 999), ctx.uniform_int(0, 9999));
        return utils::truncate(std::move(phone), max_len);
    }

    if (name_is(name, {"currency", "currency_code"})) {
        return utils::truncate(std::string(ctx.pick(pools::kCurrencies)), max_len);
    }

    if (name_is(name, {"state_code", "state_abbr"})) {
        return utils::truncate(ctx.location_for(column.table, row_ordinal).state, max_len);
    }

    if (name == "email") {
        return unique_email(column, ctx);
    }

    if (utils::ends_with(name, "_name") || name_is(name, {"name", "code"})) {
        return unique_token(column, ctx);
    }

    if (max_len <= 20) {
        return utils::truncate(std::string(ctx.pick(pools::kWords)), max_len);
    }
    return utils::truncate(sentence(max_len <= 80 ? 6 : 10, ctx), max_len);
}

// ============================================================================
// Text helpers
// ============================================================================

std::string ValueSynthesizer::unique_email(const Column& column, GenerationContext& ctx) const {
    const size_t max_len = text_limit(column);

    const size_t budget = ctx.config().unique_derive_budget;
    for (size_t attempt = 0; attempt < budget; ++attempt) {
        std::string candidate = utils::truncate(std::format("{}.{}{}@{}",
            ctx.pick(pools::kWords), ctx.pick(pools::kWords),
            ctx.uniform_int(1, 99999), ctx.pick(pools::kEmailDomains)), max_len);
        if (ctx.claim_unique(column.table, column.name, candidate, "synth")) {
            return candidate;
        }
    }
    throw SeedError(ErrorCategory::GENERATION_ERROR,
        std::format("No unused email left for {}.{} after {} attempts", column.table, column.name, budget));
}

std::string ValueSynthesizer::unique_token(const Column& column, GenerationContext& ctx) const {
    const size_t max_len = text_limit(column);

    const size_t budget = ctx.config().unique_derive_budget;
    for (size_t attempt = 0; attempt < budget; ++attempt) {
        std::string candidate = utils::truncate(std::format("{}_{}",
            title_case(ctx.pick(pools::kWords)), utils::random_hex(ctx.rng(), 6)), max_len);
        if (ctx.claim_unique(column.table, column.name, candidate, "synth")) {
            return candidate;
        }
    }
    throw SeedError(ErrorCategory::GENERATION_ERROR,
        std::format("No unused token left for {}.{} after {} attempts", column.table, column.name, budget));
}

std::string ValueSynthesizer::sentence(size_t words, GenerationContext& ctx) const {
    std::string out;
    for (size_t i = 0; i < words; ++i) {
        if (i > 0) out += ' ';
        out += i == 0 ? title_case(ctx.pick(pools::kWords)) : std::string(ctx.pick(pools::kWords));
    }
    out += '.';
    return out;
}

} // namespace seedgen
