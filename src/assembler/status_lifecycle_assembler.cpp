#include "assembler/status_lifecycle_assembler.hpp"
#include "assembler/row_filler.hpp"
#include "assembler/temporal_rules.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>

namespace seedgen {

namespace {

std::vector<std::string> words_of(const std::string& label) {
    std::vector<std::string> words;
    std::string current;
    for (const char c : utils::to_upper(label)) {
        if (c == '_' || c == ' ' || c == '-') {
            if (!current.empty()) words.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) words.push_back(std::move(current));
    return words;
}

size_t require_column(const TableSpec& spec, const std::vector<std::string>& candidates, const char* role) {
    const auto idx = spec.find_column(candidates);
    if (!idx) {
        throw SeedError(ErrorCategory::SCHEMA_ERROR, std::format(
            "{}: missing {} column (looked for [{}])", spec.table, role, utils::join(candidates, ", ")));
    }
    return *idx;
}

} // anonymous namespace

StatusLifecycleAssembler::Phase StatusLifecycleAssembler::classify(const std::string& label) {
    const std::string upper = utils::to_upper(label);
    if (upper.starts_with("CANCEL")) {
        return Phase::CANCELLED;
    }

    const auto words = words_of(label);
    const auto has_word = [&words](std::string_view w) {
        return std::find(words.begin(), words.end(), w) != words.end();
    };

    if (has_word("OUT") || has_word("CHECKOUT") || has_word("COMPLETED")) {
        return Phase::COMPLETED;
    }
    if (has_word("IN") || has_word("CHECKIN")) {
        return Phase::IN_PROGRESS;
    }
    return Phase::OTHER;
}

GeneratedTable StatusLifecycleAssembler::assemble(const TableSpec& spec, size_t row_count, GenerationContext& ctx) {
    const size_t status_idx = require_column(spec, rule_.status_columns, "status");
    const size_t checkin_idx = require_column(spec, rule_.checkin_columns, "check-in");
    const size_t checkout_idx = require_column(spec, rule_.checkout_columns, "check-out");

    const Column& status_col = spec.columns[status_idx];
    const Column& checkin_col = spec.columns[checkin_idx];
    const Column& checkout_col = spec.columns[checkout_idx];

    const std::vector<std::string> no_labels;
    const auto& labels = status_col.enum_type ? ctx.enum_labels(*status_col.enum_type) : no_labels;
    if (labels.empty()) {
        throw SeedError(ErrorCategory::SCHEMA_ERROR, std::format(
            "{}.{} must be an enum with at least one label", spec.table, status_col.name));
    }

    spec.require_repeatable(status_idx, "status lifecycle");
    spec.require_repeatable(checkin_idx, "status lifecycle");
    spec.require_repeatable(checkout_idx, "status lifecycle");

    // Phases without a check-in (or check-out) leave that column NULL
    bool checkin_may_be_null = false;
    bool checkout_may_be_null = false;
    for (const auto& label : labels) {
        const auto phase = classify(label);
        checkin_may_be_null |= phase == Phase::CANCELLED || phase == Phase::OTHER;
        checkout_may_be_null |= phase != Phase::COMPLETED;
    }
    const auto require_nullable = [&](const Column& col, bool may_be_null) {
        if (may_be_null && !col.nullable) {
            throw SeedError(ErrorCategory::SCHEMA_ERROR, std::format(
                "{}.{} is NOT NULL, but some {} labels have no value for it",
                spec.table, col.name, status_col.name));
        }
    };
    require_nullable(checkin_col, checkin_may_be_null);
    require_nullable(checkout_col, checkout_may_be_null);

    RowFiller filler(spec, row_count, ctx,
                     {status_col.name, checkin_col.name, checkout_col.name});

    GeneratedTable out;
    out.table = spec.table;
    out.column_names = spec.column_names();
    out.rows.reserve(row_count);

    const size_t width = spec.columns.size();
    std::vector<bool> preset(width, false);
    preset[status_idx] = true;
    preset[checkin_idx] = true;
    preset[checkout_idx] = true;

    const int64_t window_seconds = static_cast<int64_t>(rule_.checkin_window_days) * 24 * 3600;

    for (size_t i = 0; i < row_count; ++i) {
        Row row(width);
        const std::string& status = ctx.pick(labels);
        row[status_idx] = status;

        const auto phase = classify(status);
        if (phase == Phase::COMPLETED || phase == Phase::IN_PROGRESS) {
            const auto checkin = ctx.now() - std::chrono::seconds{ctx.uniform_int(0, window_seconds)};
            row[checkin_idx] = temporal::format_for(checkin_col, checkin);

            if (phase == Phase::COMPLETED) {
                const auto checkout = checkin
                    + std::chrono::days{ctx.uniform_int(1, 10)}
                    + std::chrono::hours{ctx.uniform_int(0, 6)}
                    + std::chrono::minutes{ctx.uniform_int(0, 59)};
                row[checkout_idx] = temporal::format_for(checkout_col, checkout);
            }
        }

        filler.fill(row, preset, i);
        temporal::repair_pair(row, checkin_idx, checkout_idx, checkout_col);
        out.rows.push_back(std::move(row));
    }

    return out;
}

} // namespace seedgen
