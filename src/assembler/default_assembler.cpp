#include "assembler/default_assembler.hpp"
#include "assembler/row_filler.hpp"
#include "assembler/temporal_rules.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <format>

namespace seedgen {

namespace {

struct ResolvedPair {
    const DefaultAssembler::DatePairRule* rule;
    size_t start_idx;
    size_t end_idx;
    bool start_unique;
    bool end_unique;
};

// Claims both ends of a pair in the constraint registry, or neither
bool claim_pair(const TableSpec& spec, const ResolvedPair& pair, const Row& row, GenerationContext& ctx) {
    const Column& start = spec.columns[pair.start_idx];
    const Column& end = spec.columns[pair.end_idx];
    const std::string& start_value = *row[pair.start_idx];
    const std::string& end_value = *row[pair.end_idx];

    if (pair.start_unique && ctx.is_claimed(start.table, start.name, start_value)) return false;
    if (pair.end_unique && ctx.is_claimed(end.table, end.name, end_value)) return false;

    if (pair.start_unique) (void)ctx.claim_unique(start.table, start.name, start_value);
    if (pair.end_unique) (void)ctx.claim_unique(end.table, end.name, end_value);
    return true;
}

} // anonymous namespace

DefaultAssembler::DefaultAssembler()
    : rules_(default_rules()) {}

DefaultAssembler::DefaultAssembler(std::vector<DatePairRule> rules)
    : rules_(std::move(rules)) {}

std::vector<DefaultAssembler::DatePairRule> DefaultAssembler::default_rules() {
    return {
        {{"start_date", "from_date", "valid_from", "effective_start_date", "block_start_date"},
         {"end_date", "to_date", "valid_to", "effective_end_date", "block_end_date", "expires_on"},
         -365, 365, 1, 60},
        {{"checkin_date"}, {"checkout_date"}, -180, 365, 1, 14},
    };
}

GeneratedTable DefaultAssembler::assemble(const TableSpec& spec, size_t row_count, GenerationContext& ctx) {
    std::vector<ResolvedPair> pairs;
    for (const auto& rule : rules_) {
        const auto start = spec.find_column(rule.start_columns);
        const auto end = spec.find_column(rule.end_columns);
        if (start && end && *start != *end) {
            pairs.push_back({&rule, *start, *end,
                             spec.is_unique(spec.columns[*start].name),
                             spec.is_unique(spec.columns[*end].name)});
        }
    }

    RowFiller filler(spec, row_count, ctx);

    GeneratedTable out;
    out.table = spec.table;
    out.column_names = spec.column_names();
    out.rows.reserve(row_count);

    const size_t width = spec.columns.size();
    const size_t draw_budget = ctx.config().unique_retry_budget + ctx.config().unique_derive_budget;
    size_t repaired = 0;

    for (size_t i = 0; i < row_count; ++i) {
        Row row(width);
        std::vector<bool> preset(width, false);

        for (const auto& pair : pairs) {
            // UNIQUE ends are redrawn until the pair is unused
            for (size_t draw = 0;; ++draw) {
                const auto start = ctx.anchor_date() +
                    std::chrono::days{ctx.uniform_int(pair.rule->start_min_days, pair.rule->start_max_days)};
                const auto end = start +
                    std::chrono::days{ctx.uniform_int(pair.rule->span_min_days, pair.rule->span_max_days)};

                row[pair.start_idx] = temporal::format_for(spec.columns[pair.start_idx], calendar::Timestamp{start});
                row[pair.end_idx] = temporal::format_for(spec.columns[pair.end_idx], calendar::Timestamp{end});
                const bool was_repaired =
                    temporal::repair_pair(row, pair.start_idx, pair.end_idx, spec.columns[pair.end_idx]);

                if (claim_pair(spec, pair, row, ctx)) {
                    if (was_repaired) ++repaired;
                    break;
                }
                if (draw >= draw_budget) {
                    throw SeedError(ErrorCategory::GENERATION_ERROR, std::format(
                        "{}: no unused ({}, {}) pair at row {} after {} draws",
                        spec.table, spec.columns[pair.start_idx].name,
                        spec.columns[pair.end_idx].name, i + 1, draw_budget));
                }
            }
            preset[pair.start_idx] = true;
            preset[pair.end_idx] = true;
        }

        filler.fill(row, preset, i);
        out.rows.push_back(std::move(row));
    }

    if (repaired > 0) {
        utils::log::debug(std::format("{}: repaired {} inverted date pairs", spec.table, repaired));
    }
    return out;
}

} // namespace seedgen
