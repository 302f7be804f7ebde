#include "assembler/date_range_assembler.hpp"
#include "assembler/row_filler.hpp"
#include "assembler/temporal_rules.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <format>
#include <numeric>

namespace seedgen {

GeneratedTable DateRangeAssembler::assemble(const TableSpec& spec, size_t row_count, GenerationContext& ctx) {
    const auto parent_idx = spec.find_column(rule_.parent_columns);
    const auto date_idx = spec.find_column(rule_.date_columns);
    if (!parent_idx || !date_idx) {
        throw SeedError(ErrorCategory::SCHEMA_ERROR, std::format(
            "{}: expected a parent column [{}] and a date column [{}]",
            spec.table, utils::join(rule_.parent_columns, ", "), utils::join(rule_.date_columns, ", ")));
    }

    const Column& parent_col = spec.columns[*parent_idx];
    const Column& date_col = spec.columns[*date_idx];
    spec.require_repeatable(*parent_idx, "date range");
    spec.require_repeatable(*date_idx, "date range");
    const ForeignKey* fk = spec.foreign_key_for(parent_col.name);
    if (!fk) {
        throw SeedError(ErrorCategory::SCHEMA_ERROR, std::format(
            "{}.{} is not a foreign key", spec.table, parent_col.name));
    }
    if (rule_.window_end_days < rule_.window_start_days) {
        throw SeedError(ErrorCategory::CONFIG_ERROR, std::format(
            "{}: date window end ({}) precedes start ({})",
            spec.table, rule_.window_end_days, rule_.window_start_days));
    }

    std::vector<std::string> parents = ctx.key_pool().keys(fk->ref_table);
    const size_t window = static_cast<size_t>(rule_.window_end_days - rule_.window_start_days) + 1;

    const uint64_t available = static_cast<uint64_t>(parents.size()) * window;
    if (row_count > available) {
        throw SeedError(ErrorCategory::CAPACITY_ERROR, std::format(
            "{}: requested {} rows, available {} ({} parents x {} days)",
            spec.table, row_count, available, parents.size(), window));
    }

    RowFiller filler(spec, row_count, ctx, {parent_col.name, date_col.name});

    GeneratedTable out;
    out.table = spec.table;
    out.column_names = spec.column_names();
    out.rows.reserve(row_count);
    if (row_count == 0) return out;

    const size_t width = spec.columns.size();
    std::vector<bool> preset(width, false);
    preset[*parent_idx] = true;
    preset[*date_idx] = true;

    ctx.shuffle(parents);
    const size_t per_parent = row_count / parents.size();
    const size_t remainder = row_count % parents.size();

    std::vector<int> offsets(window);
    std::iota(offsets.begin(), offsets.end(), rule_.window_start_days);

    for (size_t p = 0; p < parents.size() && out.rows.size() < row_count; ++p) {
        const size_t take = per_parent + (p < remainder ? 1 : 0);

        // Partial Fisher-Yates: the first `take` slots become a sample without replacement
        for (size_t k = 0; k < take; ++k) {
            const auto j = static_cast<size_t>(ctx.uniform_int(static_cast<int64_t>(k),
                                                               static_cast<int64_t>(window) - 1));
            std::swap(offsets[k], offsets[j]);

            const auto day = ctx.anchor_date() + std::chrono::days{offsets[k]};

            Row row(width);
            row[*parent_idx] = parents[p];
            row[*date_idx] = temporal::format_for(date_col, calendar::Timestamp{day});
            filler.fill(row, preset, out.rows.size());
            out.rows.push_back(std::move(row));
        }
    }

    return out;
}

} // namespace seedgen
