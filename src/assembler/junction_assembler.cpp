#include "assembler/junction_assembler.hpp"
#include "assembler/row_filler.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <format>
#include <unordered_set>

namespace seedgen {

namespace {

// Fan-out rounds over the left keys before switching to the product sweep
constexpr size_t kFanoutRoundsPerRow = 20;

size_t resolve_fk_column(const TableSpec& spec, const std::vector<std::string>& candidates,
                         const char* role) {
    const auto idx = spec.find_column(candidates);
    if (!idx) {
        throw SeedError(ErrorCategory::SCHEMA_ERROR, std::format(
            "{}: none of the {} columns [{}] exist", spec.table, role,
            utils::join(candidates, ", ")));
    }
    if (!spec.foreign_key_for(spec.columns[*idx].name)) {
        throw SeedError(ErrorCategory::SCHEMA_ERROR, std::format(
            "{}.{} is not a foreign key; a junction needs both sides to reference a parent",
            spec.table, spec.columns[*idx].name));
    }
    return *idx;
}

} // anonymous namespace

GeneratedTable JunctionAssembler::assemble(const TableSpec& spec, size_t row_count, GenerationContext& ctx) {
    const size_t left_idx = resolve_fk_column(spec, rule_.left_columns, "left");
    const size_t right_idx = resolve_fk_column(spec, rule_.right_columns, "right");
    const Column& left_col = spec.columns[left_idx];
    const Column& right_col = spec.columns[right_idx];
    spec.require_repeatable(left_idx, "junction");
    spec.require_repeatable(right_idx, "junction");

    std::vector<std::string> lefts = ctx.key_pool().keys(spec.foreign_key_for(left_col.name)->ref_table);
    const auto& rights = ctx.key_pool().keys(spec.foreign_key_for(right_col.name)->ref_table);

    const uint64_t available = static_cast<uint64_t>(lefts.size()) * rights.size();
    if (row_count > available) {
        throw SeedError(ErrorCategory::CAPACITY_ERROR, std::format(
            "{}: requested {} rows, available {} unique ({}, {}) pairs ({} x {})",
            spec.table, row_count, available, left_col.name, right_col.name,
            lefts.size(), rights.size()));
    }

    RowFiller filler(spec, row_count, ctx, {left_col.name, right_col.name});

    GeneratedTable out;
    out.table = spec.table;
    out.column_names = spec.column_names();
    out.rows.reserve(row_count);

    const size_t width = spec.columns.size();
    std::vector<bool> preset(width, false);
    preset[left_idx] = true;
    preset[right_idx] = true;

    std::unordered_set<std::string> seen;
    seen.reserve(row_count);

    const auto emit = [&](const std::string& left, const std::string& right) {
        std::string key = left;
        key += '\x1f';
        key += right;
        if (!seen.insert(std::move(key)).second) return;

        Row row(width);
        row[left_idx] = left;
        row[right_idx] = right;
        filler.fill(row, preset, out.rows.size());
        out.rows.push_back(std::move(row));
    };

    ctx.shuffle(lefts);

    const size_t max_rounds = row_count * kFanoutRoundsPerRow;
    for (size_t round = 0; out.rows.size() < row_count && round < max_rounds; ++round) {
        const std::string& left = lefts[round % lefts.size()];
        const auto fanout = ctx.uniform_int(rule_.fanout_min, rule_.fanout_max);
        for (int64_t k = 0; k < fanout && out.rows.size() < row_count; ++k) {
            emit(left, ctx.pick(rights));
        }
    }

    for (size_t a = 0; a < lefts.size() && out.rows.size() < row_count; ++a) {
        for (size_t b = 0; b < rights.size() && out.rows.size() < row_count; ++b) {
            emit(lefts[a], rights[b]);
        }
    }

    return out;
}

} // namespace seedgen
