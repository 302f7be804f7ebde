#include "assembler/row_filler.hpp"
#include "core/calendar.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <format>

namespace seedgen {

RowFiller::RowFiller(const TableSpec& spec, size_t row_count, GenerationContext& ctx,
                     std::unordered_set<std::string> owned_columns)
    : spec_(spec),
      ctx_(ctx),
      owned_(std::move(owned_columns)),
      uniqueness_(ctx) {

    for (size_t i = 0; i < spec_.columns.size(); ++i) {
        const Column& col = spec_.columns[i];
        if (owned_.contains(col.name)) continue;

        if (col.family == TypeFamily::ENUM && !col.nullable && col.enum_type &&
            ctx_.enum_labels(*col.enum_type).empty()) {
            throw SeedError(ErrorCategory::SCHEMA_ERROR, std::format(
                "{}.{} is NOT NULL but enum type '{}' has no labels",
                spec_.table, col.name, *col.enum_type));
        }

        const ForeignKey* fk = spec_.foreign_key_for(col.name);
        if (!fk) continue;

        const auto& parents = ctx_.key_pool().keys(fk->ref_table);

        if (spec_.is_unique(col.name)) {
            if (!col.nullable && parents.size() < row_count) {
                throw SeedError(ErrorCategory::CAPACITY_ERROR, std::format(
                    "{}.{} is a UNIQUE foreign key to {}: requested {} rows, available {} parent keys",
                    spec_.table, col.name, fk->ref_table, row_count, parents.size()));
            }
            std::vector<std::string> pool = parents;
            ctx_.shuffle(pool);
            if (pool.size() > row_count) pool.resize(row_count);
            one_to_one_pools_.emplace(i, std::move(pool));
        } else if (parents.empty() && !col.nullable && row_count > 0) {
            throw SeedError(ErrorCategory::CAPACITY_ERROR, std::format(
                "{}.{} is a NOT NULL foreign key to {}: requested {} rows, available 0 parent keys",
                spec_.table, col.name, fk->ref_table, row_count));
        }
    }
}

void RowFiller::fill(Row& row, const std::vector<bool>& preset, size_t row_index) {
    for (size_t i = 0; i < spec_.columns.size(); ++i) {
        if (preset[i] || owned_.contains(spec_.columns[i].name)) continue;
        row[i] = value_for(i, row_index);
    }
}

Cell RowFiller::value_for(size_t column_index, size_t row_index) {
    const Column& col = spec_.columns[column_index];

    if (const ForeignKey* fk = spec_.foreign_key_for(col.name)) {
        return foreign_key_value(column_index, *fk, row_index);
    }

    const auto ordinal = static_cast<int64_t>(row_index) + 1;
    Cell value = synthesized_value(col, ordinal);

    if (spec_.is_unique(col.name)) {
        value = uniqueness_.enforce(col, std::move(value), ordinal,
            [this, &col](int64_t retry_ordinal) { return synthesized_value(col, retry_ordinal); });
    }
    return value;
}

Cell RowFiller::foreign_key_value(size_t column_index, const ForeignKey& fk, size_t row_index) {
    if (const auto it = one_to_one_pools_.find(column_index); it != one_to_one_pools_.end()) {
        const auto& pool = it->second;
        if (row_index < pool.size()) return pool[row_index];
        return std::nullopt;    // Nullable overflow; NOT NULL was rejected upfront
    }

    const auto& parents = ctx_.key_pool().keys(fk.ref_table);
    if (parents.empty()) return std::nullopt;
    return ctx_.pick(parents);
}

Cell RowFiller::synthesized_value(const Column& column, int64_t row_ordinal) {
    Cell value = synth_.synthesize(column, row_ordinal, ctx_);
    if (!value && !column.nullable) {
        value = sentinel(column, ctx_);
    }
    return value;
}

Cell RowFiller::sentinel(const Column& column, GenerationContext& ctx) {
    switch (column.family) {
        case TypeFamily::INTEGER:
            return "1";
        case TypeFamily::BOOLEAN:
            return "false";
        case TypeFamily::DATE:
            return calendar::format_date(ctx.anchor_date());
        case TypeFamily::TIMESTAMP:
            return calendar::format_timestamp(ctx.now());
        case TypeFamily::UUID:
            return utils::generate_uuid(ctx.rng());
        case TypeFamily::ENUM:
            if (column.enum_type) {
                const auto& labels = ctx.enum_labels(*column.enum_type);
                if (!labels.empty()) return labels.front();
            }
            break;
        default:
            break;
    }

    const size_t budget = ctx.config().unique_derive_budget;
    for (size_t attempt = 0; attempt < budget; ++attempt) {
        std::string token = "VAL_" + utils::random_hex(ctx.rng(), 6);
        if (ctx.claim_unique(column.table, column.name, token, "sentinel")) {
            return token;
        }
    }
    throw SeedError(ErrorCategory::GENERATION_ERROR, std::format(
        "No unused sentinel token left for {}.{}", column.table, column.name));
}

} // namespace seedgen
