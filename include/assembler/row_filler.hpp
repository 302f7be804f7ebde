#pragma once

#include "assembler/table_spec.hpp"
#include "core/types.hpp"
#include "generator/generation_context.hpp"
#include "generator/uniqueness_strategy.hpp"
#include "generator/value_synthesizer.hpp"
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace seedgen {

/**
 * @brief General per-column algorithm shared by all assemblers
 *
 * For each column an assembler does not set itself:
 *   - FK declared UNIQUE (1:1): positional draw from a shuffled parent
 *     pool, each parent key used at most once
 *   - other FK: uniform sample from the parent pool
 *   - otherwise: synthesized, a sentinel substituted for NULL in a
 *     non-nullable column, and UNIQUE columns (including a single-column
 *     primary key) repaired through UniquenessStrategy
 *
 * Capacity checks run in the constructor, so an unsatisfiable table
 * fails before its first row.
 */
class RowFiller {
public:
    /**
     * @param owned_columns Columns the calling assembler sets itself; they are
     *        skipped by fill() and excluded from the FK capacity checks
     * @throws SeedError CAPACITY_ERROR / SCHEMA_ERROR
     */
    RowFiller(const TableSpec& spec, size_t row_count, GenerationContext& ctx,
              std::unordered_set<std::string> owned_columns = {});

    /**
     * @brief Fill every cell whose `preset` flag is false
     * @param row_index Zero-based position of the row in the table
     */
    void fill(Row& row, const std::vector<bool>& preset, size_t row_index);

    /**
     * @brief Value of one column for one row (the row's ordinal is row_index + 1)
     */
    [[nodiscard]] Cell value_for(size_t column_index, size_t row_index);

    /**
     * @brief Stand-in for NULL in a non-nullable column
     *
     * integer 1, boolean false, today, now, a fresh UUID, the first enum
     * label, otherwise a unique VAL_xxxxxx token.
     */
    [[nodiscard]] static Cell sentinel(const Column& column, GenerationContext& ctx);

    [[nodiscard]] const TableSpec& spec() const { return spec_; }

private:
    [[nodiscard]] Cell foreign_key_value(size_t column_index, const ForeignKey& fk, size_t row_index);
    [[nodiscard]] Cell synthesized_value(const Column& column, int64_t row_ordinal);

    const TableSpec& spec_;
    GenerationContext& ctx_;
    std::unordered_set<std::string> owned_;
    ValueSynthesizer synth_;
    UniquenessStrategy uniqueness_;

    // Column index -> shuffled parent keys consumed by row position
    std::unordered_map<size_t, std::vector<std::string>> one_to_one_pools_;
};

} // namespace seedgen
