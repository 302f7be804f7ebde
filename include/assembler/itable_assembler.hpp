#pragma once

#include "assembler/table_spec.hpp"
#include "core/types.hpp"
#include "generator/generation_context.hpp"
#include <string>

namespace seedgen {

/**
 * @brief Produces all rows of one table
 *
 * Implementations raise SeedError (SCHEMA_ERROR / CAPACITY_ERROR) before
 * producing any row when the table cannot be satisfied. Row cells follow
 * spec.columns order.
 */
class ITableAssembler {
public:
    virtual ~ITableAssembler() = default;

    [[nodiscard]] virtual GeneratedTable assemble(const TableSpec& spec, size_t row_count,
                                                  GenerationContext& ctx) = 0;

    /** @brief Short name for logs ("default", "junction", ...) */
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace seedgen
