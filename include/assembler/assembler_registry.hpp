#pragma once

#include "assembler/assembler_rules.hpp"
#include "assembler/itable_assembler.hpp"
#include <memory>
#include <string>
#include <unordered_map>

namespace seedgen {

/**
 * @brief Maps tables to their assembler
 *
 * Lookups are by lowercased table name; tables without a registration
 * fall back to the DefaultAssembler. A later registration for the same
 * table replaces the earlier one, which is how config rules override
 * the built-in set.
 *
 * Usage:
 *   auto registry = AssemblerRegistry::with_builtins();
 *   registry.apply_rules(config.assemblers);
 *   auto table = registry.resolve("booking_room").assemble(spec, n, ctx);
 */
class AssemblerRegistry {
public:
    AssemblerRegistry();

    void register_assembler(const std::string& table, std::shared_ptr<ITableAssembler> assembler);

    /**
     * @brief Register one assembler per rule (junction, date range, status lifecycle)
     */
    void apply_rules(const AssemblerRules& rules);

    [[nodiscard]] ITableAssembler& resolve(const std::string& table) const;
    [[nodiscard]] bool has_bespoke(const std::string& table) const;
    [[nodiscard]] size_t bespoke_count() const { return assemblers_.size(); }

    /**
     * @brief Registry preloaded with the hotel schema's bespoke tables
     */
    [[nodiscard]] static AssemblerRegistry with_builtins();

    [[nodiscard]] static AssemblerRules builtin_rules();

private:
    std::shared_ptr<ITableAssembler> fallback_;
    std::unordered_map<std::string, std::shared_ptr<ITableAssembler>> assemblers_;
};

} // namespace seedgen
