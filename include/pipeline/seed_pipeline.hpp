#pragma once

#include "assembler/assembler_registry.hpp"
#include "config/config_types.hpp"
#include "db/idb_connection.hpp"
#include "schema/schema_introspector.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace seedgen {

// ============================================================================
// Run report
// ============================================================================

struct TableReport {
    std::string table;
    std::string assembler;
    int64_t planned_rows = 0;
    size_t generated_rows = 0;
    std::optional<uint64_t> loaded_rows;    // Absent in CSV-only mode
    size_t cached_keys = 0;
    bool sequence_synced = false;
    std::string artifact;
    int64_t elapsed_ms = 0;
};

struct RunReport {
    std::string schema;
    uint64_t seed = 0;
    bool loaded = false;
    std::vector<std::string> load_order;
    std::vector<std::string> cyclic_tables;
    std::vector<std::string> ignored_overrides;
    std::vector<std::string> skipped_tables;    // No columns or a zero row count
    std::vector<TableReport> tables;
    int64_t elapsed_ms = 0;

    [[nodiscard]] nlohmann::json to_json() const;
};

// ============================================================================
// SeedPipeline
// ============================================================================

/**
 * @brief Drives one seeding run
 *
 * introspect -> plan -> truncate (once, reverse order) -> for each table in
 * load order: assemble -> CSV artifact -> COPY -> re-read keys -> sequence
 * sync -> run_summary.json.
 *
 * Tables are committed one at a time; a fatal error leaves the tables
 * already loaded in place. All failures surface as SeedError.
 *
 * Usage:
 *   PgSchemaIntrospector introspector(*conn);
 *   SeedPipeline pipeline(config, *conn, introspector);
 *   auto report = pipeline.run();
 */
class SeedPipeline {
public:
    SeedPipeline(SeedConfig config, IDbConnection& conn, ISchemaIntrospector& introspector);

    /**
     * @brief Execute the run
     * @throws SeedError on any fatal error
     */
    RunReport run();

    /**
     * @brief Built-in assemblers plus the configured rules; tests may add more
     */
    [[nodiscard]] AssemblerRegistry& registry() { return registry_; }

    [[nodiscard]] const SeedConfig& config() const { return config_; }

private:
    void write_summary(const RunReport& report) const;

    SeedConfig config_;
    IDbConnection& conn_;
    ISchemaIntrospector& introspector_;
    AssemblerRegistry registry_;
};

} // namespace seedgen
