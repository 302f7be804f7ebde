#pragma once

#include "assembler/assembler_rules.hpp"
#include <cstdint>
#include <map>
#include <string>

namespace seedgen {

// ============================================================================
// Configuration Types
// ============================================================================

struct DatabaseConfig {
    std::string connection_string;    // libpq conninfo or URI
    std::string schema;

    DatabaseConfig() : schema("public") {}
};

struct OutputConfig {
    std::string dir;                  // CSV artifacts + run_summary.json

    OutputConfig() : dir("out") {}
};

struct GenerationConfig {
    uint64_t seed = 42;
    bool truncate_first = true;       // TRUNCATE every planned table once, before any load
    bool load = true;                 // false = write CSV artifacts only
    bool sync_sequences = true;
    double enum_null_probability = 0.03;
    int unique_retry_budget = 50;
    int unique_derive_budget = 1000;
};

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// SeedConfig - Complete parsed configuration
// ============================================================================

struct SeedConfig {
    DatabaseConfig database;
    OutputConfig output;
    GenerationConfig generation;
    LoggingConfig logging;
    std::map<std::string, int64_t> row_counts;   // table -> requested rows
    AssemblerRules assemblers;
};

} // namespace seedgen
