#include "pipeline/seed_pipeline.hpp"
#include "assembler/table_spec.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "generator/generation_context.hpp"
#include "loader/bulk_loader.hpp"
#include "loader/csv_writer.hpp"
#include "pipeline/row_plan.hpp"
#include "planner/dependency_planner.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <system_error>

namespace seedgen {

namespace {

GenerationContext::Config context_config(const GenerationConfig& gen) {
    GenerationContext::Config cfg;
    cfg.seed = gen.seed;
    cfg.enum_null_probability = gen.enum_null_probability;
    cfg.unique_retry_budget = static_cast<size_t>(gen.unique_retry_budget);
    cfg.unique_derive_budget = static_cast<size_t>(gen.unique_derive_budget);
    return cfg;
}

// Keys as generated, for runs that never reach the database
std::vector<std::string> generated_keys(const GeneratedTable& table, const std::string& pk_column) {
    std::vector<std::string> keys;
    const auto pos = table.column_position(pk_column);
    if (!pos) return keys;
    keys.reserve(table.rows.size());
    for (const auto& row : table.rows) {
        if (row[*pos]) keys.push_back(*row[*pos]);
    }
    return keys;
}

} // anonymous namespace

nlohmann::json RunReport::to_json() const {
    nlohmann::json tables_json = nlohmann::json::array();
    for (const auto& t : tables) {
        nlohmann::json entry = {
            {"table", t.table},
            {"assembler", t.assembler},
            {"planned_rows", t.planned_rows},
            {"generated_rows", t.generated_rows},
            {"cached_keys", t.cached_keys},
            {"sequence_synced", t.sequence_synced},
            {"artifact", t.artifact},
            {"elapsed_ms", t.elapsed_ms},
        };
        entry["loaded_rows"] = t.loaded_rows ? nlohmann::json(*t.loaded_rows) : nlohmann::json(nullptr);
        tables_json.push_back(std::move(entry));
    }

    return nlohmann::json{
        {"schema", schema},
        {"seed", seed},
        {"loaded", loaded},
        {"load_order", load_order},
        {"cyclic_tables", cyclic_tables},
        {"ignored_overrides", ignored_overrides},
        {"skipped_tables", skipped_tables},
        {"tables", std::move(tables_json)},
        {"elapsed_ms", elapsed_ms},
    };
}

SeedPipeline::SeedPipeline(SeedConfig config, IDbConnection& conn, ISchemaIntrospector& introspector)
    : config_(std::move(config)),
      conn_(conn),
      introspector_(introspector),
      registry_(AssemblerRegistry::with_builtins()) {
    registry_.apply_rules(config_.assemblers);
}

RunReport SeedPipeline::run() {
    const utils::Timer run_timer;
    const auto& gen = config_.generation;
    const std::string& schema = config_.database.schema;
    const std::filesystem::path out_dir(config_.output.dir);

    const SchemaSnapshot snapshot = introspector_.introspect(schema);
    const LoadPlan plan = DependencyPlanner::plan(snapshot.tables, snapshot.foreign_keys);
    const RowPlan rows = RowPlan::build(snapshot.tables, config_.row_counts);

    RunReport report;
    report.schema = schema;
    report.seed = gen.seed;
    report.loaded = gen.load;
    report.load_order = plan.order;
    report.cyclic_tables = plan.cyclic_tables;
    report.ignored_overrides = rows.ignored_overrides();

    utils::log::info(std::format("Schema: {}", schema));
    utils::log::info(std::format("Tables: {}", snapshot.tables.size()));
    utils::log::info(std::format("Enums detected: {}", snapshot.enums.size()));
    utils::log::info(std::format("Output dir: {}", out_dir.string()));

    GenerationContext ctx(context_config(gen));
    ctx.set_enums(snapshot.enums);

    BulkLoader loader(conn_, schema);
    if (gen.load && gen.truncate_first) {
        utils::log::info("Truncating tables...");
        loader.truncate_all(plan.order).value_or_throw();
    }

    for (const auto& table : plan.order) {
        if (snapshot.columns_of(table).empty()) {
            utils::log::debug(std::format("{}: no columns, skipped", table));
            report.skipped_tables.push_back(table);
            continue;
        }
        const int64_t planned = rows.count_for(table);
        if (planned <= 0) {
            utils::log::debug(std::format("{}: row count {}, skipped", table, planned));
            report.skipped_tables.push_back(table);
            continue;
        }

        const utils::Timer table_timer;
        TableReport tr;
        tr.table = table;
        tr.planned_rows = planned;

        utils::log::info(std::format("{}: generating {} rows", table, planned));
        const TableSpec spec = TableSpec::from_snapshot(snapshot, table);
        ITableAssembler& assembler = registry_.resolve(table);
        tr.assembler = assembler.name();

        GeneratedTable generated = assembler.assemble(spec, static_cast<size_t>(planned), ctx);
        ctx.end_table(table);
        tr.generated_rows = generated.rows.size();
        utils::log::info(std::format("{}: synthesized {} rows ({})",
            table, tr.generated_rows, tr.assembler));

        const auto artifact = CsvWriter::write_file(out_dir, generated).value_or_throw();
        tr.artifact = artifact.string();
        utils::log::info(std::format("{}: artifact written to {}", table, tr.artifact));

        const auto pk_column = spec.pk_column();
        if (gen.load) {
            const utils::Timer load_timer;
            tr.loaded_rows = loader.load(table, generated.column_names, artifact).value_or_throw();
            utils::log::info(std::format("{}: loaded {} rows via COPY in {} ms",
                table, *tr.loaded_rows, load_timer.elapsed_ms().count()));

            if (pk_column) {
                tr.cached_keys = loader.reload_keys(table, *pk_column, ctx.key_pool()).value_or_throw();
                if (gen.sync_sequences) {
                    tr.sequence_synced = loader.sync_sequence(table, *pk_column).value_or_throw();
                }
            }
        } else if (pk_column) {
            auto keys = generated_keys(generated, *pk_column);
            tr.cached_keys = keys.size();
            ctx.key_pool().set(table, std::move(keys));
        }

        if (pk_column) {
            utils::log::info(std::format("{}: cached {} keys", table, tr.cached_keys));
        }

        tr.elapsed_ms = table_timer.elapsed_ms().count();
        report.tables.push_back(std::move(tr));
    }

    report.elapsed_ms = run_timer.elapsed_ms().count();
    write_summary(report);
    utils::log::info(std::format("Done: {} tables in {} ms", report.tables.size(), report.elapsed_ms));
    return report;
}

void SeedPipeline::write_summary(const RunReport& report) const {
    const std::filesystem::path dir(config_.output.dir);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw SeedError(ErrorCategory::LOAD_ERROR,
            std::format("Cannot create output directory {}: {}", dir.string(), ec.message()));
    }

    const auto path = dir / "run_summary.json";
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw SeedError(ErrorCategory::LOAD_ERROR,
            std::format("Cannot write run summary to {}", path.string()));
    }
    out << report.to_json().dump(2) << '\n';
    if (!out) {
        throw SeedError(ErrorCategory::LOAD_ERROR,
            std::format("Write to {} failed", path.string()));
    }
}

} // namespace seedgen
