#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_schema_introspector.hpp"
#include "pipeline/seed_pipeline.hpp"

#include <format>
#include <string>

using namespace seedgen;

int main(int argc, char* argv[]) {
    try {
        std::string config_file = "config/seedgen.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/3] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            throw SeedError(ErrorCategory::CONFIG_ERROR, config_result.error_message);
        }
        const auto& cfg = config_result.config;

        if (const auto level = utils::log::parse_level(cfg.logging.level)) {
            utils::log::set_level(*level);
        }

        utils::log::info(std::format("[2/3] Connecting to database (schema '{}')", cfg.database.schema));
        PgConnectionFactory factory;
        auto conn = factory.create(cfg.database.connection_string);
        if (!conn) {
            throw SeedError(ErrorCategory::SCHEMA_ERROR, "Unable to connect to the database");
        }

        utils::log::info("[3/3] Seeding");
        PgSchemaIntrospector introspector(*conn);
        SeedPipeline pipeline(cfg, *conn, introspector);
        const auto report = pipeline.run();

        utils::log::info(std::format("Seeded {} tables ({} cyclic) in {} ms",
            report.tables.size(), report.cyclic_tables.size(), report.elapsed_ms));

    } catch (const SeedError& e) {
        utils::log::error(std::format("Fatal {}: {}", error_category_to_string(e.category()), e.what()));
        return 1;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
