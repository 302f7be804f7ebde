#include <catch2/catch_test_macros.hpp>
#include "pipeline/seed_pipeline.hpp"
#include "core/error.hpp"
#include "mocks/fake_schema_introspector.hpp"
#include "mocks/mock_db_connection.hpp"

#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

using namespace seedgen;
using seedgen::testing::FakeSchemaIntrospector;
using seedgen::testing::MockDbConnection;

namespace {

struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "seedgen_test_pipeline") {
        std::filesystem::remove_all(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
};

// parent(parent_id PK, name) <- child(child_id PK, parent_id FK, amount)
SchemaSnapshot parent_child_snapshot() {
    SchemaSnapshot snap;
    snap.tables = {"child", "parent", "empty_table"};

    Column name("parent", "name", TypeFamily::TEXT, false);
    name.max_length = 60;
    snap.columns["parent"] = {
        Column("parent", "parent_id", TypeFamily::INTEGER, false),
        name,
    };
    snap.columns["child"] = {
        Column("child", "child_id", TypeFamily::INTEGER, false),
        Column("child", "parent_id", TypeFamily::INTEGER, false),
        Column("child", "amount", TypeFamily::NUMERIC, true),
    };
    snap.primary_keys["parent"] = PrimaryKey{"parent", {"parent_id"}};
    snap.primary_keys["child"] = PrimaryKey{"child", {"child_id"}};
    snap.foreign_keys = {ForeignKey{"child", "parent_id", "parent", "parent_id"}};
    return snap;
}

SeedConfig base_config(const std::filesystem::path& out_dir, bool load) {
    SeedConfig cfg;
    cfg.database.connection_string = "host=localhost";
    cfg.output.dir = out_dir.string();
    cfg.generation.load = load;
    cfg.row_counts = {{"parent", 5}, {"child", 40}, {"ghost", 3}};
    return cfg;
}

std::vector<std::string> csv_column(const std::filesystem::path& path, size_t index) {
    std::ifstream in(path);
    std::string line;
    std::getline(in, line);    // header
    std::vector<std::string> values;
    while (std::getline(in, line)) {
        std::stringstream ss(line);
        std::string field;
        for (size_t i = 0; i <= index; ++i) std::getline(ss, field, ',');
        values.push_back(field);
    }
    return values;
}

} // namespace

TEST_CASE("SeedPipeline - CSV-only run wires children to generated parents", "[pipeline]") {
    TmpDir tmp;
    MockDbConnection conn;
    FakeSchemaIntrospector introspector(parent_child_snapshot());

    SeedPipeline pipeline(base_config(tmp.path, false), conn, introspector);
    const auto report = pipeline.run();

    CHECK(introspector.requested() == std::vector<std::string>{"public"});
    CHECK_FALSE(report.loaded);
    CHECK(report.load_order == std::vector<std::string>{"empty_table", "parent", "child"});
    CHECK(report.skipped_tables == std::vector<std::string>{"empty_table"});
    CHECK(report.ignored_overrides == std::vector<std::string>{"ghost"});

    REQUIRE(report.tables.size() == 2);
    CHECK(report.tables[0].table == "parent");
    CHECK(report.tables[0].assembler == "default");
    CHECK(report.tables[0].generated_rows == 5);
    CHECK(report.tables[0].cached_keys == 5);
    CHECK_FALSE(report.tables[0].loaded_rows.has_value());
    CHECK(report.tables[1].generated_rows == 40);

    // Nothing touches the database in CSV-only mode
    CHECK(conn.executed().empty());
    CHECK(conn.copies().empty());

    const auto parent_ids = csv_column(tmp.path / "parent.csv", 0);
    const std::set<std::string> parents(parent_ids.begin(), parent_ids.end());
    CHECK(parents.size() == 5);

    const auto child_fks = csv_column(tmp.path / "child.csv", 1);
    REQUIRE(child_fks.size() == 40);
    for (const auto& fk : child_fks) {
        CHECK(parents.contains(fk));
    }

    CHECK(std::filesystem::exists(tmp.path / "run_summary.json"));
}

TEST_CASE("SeedPipeline - loaded run uses committed parent keys", "[pipeline]") {
    TmpDir tmp;
    MockDbConnection conn;
    conn.on("FROM \"public\".\"parent\"",
            MockDbConnection::rows({"parent_id"}, {{"100"}, {"200"}}));
    conn.on("pg_get_serial_sequence('\"public\".\"parent\"'",
            MockDbConnection::rows({"pg_get_serial_sequence"}, {{"public.parent_parent_id_seq"}}));
    FakeSchemaIntrospector introspector(parent_child_snapshot());

    SeedPipeline pipeline(base_config(tmp.path, true), conn, introspector);
    const auto report = pipeline.run();

    CHECK(report.loaded);
    REQUIRE(report.tables.size() == 2);
    CHECK(report.tables[0].loaded_rows == 5);
    CHECK(report.tables[0].cached_keys == 2);
    CHECK(report.tables[0].sequence_synced);
    CHECK(report.tables[1].loaded_rows == 40);
    CHECK_FALSE(report.tables[1].sequence_synced);

    // Truncation runs once, children first, before any COPY
    REQUIRE(conn.executed().size() >= 3);
    CHECK(conn.executed()[0].find("TRUNCATE TABLE \"public\".\"child\"") == 0);
    CHECK(conn.executed()[1].find("TRUNCATE TABLE \"public\".\"parent\"") == 0);
    CHECK(conn.executed()[2].find("TRUNCATE TABLE \"public\".\"empty_table\"") == 0);

    REQUIRE(conn.copies().size() == 2);
    CHECK(conn.copies()[0].sql.find("\"public\".\"parent\"") != std::string::npos);

    const auto child_fks = csv_column(tmp.path / "child.csv", 1);
    for (const auto& fk : child_fks) {
        CHECK((fk == "100" || fk == "200"));
    }
}

TEST_CASE("SeedPipeline - truncation can be disabled", "[pipeline]") {
    TmpDir tmp;
    MockDbConnection conn;
    FakeSchemaIntrospector introspector(parent_child_snapshot());

    auto cfg = base_config(tmp.path, true);
    cfg.generation.truncate_first = false;
    cfg.generation.sync_sequences = false;
    cfg.row_counts = {{"parent", 2}, {"child", 0}};

    SeedPipeline pipeline(cfg, conn, introspector);
    const auto report = pipeline.run();

    for (const auto& sql : conn.executed()) {
        CHECK(sql.find("TRUNCATE") == std::string::npos);
        CHECK(sql.find("pg_get_serial_sequence") == std::string::npos);
    }
    CHECK(report.skipped_tables == std::vector<std::string>{"empty_table", "child"});
}

TEST_CASE("SeedPipeline - run summary is valid JSON", "[pipeline]") {
    TmpDir tmp;
    MockDbConnection conn;
    FakeSchemaIntrospector introspector(parent_child_snapshot());

    auto cfg = base_config(tmp.path, false);
    cfg.generation.seed = 1234;
    SeedPipeline pipeline(cfg, conn, introspector);
    (void)pipeline.run();

    std::ifstream in(tmp.path / "run_summary.json");
    const auto summary = nlohmann::json::parse(in);
    CHECK(summary["schema"] == "public");
    CHECK(summary["seed"] == 1234);
    CHECK(summary["loaded"] == false);
    REQUIRE(summary["tables"].size() == 2);
    CHECK(summary["tables"][0]["table"] == "parent");
    CHECK(summary["tables"][0]["loaded_rows"].is_null());
    CHECK(summary["ignored_overrides"][0] == "ghost");
}

TEST_CASE("SeedPipeline - same seed gives the same artifacts", "[pipeline]") {
    TmpDir tmp;
    MockDbConnection conn;
    FakeSchemaIntrospector introspector(parent_child_snapshot());

    auto first_cfg = base_config(tmp.path / "a", false);
    auto second_cfg = base_config(tmp.path / "b", false);

    SeedPipeline first(first_cfg, conn, introspector);
    SeedPipeline second(second_cfg, conn, introspector);
    (void)first.run();
    (void)second.run();

    CHECK(csv_column(tmp.path / "a" / "child.csv", 1) == csv_column(tmp.path / "b" / "child.csv", 1));
    CHECK(csv_column(tmp.path / "a" / "parent.csv", 1) == csv_column(tmp.path / "b" / "parent.csv", 1));
}

TEST_CASE("SeedPipeline - load failure surfaces as a load error", "[pipeline]") {
    TmpDir tmp;
    MockDbConnection conn;
    conn.fail_copy("duplicate key value violates unique constraint");
    FakeSchemaIntrospector introspector(parent_child_snapshot());

    SeedPipeline pipeline(base_config(tmp.path, true), conn, introspector);
    try {
        (void)pipeline.run();
        FAIL("expected SeedError");
    } catch (const SeedError& e) {
        CHECK(e.category() == ErrorCategory::LOAD_ERROR);
        CHECK(std::string(e.what()).find("duplicate key") != std::string::npos);
    }
}

TEST_CASE("SeedPipeline - child without parents is a capacity error", "[pipeline]") {
    TmpDir tmp;
    MockDbConnection conn;
    FakeSchemaIntrospector introspector(parent_child_snapshot());

    auto cfg = base_config(tmp.path, false);
    cfg.row_counts = {{"parent", 0}, {"child", 5}};
    SeedPipeline pipeline(cfg, conn, introspector);
    try {
        (void)pipeline.run();
        FAIL("expected SeedError");
    } catch (const SeedError& e) {
        CHECK(e.category() == ErrorCategory::CAPACITY_ERROR);
    }
}
