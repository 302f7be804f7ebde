#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace seedgen;

namespace {

struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "seedgen_test_config") {
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

const std::string kMinimal = R"(
[database]
connection_string = "host=localhost dbname=hotel"
)";

} // namespace

TEST_CASE("ConfigLoader - defaults for omitted sections", "[config]") {
    auto result = ConfigLoader::load_from_string(kMinimal);
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.database.connection_string == "host=localhost dbname=hotel");
    CHECK(cfg.database.schema == "public");
    CHECK(cfg.output.dir == "out");
    CHECK(cfg.generation.seed == 42);
    CHECK(cfg.generation.truncate_first);
    CHECK(cfg.generation.load);
    CHECK(cfg.generation.sync_sequences);
    CHECK(cfg.generation.enum_null_probability == 0.03);
    CHECK(cfg.generation.unique_retry_budget == 50);
    CHECK(cfg.generation.unique_derive_budget == 1000);
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.row_counts.empty());
    CHECK(cfg.assemblers.junction.empty());
}

TEST_CASE("ConfigLoader - full document", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "postgresql://seed@db/hotel"
schema = "staging"

[output]
dir = "/tmp/seed-out"

[generation]
seed = 7
truncate_first = false
load = false
sync_sequences = false
enum_null_probability = 0.0
unique_retry_budget = 5
unique_derive_budget = 20

[logging]
level = "debug"

[row_counts]
hotel = 3
Booking = 100
)");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.database.schema == "staging");
    CHECK(cfg.output.dir == "/tmp/seed-out");
    CHECK(cfg.generation.seed == 7);
    CHECK_FALSE(cfg.generation.truncate_first);
    CHECK_FALSE(cfg.generation.load);
    CHECK_FALSE(cfg.generation.sync_sequences);
    CHECK(cfg.generation.unique_retry_budget == 5);
    CHECK(cfg.generation.unique_derive_budget == 20);
    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.row_counts.at("hotel") == 3);
    CHECK(cfg.row_counts.at("Booking") == 100);
}

TEST_CASE("ConfigLoader - environment variables are expanded", "[config][env]") {
    ::setenv("SEEDGEN_TEST_PASSWORD", "s3cret", 1);

    auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "host=localhost password=${SEEDGEN_TEST_PASSWORD}"
)");
    REQUIRE(result.success);
    CHECK(result.config.database.connection_string == "host=localhost password=s3cret");

    ::unsetenv("SEEDGEN_TEST_PASSWORD");
}

TEST_CASE("ConfigLoader - unclosed substitution fails", "[config][env]") {
    auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "host=${UNCLOSED"
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed") != std::string::npos);
}

TEST_CASE("ConfigLoader - assembler rules accept a name or a candidate list", "[config]") {
    auto result = ConfigLoader::load_from_string(kMinimal + R"(
[[assemblers.junction]]
table = "hotel_amenity"
left = "hotel_id"
right = ["amenity_id", "feature_id"]
fanout_min = 2
fanout_max = 4

[[assemblers.date_range]]
table = "room_block"
parent = "room_id"
date = ["block_date", "date"]
window_start_days = -30
window_end_days = 90

[[assemblers.status_lifecycle]]
table = "booking"
status = "booking_status"
checkin = "checked_in_at"
checkout = "checked_out_at"
checkin_window_days = 365
)");
    REQUIRE(result.success);

    const auto& rules = result.config.assemblers;
    REQUIRE(rules.junction.size() == 1);
    CHECK(rules.junction[0].table == "hotel_amenity");
    CHECK(rules.junction[0].left_columns == std::vector<std::string>{"hotel_id"});
    CHECK(rules.junction[0].right_columns == std::vector<std::string>{"amenity_id", "feature_id"});
    CHECK(rules.junction[0].fanout_min == 2);
    CHECK(rules.junction[0].fanout_max == 4);

    REQUIRE(rules.date_range.size() == 1);
    CHECK(rules.date_range[0].date_columns == std::vector<std::string>{"block_date", "date"});
    CHECK(rules.date_range[0].window_start_days == -30);
    CHECK(rules.date_range[0].window_end_days == 90);

    REQUIRE(rules.status_lifecycle.size() == 1);
    CHECK(rules.status_lifecycle[0].status_columns == std::vector<std::string>{"booking_status"});
    CHECK(rules.status_lifecycle[0].checkin_window_days == 365);
}

TEST_CASE("ConfigLoader - validation collects every error", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = ""
schema = ""

[generation]
enum_null_probability = 1.5
unique_derive_budget = 0

[logging]
level = "verbose"

[row_counts]
hotel = -1

[[assemblers.junction]]
table = "hotel_amenity"
left = "hotel_id"
fanout_min = 3
fanout_max = 1
)");
    REQUIRE_FALSE(result.success);

    const auto& msg = result.error_message;
    CHECK(msg.find("Config validation failed") != std::string::npos);
    CHECK(msg.find("connection_string") != std::string::npos);
    CHECK(msg.find("database.schema") != std::string::npos);
    CHECK(msg.find("enum_null_probability") != std::string::npos);
    CHECK(msg.find("unique_derive_budget") != std::string::npos);
    CHECK(msg.find("logging.level") != std::string::npos);
    CHECK(msg.find("row_counts.hotel") != std::string::npos);
    CHECK(msg.find("needs left and right") != std::string::npos);
    CHECK(msg.find("fanout") != std::string::npos);
}

TEST_CASE("ConfigLoader - date window and check-in window are validated", "[config]") {
    auto result = ConfigLoader::load_from_string(kMinimal + R"(
[[assemblers.date_range]]
table = "room_block"
parent = "room_id"
date = "block_date"
window_start_days = 10
window_end_days = 0

[[assemblers.status_lifecycle]]
table = "stay"
status = "status"
checkin = "in_at"
checkout = "out_at"
checkin_window_days = 0
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("window_start_days") != std::string::npos);
    CHECK(result.error_message.find("checkin_window_days") != std::string::npos);
}

TEST_CASE("ConfigLoader - type errors are reported", "[config]") {
    SECTION("negative seed") {
        auto result = ConfigLoader::load_from_string(kMinimal + "[generation]\nseed = -1\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("seed") != std::string::npos);
    }

    SECTION("non-integer row count") {
        auto result = ConfigLoader::load_from_string(kMinimal + "[row_counts]\nhotel = \"many\"\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("row_counts.hotel") != std::string::npos);
    }

    SECTION("malformed TOML") {
        auto result = ConfigLoader::load_from_string("[database\n");
        CHECK_FALSE(result.success);
    }
}

TEST_CASE("ConfigLoader - included file is the base", "[config][include]") {
    TmpDir tmp;

    tmp.file("counts.toml", R"(
[row_counts]
hotel = 5
room = 50

[generation]
seed = 1
)");

    const auto main_path = tmp.file("main.toml", R"(
include = "counts.toml"

[database]
connection_string = "host=localhost"

[generation]
seed = 99

[row_counts]
room = 80
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.config.generation.seed == 99);
    CHECK(result.config.row_counts.at("hotel") == 5);
    CHECK(result.config.row_counts.at("room") == 80);
}

TEST_CASE("ConfigLoader - circular include is rejected", "[config][include]") {
    TmpDir tmp;
    tmp.file("a.toml", "include = \"b.toml\"\n");
    tmp.file("b.toml", "include = \"a.toml\"\n");

    auto result = ConfigLoader::load_from_file((tmp.path / "a.toml").string());
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Circular") != std::string::npos);
}

TEST_CASE("ConfigLoader - missing file", "[config]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/seedgen.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to load config") != std::string::npos);
}
