// PeerLend - Configuration Tests

#include <catch2/catch.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <peerlend/config.hpp>

using namespace peerlend;

TEST_CASE("Config defaults", "[config]") {
    EngineConfig config;
    REQUIRE(config.general.log_level == "warning");
    REQUIRE(config.general.log_file.empty());
    REQUIRE(config.general.risk_category == 0);
    REQUIRE(config.iterations.supply == constants::DEFAULT_MAX_ITERATIONS);
    REQUIRE(config.iterations.withdraw == constants::DEFAULT_MAX_ITERATIONS);
}

TEST_CASE("Config from TOML", "[config]") {
    SECTION("Every key") {
        auto config = EngineConfig::from_toml(R"(
# engine settings
[general]
log_level = "debug"
log_file = "/tmp/peerlend.log"  # trailing comment
risk_category = 2

[iterations]
supply = 8
borrow = 6
repay = 0
withdraw = 12
)");
        REQUIRE(config.general.log_level == "debug");
        REQUIRE(config.general.log_file == "/tmp/peerlend.log");
        REQUIRE(config.general.risk_category == 2);
        REQUIRE(config.iterations.supply == 8);
        REQUIRE(config.iterations.borrow == 6);
        REQUIRE(config.iterations.repay == 0);
        REQUIRE(config.iterations.withdraw == 12);
    }

    SECTION("Missing keys keep defaults") {
        auto config = EngineConfig::from_toml("[iterations]\nsupply = 1\n");
        REQUIRE(config.iterations.supply == 1);
        REQUIRE(config.iterations.borrow == constants::DEFAULT_MAX_ITERATIONS);
        REQUIRE(config.general.log_level == "warning");
    }

    SECTION("Unknown sections and keys are ignored") {
        auto config = EngineConfig::from_toml("[server]\nport = 8080\n[general]\ncolor = \"blue\"\n");
        REQUIRE(config.general.log_level == "warning");
    }
}

TEST_CASE("Malformed config values", "[config]") {
    REQUIRE_THROWS_AS(EngineConfig::from_toml("[general]\nlog_level = \"loud\"\n"), std::runtime_error);
    REQUIRE_THROWS_AS(EngineConfig::from_toml("[iterations]\nsupply = -1\n"), std::runtime_error);
    REQUIRE_THROWS_AS(EngineConfig::from_toml("[iterations]\nsupply = four\n"), std::runtime_error);
    REQUIRE_THROWS_AS(EngineConfig::from_toml("[iterations]\nsupply = 4x\n"), std::runtime_error);
    REQUIRE_THROWS_AS(EngineConfig::from_toml("[general]\nrisk_category = 300\n"), std::runtime_error);
    REQUIRE_THROWS_AS(EngineConfig::from_toml("[general]\nlog_file = \"/tmp/peerlend.log\n"), std::runtime_error);
}

TEST_CASE("Comment markers inside quoted values are kept", "[config]") {
    auto config = EngineConfig::from_toml("[general]\nlog_file = \"/tmp/run#1.log\"  # where logs go\n");
    REQUIRE(config.general.log_file == "/tmp/run#1.log");
}

TEST_CASE("Config from file", "[config]") {
    SECTION("Missing file") {
        REQUIRE_THROWS_AS(EngineConfig::from_file("/nonexistent/peerlend.toml"), std::runtime_error);
    }

    SECTION("Existing file") {
        auto path = std::filesystem::temp_directory_path() / "peerlend_config_test.toml";
        {
            std::ofstream out(path);
            out << "[iterations]\nborrow = 3\n";
        }

        auto config = EngineConfig::from_file(path.string());
        REQUIRE(config.iterations.borrow == 3);
        std::filesystem::remove(path);
    }
}
