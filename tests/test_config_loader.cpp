#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace querygate;

TEST_CASE("ConfigLoader: empty config uses defaults", "[config]") {
    const auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    REQUIRE(cfg.logging.level == utils::log::Level::INFO);
    REQUIRE_FALSE(cfg.query.enforce_select);
    REQUIRE_FALSE(cfg.query.enable_update_queries);
    REQUIRE(cfg.schema.categorical_threshold == 20);
    REQUIRE_FALSE(cfg.engine.default_engine.has_value());
}

TEST_CASE("ConfigLoader: all sections", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "warn"

[query]
enforce_select = true
enable_update_queries = true

[schema]
categorical_threshold = 5

[engine]
default = "SQLite"
)");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    REQUIRE(cfg.logging.level == utils::log::Level::WARN);
    REQUIRE(cfg.query.enforce_select);
    REQUIRE(cfg.query.enable_update_queries);
    REQUIRE(cfg.schema.categorical_threshold == 5);
    REQUIRE(cfg.engine.default_engine == "SQLite");
}

TEST_CASE("ConfigLoader: environment expansion", "[config]") {
    ::setenv("QUERYGATE_TEST_ENGINE", "duckdb", 1);
    ::unsetenv("QUERYGATE_TEST_UNSET");

    SECTION("Set variable is substituted") {
        const auto result = ConfigLoader::load_from_string(
            "[engine]\ndefault = \"${QUERYGATE_TEST_ENGINE}\"\n");
        REQUIRE(result.success);
        REQUIRE(result.config.engine.default_engine == "duckdb");
    }

    SECTION("Unset variable expands to empty, meaning no preference") {
        const auto result = ConfigLoader::load_from_string(
            "[engine]\ndefault = \"${QUERYGATE_TEST_UNSET}\"\n");
        REQUIRE(result.success);
        REQUIRE_FALSE(result.config.engine.default_engine.has_value());
    }

    SECTION("Unclosed substitution is an error") {
        const auto result = ConfigLoader::load_from_string(
            "[logging]\nlevel = \"${BROKEN\"\n");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message.find("Unclosed") != std::string::npos);
    }

    ::unsetenv("QUERYGATE_TEST_ENGINE");
}

TEST_CASE("ConfigLoader: validation failures", "[config]") {
    SECTION("Threshold below one") {
        const auto result = ConfigLoader::load_from_string("[schema]\ncategorical_threshold = 0\n");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message.find("categorical_threshold") != std::string::npos);
    }

    SECTION("Engine outside the allow-list") {
        const auto result = ConfigLoader::load_from_string("[engine]\ndefault = \"postgres\"\n");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message.find("Unknown embedded engine 'postgres'") != std::string::npos);
    }

    SECTION("Unknown log level") {
        const auto result = ConfigLoader::load_from_string("[logging]\nlevel = \"verbose\"\n");
        REQUIRE_FALSE(result.success);
    }

    SECTION("Malformed TOML") {
        const auto result = ConfigLoader::load_from_string("[schema\ncategorical_threshold = ");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message.starts_with("Failed to parse config"));
    }

    SECTION("Both problems are reported together") {
        const auto result = ConfigLoader::load_from_string(
            "[schema]\ncategorical_threshold = -3\n[engine]\ndefault = \"oracle\"\n");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message.find("categorical_threshold") != std::string::npos);
        REQUIRE(result.error_message.find("oracle") != std::string::npos);
    }
}

TEST_CASE("ConfigLoader: load from file", "[config]") {
    namespace fs = std::filesystem;
    const auto path = fs::temp_directory_path() / "querygate_test_config.toml";
    {
        std::ofstream out(path);
        out << "[query]\nenforce_select = true\n";
    }

    const auto result = ConfigLoader::load_from_file(path.string());
    REQUIRE(result.success);
    REQUIRE(result.config.query.enforce_select);
    fs::remove(path);

    const auto missing = ConfigLoader::load_from_file(path.string());
    REQUIRE_FALSE(missing.success);
    REQUIRE(missing.error_message.starts_with("Failed to load config"));
}
