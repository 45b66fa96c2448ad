#include <catch2/catch_test_macros.hpp>
#include "common/Config.hpp"
#include "CapturedLog.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace gqlevo::common;
using gqlevo::evolution::Severity;

// =============================================================================
// Parsing
// =============================================================================

TEST_CASE("Parse key=value lines", "[Config][Parse]") {
    std::istringstream input(
        "# analyzer settings\n"
        "\n"
        "  log_level = debug  \n"
        "min_severity=major\r\n"
        "no equals sign here\n"
        "snapshot_db = /tmp/a=b.db\n");

    auto params = parseConfigLines(input);

    REQUIRE(params.size() == 3);
    REQUIRE(params["log_level"] == "debug");
    REQUIRE(params["min_severity"] == "major");
    REQUIRE(params["snapshot_db"] == "/tmp/a=b.db");
}

TEST_CASE("Defaults", "[Config]") {
    AnalyzerConfig config;

    REQUIRE(config.logLevel == LogLevel::INFO);
    REQUIRE(config.logFile.empty());
    REQUIRE(config.minSeverity == Severity::Minor);
    REQUIRE(config.snapshotDb == "./schema_snapshots.db");
    REQUIRE(config.customScalars == gqlevo::schema::ScalarCatalog::defaultCustomScalars());
    REQUIRE(config.scalarCatalog().isScalarLike("DateTime"));
}

TEST_CASE("Config from parameters", "[Config]") {
    auto config = configFromParams({
        {"custom_scalars", "Money, , Email"},
        {"log_level", "warn"},
        {"log_file", "/tmp/gqlevo.log"},
        {"min_severity", "critical"},
        {"snapshot_db", "snapshots.db"},
        {"unknown_key", "ignored"}
    });

    REQUIRE(config.customScalars == std::vector<std::string>{"Money", "Email"});
    REQUIRE(config.logLevel == LogLevel::WARN);
    REQUIRE(config.logFile == "/tmp/gqlevo.log");
    REQUIRE(config.minSeverity == Severity::Critical);
    REQUIRE(config.snapshotDb == "snapshots.db");

    auto catalog = config.scalarCatalog();
    REQUIRE(catalog.isScalarLike("Money"));
    REQUIRE(catalog.isScalarLike("String"));
    REQUIRE_FALSE(catalog.isScalarLike("DateTime"));
}

TEST_CASE("Bad values are rejected", "[Config]") {
    REQUIRE_THROWS_AS(configFromParams({{"log_level", "verbose"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(configFromParams({{"min_severity", "blocker"}}), std::invalid_argument);
}

// =============================================================================
// Files
// =============================================================================

TEST_CASE("Load config file", "[Config][File]") {
    std::string path = "/tmp/test_gqlevo_config_" + std::to_string(std::rand()) + ".conf";
    {
        std::ofstream out(path);
        out << "min_severity = major\n"
            << "snapshot_db = history.db\n";
    }

    auto config = loadConfigFile(path);
    REQUIRE(config.minSeverity == Severity::Major);
    REQUIRE(config.snapshotDb == "history.db");

    auto viaAt = loadConfigFile("@" + path);
    REQUIRE(viaAt.snapshotDb == "history.db");

    std::filesystem::remove(path);
}

TEST_CASE("Missing config file", "[Config][File]") {
    REQUIRE_THROWS_AS(loadConfigFile("/nonexistent/dir/gqlevo.conf"), std::runtime_error);
}

// =============================================================================
// Logging
// =============================================================================

TEST_CASE("Apply logging settings", "[Config][Logging]") {
    CapturedLog log;
    std::string path = "/tmp/test_gqlevo_applied_" + std::to_string(std::rand()) + ".log";

    AnalyzerConfig config;
    config.logLevel = LogLevel::WARN;
    config.logFile = path;
    applyLogging(config);

    REQUIRE_FALSE(Logger::instance().isEnabled(LogLevel::INFO));
    LOG_WARN("written to file");

    config.logFile.clear();
    applyLogging(config);
    LOG_WARN("written to console");

    std::ifstream file(path);
    std::ostringstream content;
    content << file.rdbuf();

    REQUIRE(content.str().find("written to file") != std::string::npos);
    REQUIRE(content.str().find("written to console") == std::string::npos);
    REQUIRE(log.text().find("written to console") != std::string::npos);

    file.close();
    std::filesystem::remove(path);
}
