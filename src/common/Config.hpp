#pragma once

#include "common/Logger.hpp"
#include "evolution/SchemaChange.hpp"
#include "schema/TypeRef.hpp"
#include <istream>
#include <map>
#include <string>
#include <vector>

namespace gqlevo {
namespace common {

/**
 * Analyzer settings. Passed explicitly to whoever needs them.
 *
 * File format (key=value, one per line, '#' comments):
 *   custom_scalars = DateTime, JSON, Upload
 *   log_level      = debug | info | warn | error
 *   log_file       = /var/log/gqlevo.log
 *   min_severity   = minor | major | critical
 *   snapshot_db    = ./schema_snapshots.db
 */
struct AnalyzerConfig {
    std::vector<std::string> customScalars = schema::ScalarCatalog::defaultCustomScalars();
    LogLevel logLevel = LogLevel::INFO;
    std::string logFile;                                 // empty = console
    evolution::Severity minSeverity = evolution::Severity::Minor;
    std::string snapshotDb = "./schema_snapshots.db";

    schema::ScalarCatalog scalarCatalog() const;
};

/**
 * Parse key=value lines. Blank lines and '#' comments are skipped,
 * lines without '=' are ignored, keys and values are trimmed.
 */
std::map<std::string, std::string> parseConfigLines(std::istream& input);

/**
 * Build a config from parsed parameters on top of the defaults.
 * Throws std::invalid_argument on a bad log level or severity.
 */
AnalyzerConfig configFromParams(const std::map<std::string, std::string>& params);

/**
 * Load a config file; a leading '@' on the path is accepted.
 * Throws std::runtime_error if the file cannot be opened.
 */
AnalyzerConfig loadConfigFile(const std::string& path);

/**
 * Apply level and log file to the Logger. An empty log file sends
 * output back to the console stream.
 */
void applyLogging(const AnalyzerConfig& config);

} // namespace common
} // namespace gqlevo
