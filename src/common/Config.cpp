#include "common/Config.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace gqlevo {
namespace common {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
    return s;
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream iss(value);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

} // anonymous namespace

schema::ScalarCatalog AnalyzerConfig::scalarCatalog() const {
    return schema::ScalarCatalog(customScalars);
}

std::map<std::string, std::string> parseConfigLines(std::istream& input) {
    std::map<std::string, std::string> params;
    std::string line;
    while (std::getline(input, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        params[key] = val;
    }
    return params;
}

AnalyzerConfig configFromParams(const std::map<std::string, std::string>& params) {
    AnalyzerConfig config;
    for (const auto& [key, value] : params) {
        if (key == "custom_scalars") {
            config.customScalars = splitList(value);
        } else if (key == "log_level") {
            config.logLevel = Logger::stringToLogLevel(value);
        } else if (key == "log_file") {
            config.logFile = value;
        } else if (key == "min_severity") {
            config.minSeverity = evolution::stringToSeverity(value);
        } else if (key == "snapshot_db") {
            config.snapshotDb = value;
        } else {
            LOG_WARN("Ignoring unknown config key: " + key);
        }
    }
    return config;
}

AnalyzerConfig loadConfigFile(const std::string& path) {
    std::string filePath = path;
    if (!filePath.empty() && filePath[0] == '@') filePath = filePath.substr(1);

    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filePath);
    }

    auto params = parseConfigLines(file);
    LOG_DEBUG("Loaded " + std::to_string(params.size()) + " config parameters from " + filePath);
    return configFromParams(params);
}

void applyLogging(const AnalyzerConfig& config) {
    Logger& logger = Logger::instance();
    logger.setLevel(config.logLevel);
    if (config.logFile.empty()) {
        logger.disableFileLogging();
    } else {
        logger.enableFileLogging(config.logFile);
    }
}

} // namespace common
} // namespace gqlevo
