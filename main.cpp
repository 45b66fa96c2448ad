#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "schema/SchemaModelBuilder.hpp"
#include "schema/SchemaErrors.hpp"
#include "schema/SdlRenderer.hpp"
#include "evolution/SchemaDiffer.hpp"
#include "evolution/CompatibilityScorer.hpp"
#include "storage/SnapshotStorage.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

using namespace gqlevo;
using common::Logger;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] <command> [args]\n"
              << "Commands:\n"
              << "  diff OLD.json NEW.json [--json] Classify changes between two introspection documents\n"
              << "  sdl SCHEMA.json                 Render an introspection document as SDL\n"
              << "  track A.json B.json [C.json..]  Compatibility of each consecutive transition\n"
              << "  snapshot save SLUG FILE [NAME]  Store a document in the snapshot database\n"
              << "  snapshot track SLUG             Track evolution across stored snapshots\n"
              << "Options:\n"
              << "  --config FILE        Analyzer config file (key=value lines, @file syntax)\n"
              << "  -l, --log-level LVL  Log level: debug, info, warn, error (default: info)\n"
              << "  -h, --help           Show this help\n";
}

std::string readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

schema::SchemaModel loadModel(const std::string& path, const common::AnalyzerConfig& config) {
    return schema::SchemaModelBuilder::fromString(readFile(path), config.scalarCatalog());
}

void printMetrics(const std::vector<evolution::VersionMetrics>& metrics) {
    for (const auto& m : metrics) {
        std::cout << "v" << m.index
                  << "  breaking=" << m.breakingCount
                  << "  non-breaking=" << m.nonBreakingCount
                  << "  score=" << std::fixed << std::setprecision(2) << m.score << "\n";
    }
    auto trend = evolution::CompatibilityScorer::summarizeEvolution(metrics);
    std::cout << "average score " << std::fixed << std::setprecision(2) << trend.averageScore
              << ", trend " << evolution::trendToString(trend.trend) << "\n";
}

int runDiff(const std::vector<std::string>& args, const common::AnalyzerConfig& config) {
    bool asJson = false;
    std::vector<std::string> files;
    for (const auto& arg : args) {
        if (arg == "--json") {
            asJson = true;
        } else {
            files.push_back(arg);
        }
    }
    if (files.size() != 2) {
        std::cerr << "Error: diff needs OLD.json and NEW.json" << std::endl;
        return 1;
    }

    // min_severity trims the listed changes, never the score
    auto report = evolution::CompatibilityScorer::summarize(
        evolution::SchemaDiffer::diff(loadModel(files[0], config), loadModel(files[1], config)),
        config.minSeverity);
    int status = report.breakingCount > 0 ? 2 : 0;

    if (asJson) {
        std::cout << evolution::toJson(report).dump(2) << std::endl;
        return status;
    }

    for (const auto& change : report.changes) {
        std::cout << (change.isBreaking ? "BREAKING " : "         ")
                  << "[" << evolution::severityToString(change.severity) << "] "
                  << change.description << "\n";
    }
    std::cout << "score " << std::fixed << std::setprecision(2) << report.score << ": "
              << evolution::CompatibilityScorer::recommendationText(report.recommendation) << "\n";
    for (const auto& suggestion : report.migrationSuggestions) {
        std::cout << "- " << suggestion << "\n";
    }
    return status;
}

int runSdl(const std::vector<std::string>& args, const common::AnalyzerConfig& config) {
    if (args.size() != 1) {
        std::cerr << "Error: sdl needs SCHEMA.json" << std::endl;
        return 1;
    }
    schema::RenderOptions options;
    options.includeDescriptions = true;
    options.includeDeprecations = true;
    std::cout << schema::SdlRenderer(options).renderSchema(loadModel(args[0], config)) << std::endl;
    return 0;
}

int runTrack(const std::vector<std::string>& args, const common::AnalyzerConfig& config) {
    std::vector<schema::SchemaModel> snapshots;
    for (const auto& path : args) {
        snapshots.push_back(loadModel(path, config));
    }
    printMetrics(evolution::CompatibilityScorer::trackEvolution(snapshots));
    return 0;
}

int runSnapshot(const std::vector<std::string>& args, const common::AnalyzerConfig& config) {
    if (args.empty()) {
        std::cerr << "Error: snapshot needs a subcommand (save, track)" << std::endl;
        return 1;
    }

    storage::SnapshotStorage db(config.snapshotDb);
    if (args[0] == "save" && (args.size() == 3 || args.size() == 4)) {
        std::optional<std::string> name;
        if (args.size() == 4) name = args[3];
        auto id = db.saveSnapshot(args[1], readFile(args[2]), name);
        std::cout << "snapshot " << id << std::endl;
        return 0;
    }
    if (args[0] == "track" && args.size() == 2) {
        printMetrics(evolution::CompatibilityScorer::trackEvolution(db.loadHistory(args[1])));
        return 0;
    }

    std::cerr << "Error: bad snapshot arguments" << std::endl;
    return 1;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        std::string configFile;
        std::string logLevel;
        std::vector<std::string> positional;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
                logLevel = argv[++i];
            } else if (arg == "--config" && i + 1 < argc) {
                configFile = argv[++i];
            } else if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                positional.push_back(arg);
            }
        }

        // Logs go to stderr so command output stays clean
        Logger::instance().setOutputStream(&std::cerr);

        common::AnalyzerConfig config;
        if (!configFile.empty()) {
            config = common::loadConfigFile(configFile);
        }
        if (!logLevel.empty()) {
            config.logLevel = Logger::stringToLogLevel(logLevel);
        }
        common::applyLogging(config);

        if (positional.empty()) {
            printUsage(argv[0]);
            return 1;
        }

        std::string command = positional[0];
        std::vector<std::string> args(positional.begin() + 1, positional.end());

        if (command == "diff") return runDiff(args, config);
        if (command == "sdl") return runSdl(args, config);
        if (command == "track") return runTrack(args, config);
        if (command == "snapshot") return runSnapshot(args, config);

        std::cerr << "Error: unknown command '" << command << "'" << std::endl;
        printUsage(argv[0]);
        return 1;

    } catch (const schema::SchemaError& e) {
        std::cerr << "Schema error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
