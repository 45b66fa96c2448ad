#pragma once

#include "evolution/SchemaChange.hpp"
#include "schema/SchemaModel.hpp"
#include <string>
#include <vector>

namespace gqlevo {
namespace evolution {

enum class Recommendation {
    Excellent,  // score >= 0.9
    Good,       // score >= 0.7
    Moderate,   // score >= 0.5
    Poor
};

std::string recommendationToString(Recommendation recommendation);

/**
 * Metrics for one snapshot transition (snapshot[index-1] -> snapshot[index])
 */
struct VersionMetrics {
    size_t index = 0;
    size_t breakingCount = 0;
    size_t nonBreakingCount = 0;
    double score = 1.0;
};

struct CompatibilityReport {
    ChangeList changes;
    size_t breakingCount = 0;
    size_t nonBreakingCount = 0;
    double score = 1.0;
    Recommendation recommendation = Recommendation::Excellent;
    std::vector<std::string> migrationSuggestions;
};

enum class Trend {
    Improving,
    Declining,
    Stable
};

std::string trendToString(Trend trend);

struct EvolutionTrend {
    double averageBreakingChanges = 0.0;
    double averageScore = 1.0;
    Trend trend = Trend::Stable;
    double scoreDelta = 0.0;  // last score - first score
};

/**
 * Aggregates change lists into compatibility scores.
 */
class CompatibilityScorer {
public:
    /**
     * 1.0 for no changes, otherwise 1 - breaking / total
     */
    static double score(const ChangeList& changes);

    static Recommendation recommendation(double score);
    static std::string recommendationText(Recommendation recommendation);

    /**
     * Diffs each adjacent pair in order. Throws InsufficientSnapshots for
     * fewer than two snapshots.
     */
    static std::vector<VersionMetrics> trackEvolution(const std::vector<schema::SchemaModel>& snapshots);

    static VersionMetrics metricsFor(const ChangeList& changes, size_t index);

    static std::vector<std::string> migrationSuggestions(const ChangeList& changes);

    static CompatibilityReport summarize(ChangeList changes);

    /**
     * Counts, score, recommendation and suggestions cover every change;
     * only `report.changes` is cut down to severity >= listFrom.
     */
    static CompatibilityReport summarize(ChangeList changes, Severity listFrom);

    /**
     * Throws std::invalid_argument on an empty metrics list
     */
    static EvolutionTrend summarizeEvolution(const std::vector<VersionMetrics>& metrics);
};

json toJson(const VersionMetrics& metrics);
json toJson(const CompatibilityReport& report);

} // namespace evolution
} // namespace gqlevo
