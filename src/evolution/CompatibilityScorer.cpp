#include "evolution/CompatibilityScorer.hpp"
#include "evolution/SchemaDiffer.hpp"
#include "schema/SchemaErrors.hpp"
#include "common/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace gqlevo {
namespace evolution {

std::string recommendationToString(Recommendation recommendation) {
    switch (recommendation) {
        case Recommendation::Excellent: return "excellent";
        case Recommendation::Good:      return "good";
        case Recommendation::Moderate:  return "moderate";
        case Recommendation::Poor:      return "poor";
    }
    return "unknown";
}

std::string trendToString(Trend trend) {
    switch (trend) {
        case Trend::Improving: return "improving";
        case Trend::Declining: return "declining";
        case Trend::Stable:    return "stable";
    }
    return "unknown";
}

// =============================================================================
// Scoring
// =============================================================================

double CompatibilityScorer::score(const ChangeList& changes) {
    if (changes.empty()) {
        return 1.0;
    }
    double breaking = static_cast<double>(countBreaking(changes));
    return 1.0 - breaking / static_cast<double>(changes.size());
}

Recommendation CompatibilityScorer::recommendation(double score) {
    if (score >= 0.9) return Recommendation::Excellent;
    if (score >= 0.7) return Recommendation::Good;
    if (score >= 0.5) return Recommendation::Moderate;
    return Recommendation::Poor;
}

std::string CompatibilityScorer::recommendationText(Recommendation recommendation) {
    switch (recommendation) {
        case Recommendation::Excellent:
            return "Excellent compatibility - minimal client impact expected";
        case Recommendation::Good:
            return "Good compatibility - some client updates may be needed";
        case Recommendation::Moderate:
            return "Moderate compatibility - significant client updates required";
        case Recommendation::Poor:
            return "Poor compatibility - major breaking changes detected";
    }
    return "";
}

VersionMetrics CompatibilityScorer::metricsFor(const ChangeList& changes, size_t index) {
    VersionMetrics metrics;
    metrics.index = index;
    metrics.breakingCount = countBreaking(changes);
    metrics.nonBreakingCount = changes.size() - metrics.breakingCount;
    metrics.score = score(changes);
    return metrics;
}

std::vector<VersionMetrics> CompatibilityScorer::trackEvolution(const std::vector<schema::SchemaModel>& snapshots) {
    if (snapshots.size() < 2) {
        throw schema::InsufficientSnapshots(snapshots.size());
    }

    std::vector<VersionMetrics> result;
    result.reserve(snapshots.size() - 1);
    for (size_t i = 1; i < snapshots.size(); ++i) {
        auto changes = SchemaDiffer::diff(snapshots[i - 1], snapshots[i]);
        result.push_back(metricsFor(changes, i));
    }

    LOG_DEBUG("Tracked " + std::to_string(result.size()) + " schema transitions");
    return result;
}

// =============================================================================
// Reporting data
// =============================================================================

std::vector<std::string> CompatibilityScorer::migrationSuggestions(const ChangeList& changes) {
    auto any = [&changes](auto predicate) {
        return std::any_of(changes.begin(), changes.end(), predicate);
    };

    std::vector<std::string> suggestions;
    if (any([](const SchemaChange& c) { return c.kind == ChangeKind::FieldRemoved; })) {
        suggestions.push_back("Consider using field deprecation before removal to give clients time to adapt");
    }
    if (any([](const SchemaChange& c) { return c.kind == ChangeKind::TypeRemoved; })) {
        suggestions.push_back("Ensure all client applications are updated before removing types");
    }
    if (any([](const SchemaChange& c) { return c.kind == ChangeKind::FieldTypeChanged && c.isBreaking; })) {
        suggestions.push_back("For breaking type changes, consider adding new fields alongside old ones temporarily");
    }
    return suggestions;
}

CompatibilityReport CompatibilityScorer::summarize(ChangeList changes) {
    CompatibilityReport report;
    report.breakingCount = countBreaking(changes);
    report.nonBreakingCount = changes.size() - report.breakingCount;
    report.score = score(changes);
    report.recommendation = recommendation(report.score);
    report.migrationSuggestions = migrationSuggestions(changes);
    report.changes = std::move(changes);
    return report;
}

CompatibilityReport CompatibilityScorer::summarize(ChangeList changes, Severity listFrom) {
    CompatibilityReport report = summarize(std::move(changes));
    report.changes = filterBySeverity(report.changes, listFrom);
    return report;
}

EvolutionTrend CompatibilityScorer::summarizeEvolution(const std::vector<VersionMetrics>& metrics) {
    if (metrics.empty()) {
        throw std::invalid_argument("Cannot summarize an empty evolution");
    }

    EvolutionTrend trend;
    double breakingSum = 0.0;
    double scoreSum = 0.0;
    for (const auto& m : metrics) {
        breakingSum += static_cast<double>(m.breakingCount);
        scoreSum += m.score;
    }
    trend.averageBreakingChanges = breakingSum / static_cast<double>(metrics.size());
    trend.averageScore = scoreSum / static_cast<double>(metrics.size());
    trend.scoreDelta = metrics.back().score - metrics.front().score;

    if (trend.scoreDelta > 0.0) {
        trend.trend = Trend::Improving;
    } else if (trend.scoreDelta < 0.0) {
        trend.trend = Trend::Declining;
    } else {
        trend.trend = Trend::Stable;
    }
    return trend;
}

json toJson(const VersionMetrics& metrics) {
    return json{
        {"index", metrics.index},
        {"breakingCount", metrics.breakingCount},
        {"nonBreakingCount", metrics.nonBreakingCount},
        {"score", metrics.score}
    };
}

json toJson(const CompatibilityReport& report) {
    json result;
    result["breakingCount"] = report.breakingCount;
    result["nonBreakingCount"] = report.nonBreakingCount;
    result["score"] = report.score;
    result["recommendation"] = recommendationToString(report.recommendation);
    result["migrationSuggestions"] = report.migrationSuggestions;
    result["changes"] = toJson(report.changes);
    return result;
}

} // namespace evolution
} // namespace gqlevo
