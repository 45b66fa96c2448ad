#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace gqlevo {
namespace evolution {

using json = nlohmann::json;

enum class ChangeKind {
    TypeAdded,
    TypeRemoved,
    FieldAdded,
    FieldRemoved,
    FieldTypeChanged,
    EnumValueAdded,
    EnumValueRemoved
};

// Ordered: Minor < Major < Critical
enum class Severity {
    Minor = 0,
    Major = 1,
    Critical = 2
};

std::string changeKindToString(ChangeKind kind);
ChangeKind stringToChangeKind(const std::string& str);

std::string severityToString(Severity severity);
Severity stringToSeverity(const std::string& str);

/**
 * One classified structural difference between two schema snapshots.
 */
struct SchemaChange {
    ChangeKind kind;
    Severity severity;
    bool isBreaking;
    std::string description;
    std::optional<std::string> impact;
    std::optional<std::string> recommendation;

    std::string typeName;                   // Owning (or added/removed) type
    std::optional<std::string> memberName;  // Field or enum value
    std::optional<std::string> oldType;     // FieldTypeChanged only
    std::optional<std::string> newType;     // FieldTypeChanged only
};

using ChangeList = std::vector<SchemaChange>;

/**
 * Subset of `changes` with severity >= minSeverity, order preserved.
 * Classification of the returned changes is untouched.
 */
ChangeList filterBySeverity(const ChangeList& changes, Severity minSeverity);

size_t countBreaking(const ChangeList& changes);

json toJson(const SchemaChange& change);
json toJson(const ChangeList& changes);

} // namespace evolution
} // namespace gqlevo
