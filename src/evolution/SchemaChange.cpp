#include "evolution/SchemaChange.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace gqlevo {
namespace evolution {

std::string changeKindToString(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::TypeAdded:        return "TYPE_ADDED";
        case ChangeKind::TypeRemoved:      return "TYPE_REMOVED";
        case ChangeKind::FieldAdded:       return "FIELD_ADDED";
        case ChangeKind::FieldRemoved:     return "FIELD_REMOVED";
        case ChangeKind::FieldTypeChanged: return "FIELD_TYPE_CHANGED";
        case ChangeKind::EnumValueAdded:   return "ENUM_VALUE_ADDED";
        case ChangeKind::EnumValueRemoved: return "ENUM_VALUE_REMOVED";
    }
    return "UNKNOWN";
}

ChangeKind stringToChangeKind(const std::string& str) {
    if (str == "TYPE_ADDED")         return ChangeKind::TypeAdded;
    if (str == "TYPE_REMOVED")       return ChangeKind::TypeRemoved;
    if (str == "FIELD_ADDED")        return ChangeKind::FieldAdded;
    if (str == "FIELD_REMOVED")      return ChangeKind::FieldRemoved;
    if (str == "FIELD_TYPE_CHANGED") return ChangeKind::FieldTypeChanged;
    if (str == "ENUM_VALUE_ADDED")   return ChangeKind::EnumValueAdded;
    if (str == "ENUM_VALUE_REMOVED") return ChangeKind::EnumValueRemoved;
    throw std::invalid_argument("Unknown change kind: " + str);
}

std::string severityToString(Severity severity) {
    switch (severity) {
        case Severity::Minor:    return "minor";
        case Severity::Major:    return "major";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

Severity stringToSeverity(const std::string& str) {
    if (str == "minor")    return Severity::Minor;
    if (str == "major")    return Severity::Major;
    if (str == "critical") return Severity::Critical;
    throw std::invalid_argument("Unknown severity: " + str);
}

ChangeList filterBySeverity(const ChangeList& changes, Severity minSeverity) {
    ChangeList result;
    std::copy_if(changes.begin(), changes.end(), std::back_inserter(result),
                 [minSeverity](const SchemaChange& c) { return c.severity >= minSeverity; });
    return result;
}

size_t countBreaking(const ChangeList& changes) {
    return static_cast<size_t>(std::count_if(changes.begin(), changes.end(),
                                             [](const SchemaChange& c) { return c.isBreaking; }));
}

json toJson(const SchemaChange& change) {
    json result;
    result["kind"] = changeKindToString(change.kind);
    result["severity"] = severityToString(change.severity);
    result["isBreaking"] = change.isBreaking;
    result["description"] = change.description;
    result["typeName"] = change.typeName;

    if (change.memberName) result["memberName"] = *change.memberName;
    if (change.oldType) result["oldType"] = *change.oldType;
    if (change.newType) result["newType"] = *change.newType;
    if (change.impact) result["impact"] = *change.impact;
    if (change.recommendation) result["recommendation"] = *change.recommendation;

    return result;
}

json toJson(const ChangeList& changes) {
    json result = json::array();
    for (const auto& change : changes) {
        result.push_back(toJson(change));
    }
    return result;
}

} // namespace evolution
} // namespace gqlevo
