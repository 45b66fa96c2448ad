#include "evolution/SchemaDiffer.hpp"
#include "common/Logger.hpp"
#include <optional>

namespace gqlevo {
namespace evolution {

using schema::SchemaModel;
using schema::TypeDefinition;
using schema::TypeRef;

namespace {

// Each built-in scalar is its own class; anything else has none
std::optional<std::string> compatibilityClass(const std::string& baseName) {
    if (baseName == "String" || baseName == "Int" || baseName == "Float" ||
        baseName == "Boolean" || baseName == "ID") {
        return baseName;
    }
    return std::nullopt;
}

// Present in both snapshots with the same kind
bool isCommon(const TypeDefinition& type, const SchemaModel& other) {
    const TypeDefinition* match = other.findType(type.name);
    return match && match->kind == type.kind;
}

SchemaChange typeRemoved(const TypeDefinition& type) {
    return SchemaChange{
        ChangeKind::TypeRemoved, Severity::Critical, true,
        "Type '" + type.name + "' was removed",
        std::string("All queries using this type will fail"),
        std::string("Ensure no clients are using this type before removal"),
        type.name, std::nullopt, std::nullopt, std::nullopt
    };
}

SchemaChange typeAdded(const TypeDefinition& type) {
    return SchemaChange{
        ChangeKind::TypeAdded, Severity::Minor, false,
        "Type '" + type.name + "' was added",
        std::string("New functionality available to clients"),
        std::nullopt,
        type.name, std::nullopt, std::nullopt, std::nullopt
    };
}

} // anonymous namespace

// =============================================================================
// Entry points
// =============================================================================

ChangeList SchemaDiffer::diff(const SchemaModel& oldModel, const SchemaModel& newModel) {
    ChangeList changes;

    for (const auto& oldType : oldModel.types()) {
        if (!isCommon(oldType, newModel)) {
            changes.push_back(typeRemoved(oldType));
        }
    }

    for (const auto& oldType : oldModel.types()) {
        if (isCommon(oldType, newModel)) {
            compareTypes(oldType, *newModel.findType(oldType.name), changes);
        }
    }

    for (const auto& newType : newModel.types()) {
        if (!isCommon(newType, oldModel)) {
            changes.push_back(typeAdded(newType));
        }
    }

    LOG_DEBUG("Schema diff: " + std::to_string(changes.size()) + " changes, " +
              std::to_string(countBreaking(changes)) + " breaking");
    return changes;
}

ChangeList SchemaDiffer::diff(const SchemaModel& oldModel, const SchemaModel& newModel,
                              Severity minSeverity) {
    return filterBySeverity(diff(oldModel, newModel), minSeverity);
}

bool SchemaDiffer::isFieldTypeChangeBreaking(const TypeRef& oldType, const TypeRef& newType) {
    auto oldClass = compatibilityClass(oldType.baseName());
    auto newClass = compatibilityClass(newType.baseName());
    return !(oldClass && newClass && *oldClass == *newClass);
}

// =============================================================================
// Per-type comparison
// =============================================================================

template <typename Member>
void SchemaDiffer::compareMembers(const TypeDefinition& oldType, const TypeDefinition& newType,
                                  MemberList<Member> members, MemberLookup<Member> find,
                                  ChangeList& changes) {
    const std::string& typeName = oldType.name;

    for (const auto& oldMember : oldType.*members) {
        const Member* newMember = (newType.*find)(oldMember.name);

        if (!newMember) {
            changes.push_back(SchemaChange{
                ChangeKind::FieldRemoved, Severity::Critical, true,
                "Field '" + oldMember.name + "' was removed from type '" + typeName + "'",
                std::string("Queries selecting this field will fail"),
                std::string("Use deprecation before removal"),
                typeName, oldMember.name, std::nullopt, std::nullopt
            });
            continue;
        }

        std::string oldText = oldMember.type.render();
        std::string newText = newMember->type.render();
        if (oldText == newText) {
            continue;
        }

        bool breaking = isFieldTypeChangeBreaking(oldMember.type, newMember->type);
        changes.push_back(SchemaChange{
            ChangeKind::FieldTypeChanged,
            breaking ? Severity::Critical : Severity::Major,
            breaking,
            "Field '" + oldMember.name + "' type changed from '" + oldText + "' to '" +
                newText + "' in type '" + typeName + "'",
            std::string(breaking ? "May cause client parsing errors"
                                 : "Client adaptation may be needed"),
            std::nullopt,
            typeName, oldMember.name, oldText, newText
        });
    }

    for (const auto& newMember : newType.*members) {
        if ((oldType.*find)(newMember.name)) {
            continue;
        }
        changes.push_back(SchemaChange{
            ChangeKind::FieldAdded, Severity::Minor, false,
            "Field '" + newMember.name + "' was added to type '" + typeName + "'",
            std::string("New data available to clients"),
            std::nullopt,
            typeName, newMember.name, std::nullopt, std::nullopt
        });
    }
}

void SchemaDiffer::compareTypes(const TypeDefinition& oldType, const TypeDefinition& newType,
                                ChangeList& changes) {
    switch (oldType.kind) {
        case schema::TypeKind::Object:
        case schema::TypeKind::Interface:
            compareMembers(oldType, newType, &TypeDefinition::fields,
                           &TypeDefinition::findField, changes);
            break;
        case schema::TypeKind::InputObject:
            compareMembers(oldType, newType, &TypeDefinition::inputFields,
                           &TypeDefinition::findInputField, changes);
            break;
        case schema::TypeKind::Enum:
            compareEnumValues(oldType, newType, changes);
            break;
        case schema::TypeKind::Union:
        case schema::TypeKind::Scalar:
            break;
    }
}

void SchemaDiffer::compareEnumValues(const TypeDefinition& oldType, const TypeDefinition& newType,
                                     ChangeList& changes) {
    for (const auto& value : oldType.enumValues) {
        if (newType.findEnumValue(value.name)) {
            continue;
        }
        changes.push_back(SchemaChange{
            ChangeKind::EnumValueRemoved, Severity::Critical, true,
            "Enum value '" + value.name + "' was removed from enum '" + oldType.name + "'",
            std::string("Clients sending or matching this value will fail"),
            std::string("Deprecate the value before removal"),
            oldType.name, value.name, std::nullopt, std::nullopt
        });
    }

    for (const auto& value : newType.enumValues) {
        if (oldType.findEnumValue(value.name)) {
            continue;
        }
        changes.push_back(SchemaChange{
            ChangeKind::EnumValueAdded, Severity::Minor, false,
            "Enum value '" + value.name + "' was added to enum '" + oldType.name + "'",
            std::string("Clients with exhaustive matching may need updates"),
            std::nullopt,
            oldType.name, value.name, std::nullopt, std::nullopt
        });
    }
}

} // namespace evolution
} // namespace gqlevo
