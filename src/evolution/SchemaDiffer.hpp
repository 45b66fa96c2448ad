#pragma once

#include "evolution/SchemaChange.hpp"
#include "schema/SchemaModel.hpp"

namespace gqlevo {
namespace evolution {

/**
 * Compares two schema snapshots and classifies every structural change.
 *
 * Emission order:
 *   1. types removed (old order)
 *   2. member changes of types present in both (old order)
 *   3. types added (new order)
 *
 * A type whose kind changed (e.g. OBJECT -> INTERFACE) is reported as a
 * removal followed by an addition. Within a common type, old members are
 * walked first (removed / type changed), then new members (added).
 *
 * Never throws on models produced by SchemaModelBuilder.
 */
class SchemaDiffer {
public:
    static ChangeList diff(const schema::SchemaModel& oldModel,
                           const schema::SchemaModel& newModel);

    // Same classification, filtered to severity >= minSeverity
    static ChangeList diff(const schema::SchemaModel& oldModel,
                           const schema::SchemaModel& newModel,
                           Severity minSeverity);

    /**
     * Field type changes are safe only when both base names fall in the same
     * scalar compatibility class ({String}, {Int}, {Float}, {Boolean}, {ID}).
     * Wrappers are ignored: `Int` -> `Int!` is non-breaking, `User` -> `User!`
     * is breaking.
     */
    static bool isFieldTypeChangeBreaking(const schema::TypeRef& oldType,
                                          const schema::TypeRef& newType);

private:
    template <typename Member>
    using MemberList = std::vector<Member> schema::TypeDefinition::*;

    template <typename Member>
    using MemberLookup = const Member* (schema::TypeDefinition::*)(const std::string&) const;

    static void compareTypes(const schema::TypeDefinition& oldType,
                             const schema::TypeDefinition& newType,
                             ChangeList& changes);

    // Fields and input fields share the same rules
    template <typename Member>
    static void compareMembers(const schema::TypeDefinition& oldType,
                               const schema::TypeDefinition& newType,
                               MemberList<Member> members,
                               MemberLookup<Member> find,
                               ChangeList& changes);

    static void compareEnumValues(const schema::TypeDefinition& oldType,
                                  const schema::TypeDefinition& newType,
                                  ChangeList& changes);
};

} // namespace evolution
} // namespace gqlevo
