#pragma once

#include "schema/SchemaModel.hpp"
#include "schema/TypeRef.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace gqlevo {
namespace schema {

using json = nlohmann::json;

/**
 * Builds a SchemaModel from an introspection document.
 *
 * Expected shape (the "data" wrapper is optional):
 * {
 *   "data": { "__schema": {
 *     "queryType": {"name": "Query"}, "mutationType": null, "subscriptionType": null,
 *     "types": [ {"kind": "OBJECT", "name": "User", "fields": [...], ...} ]
 *   } }
 * }
 *
 * Types whose name starts with "__" are introspection internals and skipped.
 * Type and member order is kept exactly as given.
 * Any failure aborts the whole build; no partial model is returned.
 */
class SchemaModelBuilder {
public:
    static constexpr const char* kReservedPrefix = "__";

    /**
     * Build a model from a parsed document
     * Throws MissingQueryRoot, UnknownTypeKind, MalformedTypeRef, InvalidIntrospectionDocument
     *
     * References to undeclared types are logged as warnings unless `scalars`
     * knows the name (servers often leave built-in scalars out of `types`).
     */
    static SchemaModel build(const json& document,
                             const ScalarCatalog& scalars = ScalarCatalog());

    /**
     * Build a model from a JSON string
     */
    static SchemaModel fromString(const std::string& str,
                                  const ScalarCatalog& scalars = ScalarCatalog());

private:
    static const json& schemaNode(const json& document);
    static TypeDefinition buildType(const json& typeJson, const std::string& typeName);

    static std::vector<FieldDefinition> buildFields(const json& typeJson, const std::string& typeName);
    static std::vector<ArgumentDefinition> buildArguments(const json& argsJson, const std::string& context);
    static std::vector<EnumValueDefinition> buildEnumValues(const json& typeJson, const std::string& typeName);
    static std::vector<std::string> buildNameList(const json& typeJson, const char* key, const std::string& typeName);

    static std::optional<std::string> rootTypeName(const json& schema, const char* key);
    static void checkRootType(const SchemaModel& model, const std::string& name, const char* role);
};

} // namespace schema
} // namespace gqlevo
