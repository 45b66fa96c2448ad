#pragma once

#include "schema/TypeRef.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gqlevo {
namespace schema {

/**
 * Kinds of named types a schema can declare.
 * Wrapper kinds (LIST, NON_NULL) only exist inside TypeRef.
 */
enum class TypeKind {
    Object,
    InputObject,
    Interface,
    Enum,
    Union,
    Scalar
};

/**
 * Convert TypeKind to its introspection spelling ("OBJECT", "INPUT_OBJECT", ...)
 */
std::string typeKindToString(TypeKind kind);

/**
 * Convert an introspection kind string to TypeKind
 * Throws std::invalid_argument for anything else (including LIST/NON_NULL)
 */
TypeKind stringToTypeKind(const std::string& str);

struct ArgumentDefinition {
    std::string name;
    TypeRef type;
    std::optional<std::string> defaultValue;  // literal text, emitted unchanged
    std::optional<std::string> description;
};

struct FieldDefinition {
    std::string name;
    std::optional<std::string> description;
    TypeRef type;
    std::vector<ArgumentDefinition> arguments;
    bool isDeprecated = false;
    std::optional<std::string> deprecationReason;
};

struct EnumValueDefinition {
    std::string name;
    std::optional<std::string> description;
    bool isDeprecated = false;
    std::optional<std::string> deprecationReason;
};

/**
 * A named type with its kind-dependent payload.
 * Only the payload matching `kind` is ever populated:
 *   fields         : Object, Interface
 *   interfaces     : Object
 *   inputFields    : InputObject
 *   enumValues     : Enum
 *   possibleTypes  : Union
 */
struct TypeDefinition {
    std::string name;
    TypeKind kind = TypeKind::Object;
    std::optional<std::string> description;

    std::vector<FieldDefinition> fields;
    std::vector<ArgumentDefinition> inputFields;
    std::vector<EnumValueDefinition> enumValues;
    std::vector<std::string> possibleTypes;
    std::vector<std::string> interfaces;

    const FieldDefinition* findField(const std::string& fieldName) const;
    const ArgumentDefinition* findInputField(const std::string& fieldName) const;
    const EnumValueDefinition* findEnumValue(const std::string& valueName) const;
};

/**
 * Name-indexed set of type definitions plus root operation names.
 *
 * Types keep the order they were added in, so rendering and diffing are
 * deterministic. Built once by SchemaModelBuilder and never mutated after.
 */
class SchemaModel {
public:
    SchemaModel() = default;

    /**
     * Append a type. Throws InvalidIntrospectionDocument on a duplicate name.
     */
    void addType(TypeDefinition definition);

    void setQueryTypeName(const std::string& name) { m_queryTypeName = name; }
    void setMutationTypeName(std::optional<std::string> name) { m_mutationTypeName = std::move(name); }
    void setSubscriptionTypeName(std::optional<std::string> name) { m_subscriptionTypeName = std::move(name); }

    const std::string& getQueryTypeName() const { return m_queryTypeName; }
    const std::optional<std::string>& getMutationTypeName() const { return m_mutationTypeName; }
    const std::optional<std::string>& getSubscriptionTypeName() const { return m_subscriptionTypeName; }

    // Lookup
    const TypeDefinition* findType(const std::string& name) const;
    bool hasType(const std::string& name) const;
    size_t typeCount() const { return m_types.size(); }

    // Types in insertion order
    const std::vector<TypeDefinition>& types() const { return m_types; }

    std::vector<std::string> typeNamesOfKind(TypeKind kind) const;

private:
    std::vector<TypeDefinition> m_types;
    std::unordered_map<std::string, size_t> m_typeIndex;

    std::string m_queryTypeName;
    std::optional<std::string> m_mutationTypeName;
    std::optional<std::string> m_subscriptionTypeName;
};

} // namespace schema
} // namespace gqlevo
