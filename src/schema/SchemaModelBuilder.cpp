#include "schema/SchemaModelBuilder.hpp"
#include "schema/SchemaErrors.hpp"
#include "common/Logger.hpp"
#include <set>
#include <stdexcept>

namespace gqlevo {
namespace schema {

namespace {

std::optional<std::string> optionalString(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

bool optionalFlag(const json& object, const char* key) {
    auto it = object.find(key);
    return it != object.end() && it->is_boolean() && it->get<bool>();
}

std::string requiredName(const json& object, const std::string& what) {
    auto name = optionalString(object, "name");
    if (!name || name->empty()) {
        throw InvalidIntrospectionDocument(what + " has no name");
    }
    return *name;
}

// Returns nullptr for a missing or null member, throws if present but not an array
const json* optionalArray(const json& object, const char* key, const std::string& owner) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_array()) {
        throw InvalidIntrospectionDocument(owner + ": '" + key + "' is not an array");
    }
    return &*it;
}

void checkUnique(std::set<std::string>& seen, const std::string& name,
                 const std::string& owner, const char* what) {
    if (!seen.insert(name).second) {
        throw InvalidIntrospectionDocument(owner + " declares " + what + " '" + name + "' twice");
    }
}

void warnDanglingReference(const SchemaModel& model, const ScalarCatalog& scalars,
                           const TypeRef& ref, const std::string& context) {
    const auto& name = ref.baseName();
    if (!model.hasType(name) && !scalars.isScalarLike(name)) {
        LOG_WARN(context + " references undeclared type '" + name + "'");
    }
}

} // anonymous namespace

// =============================================================================
// Entry points
// =============================================================================

SchemaModel SchemaModelBuilder::build(const json& document, const ScalarCatalog& scalars) {
    const json& schema = schemaNode(document);

    auto queryName = rootTypeName(schema, "queryType");
    if (!queryName) {
        throw MissingQueryRoot();
    }

    const json* types = optionalArray(schema, "types", "__schema");
    if (!types) {
        throw InvalidIntrospectionDocument("__schema has no 'types' list");
    }

    SchemaModel model;
    size_t skipped = 0;
    size_t position = 0;
    for (const auto& typeJson : *types) {
        if (!typeJson.is_object()) {
            throw InvalidIntrospectionDocument("type entry #" + std::to_string(position) +
                                               " is not an object");
        }
        std::string name = requiredName(typeJson, "type entry #" + std::to_string(position));
        ++position;

        if (name.rfind(kReservedPrefix, 0) == 0) {
            ++skipped;
            continue;
        }
        model.addType(buildType(typeJson, name));
    }

    model.setQueryTypeName(*queryName);
    model.setMutationTypeName(rootTypeName(schema, "mutationType"));
    model.setSubscriptionTypeName(rootTypeName(schema, "subscriptionType"));

    checkRootType(model, *queryName, "query");
    if (model.getMutationTypeName()) {
        checkRootType(model, *model.getMutationTypeName(), "mutation");
    }
    if (model.getSubscriptionTypeName()) {
        checkRootType(model, *model.getSubscriptionTypeName(), "subscription");
    }

    if (common::Logger::instance().isEnabled(common::LogLevel::WARN)) {
        for (const auto& type : model.types()) {
            for (const auto& field : type.fields) {
                std::string context = "Field '" + type.name + "." + field.name + "'";
                warnDanglingReference(model, scalars, field.type, context);
                for (const auto& arg : field.arguments) {
                    warnDanglingReference(model, scalars, arg.type, context + " argument '" + arg.name + "'");
                }
            }
            for (const auto& inputField : type.inputFields) {
                warnDanglingReference(model, scalars, inputField.type,
                                      "Input field '" + type.name + "." + inputField.name + "'");
            }
        }
    }

    LOG_DEBUG("Built schema model: " + std::to_string(model.typeCount()) + " types, " +
              std::to_string(skipped) + " introspection types skipped, query root '" +
              *queryName + "'");
    return model;
}

SchemaModel SchemaModelBuilder::fromString(const std::string& str, const ScalarCatalog& scalars) {
    json document;
    try {
        document = json::parse(str);
    } catch (const json::parse_error& e) {
        throw InvalidIntrospectionDocument(std::string("not valid JSON (") + e.what() + ")");
    }
    return build(document, scalars);
}

// =============================================================================
// Document navigation
// =============================================================================

const json& SchemaModelBuilder::schemaNode(const json& document) {
    if (!document.is_object()) {
        throw InvalidIntrospectionDocument("document is not an object");
    }

    auto dataIt = document.find("data");
    if (dataIt != document.end() && dataIt->is_object()) {
        auto schemaIt = dataIt->find("__schema");
        if (schemaIt != dataIt->end() && schemaIt->is_object()) {
            return *schemaIt;
        }
    }

    auto schemaIt = document.find("__schema");
    if (schemaIt != document.end() && schemaIt->is_object()) {
        return *schemaIt;
    }

    throw InvalidIntrospectionDocument("missing '__schema' object");
}

std::optional<std::string> SchemaModelBuilder::rootTypeName(const json& schema, const char* key) {
    auto it = schema.find(key);
    if (it == schema.end() || !it->is_object()) {
        return std::nullopt;
    }
    auto name = optionalString(*it, "name");
    if (!name || name->empty()) {
        return std::nullopt;
    }
    return name;
}

void SchemaModelBuilder::checkRootType(const SchemaModel& model, const std::string& name, const char* role) {
    const TypeDefinition* definition = model.findType(name);
    if (!definition) {
        throw InvalidIntrospectionDocument(std::string(role) + " root '" + name +
                                           "' is not declared in the type list");
    }
    if (definition->kind != TypeKind::Object) {
        throw InvalidIntrospectionDocument(std::string(role) + " root '" + name + "' is " +
                                           typeKindToString(definition->kind) + ", expected OBJECT");
    }
}

// =============================================================================
// Type extraction
// =============================================================================

TypeDefinition SchemaModelBuilder::buildType(const json& typeJson, const std::string& typeName) {
    std::string kindStr = optionalString(typeJson, "kind").value_or("");

    TypeKind kind;
    try {
        kind = stringToTypeKind(kindStr);
    } catch (const std::invalid_argument&) {
        throw UnknownTypeKind(typeName, kindStr);
    }

    TypeDefinition definition;
    definition.name = typeName;
    definition.kind = kind;
    definition.description = optionalString(typeJson, "description");

    switch (kind) {
        case TypeKind::Object:
            definition.fields = buildFields(typeJson, typeName);
            definition.interfaces = buildNameList(typeJson, "interfaces", typeName);
            break;
        case TypeKind::Interface:
            definition.fields = buildFields(typeJson, typeName);
            break;
        case TypeKind::InputObject: {
            const json* inputFields = optionalArray(typeJson, "inputFields", "type '" + typeName + "'");
            if (inputFields) {
                definition.inputFields = buildArguments(*inputFields, "type '" + typeName + "' input field");
            }
            break;
        }
        case TypeKind::Enum:
            definition.enumValues = buildEnumValues(typeJson, typeName);
            break;
        case TypeKind::Union:
            definition.possibleTypes = buildNameList(typeJson, "possibleTypes", typeName);
            break;
        case TypeKind::Scalar:
            break;
    }

    return definition;
}

std::vector<FieldDefinition> SchemaModelBuilder::buildFields(const json& typeJson, const std::string& typeName) {
    std::vector<FieldDefinition> fields;
    std::string owner = "type '" + typeName + "'";

    const json* fieldsJson = optionalArray(typeJson, "fields", owner);
    if (!fieldsJson) {
        return fields;
    }

    std::set<std::string> seen;
    for (const auto& fieldJson : *fieldsJson) {
        if (!fieldJson.is_object()) {
            throw InvalidIntrospectionDocument(owner + " has a field that is not an object");
        }
        std::string name = requiredName(fieldJson, owner + " field");
        checkUnique(seen, name, owner, "field");

        std::string context = owner + " field '" + name + "'";
        auto typeIt = fieldJson.find("type");
        if (typeIt == fieldJson.end() || typeIt->is_null()) {
            throw MalformedTypeRef(context + ": no type");
        }

        FieldDefinition field{
            name,
            optionalString(fieldJson, "description"),
            TypeRef::resolve(*typeIt, context),
            {},
            optionalFlag(fieldJson, "isDeprecated"),
            optionalString(fieldJson, "deprecationReason")
        };

        const json* argsJson = optionalArray(fieldJson, "args", context);
        if (argsJson) {
            field.arguments = buildArguments(*argsJson, context + " argument");
        }

        fields.push_back(std::move(field));
    }
    return fields;
}

std::vector<ArgumentDefinition> SchemaModelBuilder::buildArguments(const json& argsJson, const std::string& context) {
    std::vector<ArgumentDefinition> arguments;
    std::set<std::string> seen;

    for (const auto& argJson : argsJson) {
        if (!argJson.is_object()) {
            throw InvalidIntrospectionDocument(context + " is not an object");
        }
        std::string name = requiredName(argJson, context);
        checkUnique(seen, name, context + " list", "name");

        std::string argContext = context + " '" + name + "'";
        auto typeIt = argJson.find("type");
        if (typeIt == argJson.end() || typeIt->is_null()) {
            throw MalformedTypeRef(argContext + ": no type");
        }

        std::optional<std::string> defaultValue;
        auto defaultIt = argJson.find("defaultValue");
        if (defaultIt != argJson.end() && !defaultIt->is_null()) {
            defaultValue = defaultIt->is_string() ? defaultIt->get<std::string>() : defaultIt->dump();
        }

        arguments.push_back(ArgumentDefinition{
            name,
            TypeRef::resolve(*typeIt, argContext),
            defaultValue,
            optionalString(argJson, "description")
        });
    }
    return arguments;
}

std::vector<EnumValueDefinition> SchemaModelBuilder::buildEnumValues(const json& typeJson, const std::string& typeName) {
    std::vector<EnumValueDefinition> values;
    std::string owner = "enum '" + typeName + "'";

    const json* valuesJson = optionalArray(typeJson, "enumValues", owner);
    if (!valuesJson) {
        return values;
    }

    std::set<std::string> seen;
    for (const auto& valueJson : *valuesJson) {
        if (!valueJson.is_object()) {
            throw InvalidIntrospectionDocument(owner + " has a value that is not an object");
        }
        std::string name = requiredName(valueJson, owner + " value");
        checkUnique(seen, name, owner, "value");

        values.push_back(EnumValueDefinition{
            name,
            optionalString(valueJson, "description"),
            optionalFlag(valueJson, "isDeprecated"),
            optionalString(valueJson, "deprecationReason")
        });
    }
    return values;
}

std::vector<std::string> SchemaModelBuilder::buildNameList(const json& typeJson, const char* key,
                                                           const std::string& typeName) {
    std::vector<std::string> names;
    std::string owner = "type '" + typeName + "'";

    const json* listJson = optionalArray(typeJson, key, owner);
    if (!listJson) {
        return names;
    }

    for (const auto& entry : *listJson) {
        if (entry.is_string()) {
            names.push_back(entry.get<std::string>());
        } else if (entry.is_object()) {
            names.push_back(requiredName(entry, owner + " " + key + " entry"));
        } else {
            throw InvalidIntrospectionDocument(owner + ": '" + key + "' entry is neither a name nor an object");
        }
    }
    return names;
}

} // namespace schema
} // namespace gqlevo
