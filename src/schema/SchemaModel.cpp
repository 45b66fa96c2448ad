#include "schema/SchemaModel.hpp"
#include "schema/SchemaErrors.hpp"
#include <algorithm>
#include <stdexcept>

namespace gqlevo {
namespace schema {

// === Free functions ===

std::string typeKindToString(TypeKind kind) {
    switch (kind) {
        case TypeKind::Object:      return "OBJECT";
        case TypeKind::InputObject: return "INPUT_OBJECT";
        case TypeKind::Interface:   return "INTERFACE";
        case TypeKind::Enum:        return "ENUM";
        case TypeKind::Union:       return "UNION";
        case TypeKind::Scalar:      return "SCALAR";
    }
    return "UNKNOWN";
}

TypeKind stringToTypeKind(const std::string& str) {
    if (str == "OBJECT")       return TypeKind::Object;
    if (str == "INPUT_OBJECT") return TypeKind::InputObject;
    if (str == "INTERFACE")    return TypeKind::Interface;
    if (str == "ENUM")         return TypeKind::Enum;
    if (str == "UNION")        return TypeKind::Union;
    if (str == "SCALAR")       return TypeKind::Scalar;
    throw std::invalid_argument("Unknown type kind: " + str);
}

// === TypeDefinition ===

namespace {

template <typename T>
const T* findByName(const std::vector<T>& items, const std::string& name) {
    auto it = std::find_if(items.begin(), items.end(),
                           [&name](const T& item) { return item.name == name; });
    return it != items.end() ? &*it : nullptr;
}

} // anonymous namespace

const FieldDefinition* TypeDefinition::findField(const std::string& fieldName) const {
    return findByName(fields, fieldName);
}

const ArgumentDefinition* TypeDefinition::findInputField(const std::string& fieldName) const {
    return findByName(inputFields, fieldName);
}

const EnumValueDefinition* TypeDefinition::findEnumValue(const std::string& valueName) const {
    return findByName(enumValues, valueName);
}

// === SchemaModel ===

void SchemaModel::addType(TypeDefinition definition) {
    if (m_typeIndex.count(definition.name) > 0) {
        throw InvalidIntrospectionDocument("duplicate type '" + definition.name + "'");
    }
    m_typeIndex.emplace(definition.name, m_types.size());
    m_types.push_back(std::move(definition));
}

const TypeDefinition* SchemaModel::findType(const std::string& name) const {
    auto it = m_typeIndex.find(name);
    if (it == m_typeIndex.end()) {
        return nullptr;
    }
    return &m_types[it->second];
}

bool SchemaModel::hasType(const std::string& name) const {
    return m_typeIndex.count(name) > 0;
}

std::vector<std::string> SchemaModel::typeNamesOfKind(TypeKind kind) const {
    std::vector<std::string> names;
    for (const auto& type : m_types) {
        if (type.kind == kind) {
            names.push_back(type.name);
        }
    }
    return names;
}

} // namespace schema
} // namespace gqlevo
