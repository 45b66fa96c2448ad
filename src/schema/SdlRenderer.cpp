#include "schema/SdlRenderer.hpp"
#include <sstream>

namespace gqlevo {
namespace schema {

namespace {

const char* kIndent = "  ";

std::string joinNames(const std::vector<std::string>& names, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) result += separator;
        result += names[i];
    }
    return result;
}

// Escapes a string for use inside "..."
std::string quoted(const std::string& text) {
    std::string result = "\"";
    for (char c : text) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            default:   result += c; break;
        }
    }
    return result + "\"";
}

// Block strings end at the first unescaped triple quote. A trailing quote
// would merge with the closing delimiter, so the delimiter moves to its own line.
std::string blockString(const std::string& text, const std::string& indent) {
    std::string result;
    size_t start = 0;
    size_t pos;
    while ((pos = text.find("\"\"\"", start)) != std::string::npos) {
        result.append(text, start, pos - start);
        result += "\\\"\"\"";
        start = pos + 3;
    }
    result.append(text, start, std::string::npos);
    if (!result.empty() && result.back() == '"') {
        result += "\n" + indent;
    }
    return "\"\"\"" + result + "\"\"\"";
}

} // anonymous namespace

SdlRenderer::SdlRenderer(RenderOptions options)
    : m_options(options) {}

// =============================================================================
// Members
// =============================================================================

std::string SdlRenderer::renderArgument(const ArgumentDefinition& argument) const {
    std::string result = argument.name + ": " + argument.type.render();
    if (argument.defaultValue) {
        result += " = " + *argument.defaultValue;
    }
    return result;
}

std::string SdlRenderer::renderField(const FieldDefinition& field) const {
    std::string result = field.name;

    if (!field.arguments.empty()) {
        result += "(";
        for (size_t i = 0; i < field.arguments.size(); ++i) {
            if (i > 0) result += ", ";
            result += renderArgument(field.arguments[i]);
        }
        result += ")";
    }

    result += ": " + field.type.render();
    result += renderDeprecation(field.isDeprecated, field.deprecationReason);
    return result;
}

std::string SdlRenderer::renderEnumValue(const EnumValueDefinition& value) const {
    return value.name + renderDeprecation(value.isDeprecated, value.deprecationReason);
}

std::string SdlRenderer::renderDescription(const std::optional<std::string>& description,
                                           const std::string& indent) const {
    if (!m_options.includeDescriptions || !description || description->empty()) {
        return "";
    }
    return indent + blockString(*description, indent) + "\n";
}

std::string SdlRenderer::renderDeprecation(bool isDeprecated,
                                           const std::optional<std::string>& reason) const {
    if (!m_options.includeDeprecations || !isDeprecated) {
        return "";
    }
    if (!reason || reason->empty()) {
        return " @deprecated";
    }
    return " @deprecated(reason: " + quoted(*reason) + ")";
}

template <typename Member, typename RenderFn>
std::string SdlRenderer::renderBody(const std::vector<Member>& members, RenderFn renderMember) const {
    if (members.empty()) {
        return "";
    }
    std::ostringstream oss;
    oss << " {\n";
    for (const auto& member : members) {
        oss << renderDescription(member.description, kIndent)
            << kIndent << renderMember(member) << "\n";
    }
    oss << "}";
    return oss.str();
}

// =============================================================================
// Types
// =============================================================================

std::string SdlRenderer::renderType(const TypeDefinition& definition) const {
    std::string result = renderDescription(definition.description, "");

    auto fieldFn = [this](const FieldDefinition& f) { return renderField(f); };

    switch (definition.kind) {
        case TypeKind::Object:
            result += "type " + definition.name;
            if (!definition.interfaces.empty()) {
                result += " implements " + joinNames(definition.interfaces, " & ");
            }
            result += renderBody(definition.fields, fieldFn);
            break;

        case TypeKind::InputObject:
            result += "input " + definition.name;
            result += renderBody(definition.inputFields,
                                 [this](const ArgumentDefinition& a) { return renderArgument(a); });
            break;

        case TypeKind::Interface:
            result += "interface " + definition.name;
            result += renderBody(definition.fields, fieldFn);
            break;

        case TypeKind::Enum:
            result += "enum " + definition.name;
            result += renderBody(definition.enumValues,
                                 [this](const EnumValueDefinition& v) { return renderEnumValue(v); });
            break;

        case TypeKind::Union:
            result += "union " + definition.name;
            if (!definition.possibleTypes.empty()) {
                result += " = " + joinNames(definition.possibleTypes, " | ");
            }
            break;

        case TypeKind::Scalar:
            result += "scalar " + definition.name;
            break;
    }

    return result;
}

std::string SdlRenderer::renderSchema(const SchemaModel& model) const {
    std::ostringstream oss;

    oss << "schema {\n"
        << kIndent << "query: " << model.getQueryTypeName() << "\n";
    if (model.getMutationTypeName()) {
        oss << kIndent << "mutation: " << *model.getMutationTypeName() << "\n";
    }
    if (model.getSubscriptionTypeName()) {
        oss << kIndent << "subscription: " << *model.getSubscriptionTypeName() << "\n";
    }
    oss << "}";

    for (const auto& type : model.types()) {
        oss << "\n\n" << renderType(type);
    }
    return oss.str();
}

std::string renderType(const TypeDefinition& definition) {
    return SdlRenderer().renderType(definition);
}

std::string renderField(const FieldDefinition& field) {
    return SdlRenderer().renderField(field);
}

} // namespace schema
} // namespace gqlevo
