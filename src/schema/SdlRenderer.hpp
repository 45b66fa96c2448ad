#pragma once

#include "schema/SchemaModel.hpp"
#include <string>

namespace gqlevo {
namespace schema {

struct RenderOptions {
    bool includeDescriptions = false;   // """text""" above types, fields and values
    bool includeDeprecations = false;   // @deprecated(reason: "...") after members
};

/**
 * Renders model definitions as schema definition language text.
 *
 * Canonical whitespace: two-space member indentation, "\n" line breaks,
 * no trailing newline after the closing brace. A type whose member list is
 * empty renders as its header only.
 *
 *   type User implements Node {
 *     id: ID!
 *     posts(first: Int = 10): [Post]
 *   }
 *
 * Types and members are emitted in model order, never re-sorted.
 */
class SdlRenderer {
public:
    explicit SdlRenderer(RenderOptions options = {});

    std::string renderType(const TypeDefinition& definition) const;
    std::string renderField(const FieldDefinition& field) const;
    std::string renderArgument(const ArgumentDefinition& argument) const;

    /**
     * schema { ... } block followed by every type, separated by blank lines
     */
    std::string renderSchema(const SchemaModel& model) const;

    const RenderOptions& getOptions() const { return m_options; }

private:
    std::string renderDescription(const std::optional<std::string>& description,
                                  const std::string& indent) const;
    std::string renderDeprecation(bool isDeprecated,
                                  const std::optional<std::string>& reason) const;
    std::string renderEnumValue(const EnumValueDefinition& value) const;

    template <typename Member, typename RenderFn>
    std::string renderBody(const std::vector<Member>& members, RenderFn renderMember) const;

    RenderOptions m_options;
};

// Default-option shortcuts
std::string renderType(const TypeDefinition& definition);
std::string renderField(const FieldDefinition& field);

} // namespace schema
} // namespace gqlevo
