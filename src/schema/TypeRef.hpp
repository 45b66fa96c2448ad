#pragma once

#include <nlohmann/json.hpp>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace gqlevo {
namespace schema {

using json = nlohmann::json;

/**
 * Reference to a type as used by a field or an argument.
 *
 * Tagged union over three shapes:
 * - Named(name)     : `User`
 * - List(inner)     : `[inner]`
 * - NonNull(inner)  : `inner!`
 *
 * Wrappers nest without depth limit. Inner nodes are immutable and shared,
 * so copying a TypeRef never copies the chain.
 * A NonNull never directly wraps another NonNull.
 */
class TypeRef {
public:
    enum class Kind {
        Named,
        List,
        NonNull
    };

    // === Construction ===

    static TypeRef named(const std::string& name);
    static TypeRef list(TypeRef inner);

    /**
     * Throws MalformedTypeRef if inner is already NonNull
     */
    static TypeRef nonNull(TypeRef inner);

    /**
     * Build from an introspection node {kind, name, ofType}.
     * `context` prefixes error messages (e.g. "type 'User' field 'posts'").
     * Throws MalformedTypeRef when a wrapper has no ofType or a leaf has no name.
     */
    static TypeRef resolve(const json& node, const std::string& context = "");

    /**
     * Parse canonical wrapper text such as `[[Int!]]!`.
     * Throws MalformedTypeRef on anything that is not canonical.
     */
    static TypeRef parse(const std::string& text);

    // === Accessors ===

    Kind getKind() const { return m_kind; }
    bool isNamed() const { return m_kind == Kind::Named; }
    bool isList() const { return m_kind == Kind::List; }
    bool isNonNull() const { return m_kind == Kind::NonNull; }

    // Name of a Named node, empty for wrappers
    const std::string& getName() const { return m_name; }

    // Wrapped type of a List/NonNull node (throws std::logic_error on Named)
    const TypeRef& getOfType() const;

    // Innermost named type
    const std::string& baseName() const;

    // Number of List wrappers in the chain
    size_t listDepth() const;

    // Canonical text: `[String!]!`
    std::string render() const;

    // Introspection-shaped node, inverse of resolve()
    json toJson() const;

    TypeRef(const TypeRef&) = default;
    TypeRef(TypeRef&&) noexcept = default;
    TypeRef& operator=(const TypeRef&) = default;
    TypeRef& operator=(TypeRef&&) noexcept = default;

    // Releases the nodes this value solely owns one by one
    ~TypeRef();

    bool operator==(const TypeRef& other) const;
    bool operator!=(const TypeRef& other) const { return !(*this == other); }

private:
    TypeRef(Kind kind, std::string name, std::shared_ptr<TypeRef> ofType);

    Kind m_kind;
    std::string m_name;
    std::shared_ptr<TypeRef> m_ofType;  // Never modified once shared
};

// Free-function forms
std::string render(const TypeRef& ref);
const std::string& baseName(const TypeRef& ref);

/**
 * Built-in scalars plus a configurable allowlist of custom scalars.
 * The model builder consults it before reporting a type name as undeclared.
 */
class ScalarCatalog {
public:
    ScalarCatalog();
    explicit ScalarCatalog(const std::vector<std::string>& customScalars);

    static const std::set<std::string>& builtinScalars();
    static const std::vector<std::string>& defaultCustomScalars();
    static bool isBuiltinScalar(const std::string& name);

    void addCustomScalar(const std::string& name);
    bool isScalarLike(const std::string& name) const;

    const std::set<std::string>& customScalars() const { return m_custom; }

private:
    std::set<std::string> m_custom;
};

} // namespace schema
} // namespace gqlevo
