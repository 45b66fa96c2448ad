#pragma once

#include <stdexcept>
#include <string>

namespace gqlevo {
namespace schema {

/**
 * Base class for every error raised while turning an introspection
 * document into a SchemaModel or while analyzing model snapshots.
 */
class SchemaError : public std::runtime_error {
public:
    explicit SchemaError(const std::string& message)
        : std::runtime_error(message) {}
};

// A type reference node lacks the inner type or the name it needs
class MalformedTypeRef : public SchemaError {
public:
    explicit MalformedTypeRef(const std::string& message)
        : SchemaError("Malformed type reference: " + message) {}
};

class MissingQueryRoot : public SchemaError {
public:
    MissingQueryRoot()
        : SchemaError("Introspection document has no query root type name") {}
};

class UnknownTypeKind : public SchemaError {
public:
    UnknownTypeKind(const std::string& typeName, const std::string& kind)
        : SchemaError("Unknown kind '" + kind + "' for type '" + typeName + "'"),
          m_typeName(typeName), m_kind(kind) {}

    const std::string& typeName() const { return m_typeName; }
    const std::string& kind() const { return m_kind; }

private:
    std::string m_typeName;
    std::string m_kind;
};

// Structural problems that are not about a single type reference
class InvalidIntrospectionDocument : public SchemaError {
public:
    explicit InvalidIntrospectionDocument(const std::string& message)
        : SchemaError("Invalid introspection document: " + message) {}
};

class InsufficientSnapshots : public SchemaError {
public:
    explicit InsufficientSnapshots(size_t count)
        : SchemaError("Evolution tracking needs at least 2 snapshots, got " +
                      std::to_string(count)),
          m_count(count) {}

    size_t count() const { return m_count; }

private:
    size_t m_count;
};

} // namespace schema
} // namespace gqlevo
