#include "schema/TypeRef.hpp"
#include "schema/SchemaErrors.hpp"
#include <cctype>
#include <stdexcept>

namespace gqlevo {
namespace schema {

namespace {

std::string withContext(const std::string& context, const std::string& message) {
    return context.empty() ? message : context + ": " + message;
}

bool isNameStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Walks from the outermost node to the Named leaf
std::vector<const TypeRef*> chainOf(const TypeRef& ref) {
    std::vector<const TypeRef*> chain;
    const TypeRef* current = &ref;
    while (!current->isNamed()) {
        chain.push_back(current);
        current = &current->getOfType();
    }
    chain.push_back(current);
    return chain;
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

TypeRef::TypeRef(Kind kind, std::string name, std::shared_ptr<TypeRef> ofType)
    : m_kind(kind), m_name(std::move(name)), m_ofType(std::move(ofType)) {}

TypeRef::~TypeRef() {
    // Detach each child before its parent goes, so no node frees a chain below it
    std::shared_ptr<TypeRef> next = std::move(m_ofType);
    while (next && next.use_count() == 1) {
        std::shared_ptr<TypeRef> child = std::move(next->m_ofType);
        next = std::move(child);
    }
}

TypeRef TypeRef::named(const std::string& name) {
    if (name.empty()) {
        throw MalformedTypeRef("named type has an empty name");
    }
    return TypeRef(Kind::Named, name, nullptr);
}

TypeRef TypeRef::list(TypeRef inner) {
    return TypeRef(Kind::List, "", std::make_shared<TypeRef>(std::move(inner)));
}

TypeRef TypeRef::nonNull(TypeRef inner) {
    if (inner.isNonNull()) {
        throw MalformedTypeRef("NON_NULL directly wraps NON_NULL");
    }
    return TypeRef(Kind::NonNull, "", std::make_shared<TypeRef>(std::move(inner)));
}

TypeRef TypeRef::resolve(const json& node, const std::string& context) {
    std::vector<Kind> wrappers;
    const json* current = &node;

    while (true) {
        if (!current->is_object()) {
            throw MalformedTypeRef(withContext(context, "type node is not an object"));
        }

        std::string kind;
        auto kindIt = current->find("kind");
        if (kindIt != current->end() && kindIt->is_string()) {
            kind = kindIt->get<std::string>();
        }

        if (kind == "NON_NULL" || kind == "LIST") {
            auto ofIt = current->find("ofType");
            if (ofIt == current->end() || ofIt->is_null()) {
                throw MalformedTypeRef(withContext(context, kind + " node has no ofType"));
            }
            wrappers.push_back(kind == "LIST" ? Kind::List : Kind::NonNull);
            current = &*ofIt;
            continue;
        }

        auto nameIt = current->find("name");
        if (nameIt == current->end() || !nameIt->is_string() ||
            nameIt->get<std::string>().empty()) {
            throw MalformedTypeRef(withContext(context, "named type node has no name"));
        }

        TypeRef result = named(nameIt->get<std::string>());
        for (auto it = wrappers.rbegin(); it != wrappers.rend(); ++it) {
            if (*it == Kind::List) {
                result = list(std::move(result));
            } else if (result.isNonNull()) {
                throw MalformedTypeRef(withContext(context, "NON_NULL directly wraps NON_NULL"));
            } else {
                result = nonNull(std::move(result));
            }
        }
        return result;
    }
}

TypeRef TypeRef::parse(const std::string& text) {
    size_t pos = 0;
    size_t depth = 0;
    while (pos < text.size() && text[pos] == '[') {
        ++depth;
        ++pos;
    }

    if (pos >= text.size() || !isNameStart(text[pos])) {
        throw MalformedTypeRef("expected a type name in '" + text + "'");
    }
    size_t nameStart = pos;
    while (pos < text.size() && isNameChar(text[pos])) {
        ++pos;
    }

    TypeRef result = named(text.substr(nameStart, pos - nameStart));
    if (pos < text.size() && text[pos] == '!') {
        result = nonNull(std::move(result));
        ++pos;
    }

    for (size_t level = 0; level < depth; ++level) {
        if (pos >= text.size() || text[pos] != ']') {
            throw MalformedTypeRef("unbalanced brackets in '" + text + "'");
        }
        ++pos;
        result = list(std::move(result));
        if (pos < text.size() && text[pos] == '!') {
            result = nonNull(std::move(result));
            ++pos;
        }
    }

    if (pos != text.size()) {
        throw MalformedTypeRef("unexpected '" + text.substr(pos) + "' in '" + text + "'");
    }
    return result;
}

// =============================================================================
// Accessors
// =============================================================================

const TypeRef& TypeRef::getOfType() const {
    if (!m_ofType) {
        throw std::logic_error("Named type reference '" + m_name + "' has no ofType");
    }
    return *m_ofType;
}

const std::string& TypeRef::baseName() const {
    const TypeRef* current = this;
    while (!current->isNamed()) {
        current = current->m_ofType.get();
    }
    return current->m_name;
}

size_t TypeRef::listDepth() const {
    size_t depth = 0;
    for (const TypeRef* current = this; !current->isNamed(); current = current->m_ofType.get()) {
        if (current->isList()) {
            ++depth;
        }
    }
    return depth;
}

std::string TypeRef::render() const {
    auto chain = chainOf(*this);

    std::string prefix;
    std::string suffix;
    for (const TypeRef* node : chain) {
        if (node->isList()) prefix += '[';
    }
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        if ((*it)->isList()) suffix += ']';
        else if ((*it)->isNonNull()) suffix += '!';
    }
    return prefix + chain.back()->m_name + suffix;
}

json TypeRef::toJson() const {
    auto chain = chainOf(*this);

    const std::string& name = chain.back()->m_name;
    json result = {
        {"kind", ScalarCatalog::isBuiltinScalar(name) ? "SCALAR" : "OBJECT"},
        {"name", name},
        {"ofType", nullptr}
    };

    for (auto it = chain.rbegin() + 1; it != chain.rend(); ++it) {
        json wrapper = {
            {"kind", (*it)->isList() ? "LIST" : "NON_NULL"},
            {"name", nullptr}
        };
        wrapper["ofType"] = std::move(result);
        result = std::move(wrapper);
    }
    return result;
}

bool TypeRef::operator==(const TypeRef& other) const {
    const TypeRef* a = this;
    const TypeRef* b = &other;
    while (true) {
        if (a == b) return true;
        if (a->m_kind != b->m_kind) return false;
        if (a->isNamed()) return a->m_name == b->m_name;
        a = a->m_ofType.get();
        b = b->m_ofType.get();
    }
}

std::string render(const TypeRef& ref) {
    return ref.render();
}

const std::string& baseName(const TypeRef& ref) {
    return ref.baseName();
}

// =============================================================================
// ScalarCatalog
// =============================================================================

ScalarCatalog::ScalarCatalog()
    : m_custom(defaultCustomScalars().begin(), defaultCustomScalars().end()) {}

ScalarCatalog::ScalarCatalog(const std::vector<std::string>& customScalars)
    : m_custom(customScalars.begin(), customScalars.end()) {}

const std::set<std::string>& ScalarCatalog::builtinScalars() {
    static const std::set<std::string> builtins = {
        "String", "Int", "Float", "Boolean", "ID"
    };
    return builtins;
}

const std::vector<std::string>& ScalarCatalog::defaultCustomScalars() {
    static const std::vector<std::string> defaults = {
        "DateTime", "Date", "Time", "JSON", "Upload", "Long", "Decimal"
    };
    return defaults;
}

bool ScalarCatalog::isBuiltinScalar(const std::string& name) {
    return builtinScalars().count(name) > 0;
}

void ScalarCatalog::addCustomScalar(const std::string& name) {
    m_custom.insert(name);
}

bool ScalarCatalog::isScalarLike(const std::string& name) const {
    return isBuiltinScalar(name) || m_custom.count(name) > 0;
}

} // namespace schema
} // namespace gqlevo
