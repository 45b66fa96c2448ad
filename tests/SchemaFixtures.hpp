#pragma once

#include "schema/SchemaModelBuilder.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Helpers to write introspection documents inline in tests
namespace fixtures {

using json = nlohmann::json;

inline json named(const std::string& name, const std::string& kind = "SCALAR") {
    return {{"kind", kind}, {"name", name}, {"ofType", nullptr}};
}

inline json nonNull(json inner) {
    return {{"kind", "NON_NULL"}, {"name", nullptr}, {"ofType", std::move(inner)}};
}

inline json listOf(json inner) {
    return {{"kind", "LIST"}, {"name", nullptr}, {"ofType", std::move(inner)}};
}

inline json arg(const std::string& name, json type, json defaultValue = nullptr) {
    return {{"name", name}, {"description", nullptr}, {"type", std::move(type)},
            {"defaultValue", std::move(defaultValue)}};
}

inline json field(const std::string& name, json type, json args = json::array()) {
    return {{"name", name}, {"description", nullptr}, {"args", std::move(args)},
            {"type", std::move(type)}, {"isDeprecated", false}, {"deprecationReason", nullptr}};
}

inline json objectType(const std::string& name, json fields,
                       const std::vector<std::string>& interfaces = {}) {
    json ifaces = json::array();
    for (const auto& i : interfaces) {
        ifaces.push_back({{"kind", "INTERFACE"}, {"name", i}, {"ofType", nullptr}});
    }
    return {{"kind", "OBJECT"}, {"name", name}, {"description", nullptr},
            {"fields", std::move(fields)}, {"inputFields", nullptr},
            {"interfaces", std::move(ifaces)}, {"enumValues", nullptr},
            {"possibleTypes", nullptr}};
}

inline json enumType(const std::string& name, const std::vector<std::string>& values) {
    json valuesJson = json::array();
    for (const auto& v : values) {
        valuesJson.push_back({{"name", v}, {"description", nullptr},
                              {"isDeprecated", false}, {"deprecationReason", nullptr}});
    }
    return {{"kind", "ENUM"}, {"name", name}, {"description", nullptr},
            {"fields", nullptr}, {"enumValues", std::move(valuesJson)}};
}

inline json scalarType(const std::string& name) {
    return {{"kind", "SCALAR"}, {"name", name}, {"description", nullptr}};
}

// Wraps types in {data: {__schema: ...}} with the given query root
inline json document(json types, const std::string& queryType = "Query",
                     json mutationType = nullptr) {
    json mutation = mutationType.is_null() ? json(nullptr) : json{{"name", mutationType}};
    return {{"data", {{"__schema", {
        {"queryType", {{"name", queryType}}},
        {"mutationType", std::move(mutation)},
        {"subscriptionType", nullptr},
        {"types", std::move(types)}
    }}}}};
}

inline json queryType(json fields = json::array({field("ping", named("String"))})) {
    return objectType("Query", std::move(fields));
}

// Query root plus the given extra types
inline gqlevo::schema::SchemaModel model(std::vector<json> types) {
    json all = json::array({queryType()});
    for (auto& t : types) {
        all.push_back(std::move(t));
    }
    return gqlevo::schema::SchemaModelBuilder::build(document(std::move(all)));
}

} // namespace fixtures
