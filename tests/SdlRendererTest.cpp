#include <catch2/catch_test_macros.hpp>
#include "schema/SdlRenderer.hpp"
#include "SchemaFixtures.hpp"

using namespace gqlevo::schema;
using namespace fixtures;

// =============================================================================
// Types
// =============================================================================

TEST_CASE("Render object type", "[SdlRenderer]") {
    auto model = fixtures::model({
        objectType("User", json::array({
            field("id", nonNull(named("ID"))),
            field("posts", listOf(named("Post", "OBJECT")))
        })),
        objectType("Post", json::array({field("id", named("ID"))}))
    });

    REQUIRE(renderType(*model.findType("User")) ==
            "type User {\n  id: ID!\n  posts: [Post]\n}");
}

TEST_CASE("Render object implementing interfaces", "[SdlRenderer]") {
    auto model = fixtures::model({
        objectType("User", json::array({field("id", nonNull(named("ID")))}), {"Node", "Timestamped"})
    });

    REQUIRE(renderType(*model.findType("User")) ==
            "type User implements Node & Timestamped {\n  id: ID!\n}");
}

TEST_CASE("Render every kind", "[SdlRenderer]") {
    json input = {{"kind", "INPUT_OBJECT"}, {"name", "UserInput"},
                  {"inputFields", json::array({
                      arg("name", nonNull(named("String"))),
                      arg("role", named("Role", "ENUM"), "USER")
                  })}};
    json iface = {{"kind", "INTERFACE"}, {"name", "Node"},
                  {"fields", json::array({field("id", nonNull(named("ID")))})}};
    json unionType = {{"kind", "UNION"}, {"name", "SearchResult"},
                      {"possibleTypes", json::array({named("User", "OBJECT"), named("Post", "OBJECT")})}};

    auto model = fixtures::model({
        input, iface, unionType,
        enumType("Role", {"ADMIN", "USER"}),
        scalarType("DateTime")
    });

    REQUIRE(renderType(*model.findType("UserInput")) ==
            "input UserInput {\n  name: String!\n  role: Role = USER\n}");
    REQUIRE(renderType(*model.findType("Node")) == "interface Node {\n  id: ID!\n}");
    REQUIRE(renderType(*model.findType("SearchResult")) == "union SearchResult = User | Post");
    REQUIRE(renderType(*model.findType("Role")) == "enum Role {\n  ADMIN\n  USER\n}");
    REQUIRE(renderType(*model.findType("DateTime")) == "scalar DateTime");
}

TEST_CASE("Empty member list renders header only", "[SdlRenderer]") {
    auto model = fixtures::model({objectType("Empty", json::array())});
    REQUIRE(renderType(*model.findType("Empty")) == "type Empty");
}

// =============================================================================
// Fields
// =============================================================================

TEST_CASE("Render field with arguments and defaults", "[SdlRenderer]") {
    auto model = fixtures::model({objectType("User", json::array({
        field("posts", nonNull(listOf(nonNull(named("Post", "OBJECT")))), json::array({
            arg("first", named("Int"), "10"),
            arg("orderBy", named("String"), "\"createdAt\""),
            arg("after", named("String"))
        }))
    })), objectType("Post", json::array({field("id", named("ID"))}))});

    REQUIRE(renderField(model.findType("User")->fields[0]) ==
            "posts(first: Int = 10, orderBy: String = \"createdAt\", after: String): [Post!]!");
}

TEST_CASE("Default values are emitted unmodified", "[SdlRenderer]") {
    auto model = fixtures::model({objectType("Q", json::array({
        field("search", named("String"), json::array({
            arg("filter", named("Filter", "INPUT_OBJECT"), "{status: ACTIVE, tags: [\"a\", \"b\"]}")
        }))
    }))});

    REQUIRE(renderField(model.findType("Q")->fields[0]) ==
            "search(filter: Filter = {status: ACTIVE, tags: [\"a\", \"b\"]}): String");
}

// =============================================================================
// Options
// =============================================================================

TEST_CASE("Descriptions and deprecations are opt-in", "[SdlRenderer][Options]") {
    json old = field("oldName", named("String"));
    old["isDeprecated"] = true;
    old["deprecationReason"] = "Use \"name\"";
    old["description"] = "Former name";

    json gone = field("gone", named("String"));
    gone["isDeprecated"] = true;

    json type = objectType("User", json::array({old, gone}));
    type["description"] = "A user";

    auto model = fixtures::model({type});
    const auto& user = *model.findType("User");

    REQUIRE(renderType(user) == "type User {\n  oldName: String\n  gone: String\n}");

    RenderOptions options;
    options.includeDescriptions = true;
    options.includeDeprecations = true;
    SdlRenderer renderer(options);

    REQUIRE(renderer.renderType(user) ==
            "\"\"\"A user\"\"\"\n"
            "type User {\n"
            "  \"\"\"Former name\"\"\"\n"
            "  oldName: String @deprecated(reason: \"Use \\\"name\\\"\")\n"
            "  gone: String @deprecated\n"
            "}");
}

TEST_CASE("Triple quotes in descriptions are escaped", "[SdlRenderer][Options]") {
    json type = scalarType("Markdown");
    type["description"] = "Wrap code in \"\"\" fences";
    json quotedEnd = scalarType("Quote");
    quotedEnd["description"] = "Says \"hi\"";

    auto model = fixtures::model({type, quotedEnd});
    RenderOptions options;
    options.includeDescriptions = true;
    SdlRenderer renderer(options);

    REQUIRE(renderer.renderType(*model.findType("Markdown")) ==
            "\"\"\"Wrap code in \\\"\"\" fences\"\"\"\nscalar Markdown");
    REQUIRE(renderer.renderType(*model.findType("Quote")) ==
            "\"\"\"Says \"hi\"\n\"\"\"\nscalar Quote");
}

// =============================================================================
// Whole schema
// =============================================================================

TEST_CASE("Render schema keeps model order", "[SdlRenderer][Schema]") {
    json types = json::array({
        queryType(json::array({field("me", named("User", "OBJECT"))})),
        objectType("User", json::array({field("id", nonNull(named("ID")))})),
        objectType("Mutation", json::array({field("logout", named("Boolean"))})),
        scalarType("ID")
    });
    auto model = SchemaModelBuilder::build(document(types, "Query", "Mutation"));

    REQUIRE(SdlRenderer().renderSchema(model) ==
            "schema {\n  query: Query\n  mutation: Mutation\n}\n\n"
            "type Query {\n  me: User\n}\n\n"
            "type User {\n  id: ID!\n}\n\n"
            "type Mutation {\n  logout: Boolean\n}\n\n"
            "scalar ID");
}

TEST_CASE("Rendering is stable across builds", "[SdlRenderer][Schema]") {
    auto build = [] {
        return fixtures::model({
            objectType("B", json::array({field("x", named("Int")), field("a", named("Int"))})),
            objectType("A", json::array({field("y", named("Int"))}))
        });
    };

    REQUIRE(SdlRenderer().renderSchema(build()) == SdlRenderer().renderSchema(build()));
}
