#include <catch2/catch_test_macros.hpp>
#include "storage/SnapshotStorage.hpp"
#include "schema/SchemaErrors.hpp"
#include "evolution/CompatibilityScorer.hpp"
#include "SchemaFixtures.hpp"
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

using namespace gqlevo::storage;
using namespace fixtures;

// Helper to create a temporary database file
class TempDatabase {
public:
    TempDatabase() : m_path("/tmp/test_snapshot_storage_" +
                            std::to_string(std::rand()) + ".db") {}

    ~TempDatabase() {
        std::filesystem::remove(m_path);
    }

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

namespace {

std::string schemaWithUser(bool withName) {
    json fields = json::array({field("id", nonNull(named("ID")))});
    if (withName) {
        fields.push_back(field("name", named("String")));
    }
    return document(json::array({queryType(), objectType("User", fields)})).dump();
}

} // anonymous namespace

// =============================================================================
// Snapshot CRUD Tests
// =============================================================================

TEST_CASE("Save and retrieve snapshot", "[SnapshotStorage][CRUD]") {
    TempDatabase tempDb;
    SnapshotStorage db(tempDb.path());

    std::string doc = schemaWithUser(true);
    auto id = db.saveSnapshot("users-api", doc, std::string("v1"));

    auto snapshot = db.getSnapshot(id);
    REQUIRE(snapshot.has_value());
    REQUIRE(snapshot->id == id);
    REQUIRE(snapshot->schemaSlug == "users-api");
    REQUIRE(snapshot->versionName == std::optional<std::string>("v1"));
    REQUIRE(snapshot->documentJson == doc);
    REQUIRE(snapshot->typeCount == 2);
    REQUIRE_FALSE(snapshot->createdAt.empty());
}

TEST_CASE("Snapshot without version name", "[SnapshotStorage][CRUD]") {
    TempDatabase tempDb;
    SnapshotStorage db(tempDb.path());

    auto id = db.saveSnapshot("users-api", schemaWithUser(false));

    auto snapshot = db.getSnapshot(id);
    REQUIRE(snapshot.has_value());
    REQUIRE_FALSE(snapshot->versionName.has_value());
}

TEST_CASE("Missing snapshot", "[SnapshotStorage][CRUD]") {
    TempDatabase tempDb;
    SnapshotStorage db(tempDb.path());

    REQUIRE_FALSE(db.getSnapshot(42).has_value());
    REQUIRE_FALSE(db.getLatestSnapshot("nothing").has_value());
    REQUIRE(db.listSnapshots("nothing").empty());
    REQUIRE_THROWS_AS(db.loadModel(42), std::runtime_error);
    REQUIRE_THROWS_AS(db.deleteSnapshot(42), std::runtime_error);
}

TEST_CASE("Invalid documents are rejected", "[SnapshotStorage][CRUD]") {
    TempDatabase tempDb;
    SnapshotStorage db(tempDb.path());

    REQUIRE_THROWS_AS(db.saveSnapshot("api", "not json"), gqlevo::schema::InvalidIntrospectionDocument);
    REQUIRE_THROWS_AS(db.saveSnapshot("api", "{\"__schema\": {\"types\": []}}"),
                      gqlevo::schema::MissingQueryRoot);
    REQUIRE_THROWS_AS(db.saveSnapshot("", schemaWithUser(true)), std::invalid_argument);
    REQUIRE(db.listSchemas().empty());
}

// =============================================================================
// History Tests
// =============================================================================

TEST_CASE("Snapshots are listed in capture order", "[SnapshotStorage][History]") {
    TempDatabase tempDb;
    SnapshotStorage db(tempDb.path());

    auto first = db.saveSnapshot("users-api", schemaWithUser(false), std::string("v1"));
    auto second = db.saveSnapshot("users-api", schemaWithUser(true), std::string("v2"));
    db.saveSnapshot("other-api", schemaWithUser(true));

    auto snapshots = db.listSnapshots("users-api");
    REQUIRE(snapshots.size() == 2);
    REQUIRE(snapshots[0].id == first);
    REQUIRE(snapshots[1].id == second);

    auto latest = db.getLatestSnapshot("users-api");
    REQUIRE(latest.has_value());
    REQUIRE(latest->versionName == std::optional<std::string>("v2"));
}

TEST_CASE("List schemas", "[SnapshotStorage][History]") {
    TempDatabase tempDb;
    SnapshotStorage db(tempDb.path());

    db.saveSnapshot("b-api", schemaWithUser(false));
    db.saveSnapshot("a-api", schemaWithUser(false));
    db.saveSnapshot("a-api", schemaWithUser(true));

    auto schemas = db.listSchemas();
    REQUIRE(schemas.size() == 2);
    REQUIRE(schemas[0].schemaSlug == "a-api");
    REQUIRE(schemas[0].snapshotCount == 2);
    REQUIRE(schemas[1].schemaSlug == "b-api");
    REQUIRE(schemas[1].snapshotCount == 1);
    REQUIRE(schemas[0].firstCapturedAt <= schemas[0].lastCapturedAt);
}

TEST_CASE("Load history and track evolution", "[SnapshotStorage][History]") {
    TempDatabase tempDb;
    SnapshotStorage db(tempDb.path());

    db.saveSnapshot("users-api", schemaWithUser(false));
    db.saveSnapshot("users-api", schemaWithUser(true));
    db.saveSnapshot("users-api", schemaWithUser(false));

    auto history = db.loadHistory("users-api");
    REQUIRE(history.size() == 3);
    REQUIRE(history[1].findType("User")->findField("name") != nullptr);

    auto metrics = gqlevo::evolution::CompatibilityScorer::trackEvolution(history);
    REQUIRE(metrics.size() == 2);
    REQUIRE(metrics[0].score == 1.0);
    REQUIRE(metrics[1].score == 0.0);
}

TEST_CASE("Load a single model", "[SnapshotStorage][History]") {
    TempDatabase tempDb;
    SnapshotStorage db(tempDb.path());

    auto id = db.saveSnapshot("users-api", schemaWithUser(true));
    auto model = db.loadModel(id);

    REQUIRE(model.getQueryTypeName() == "Query");
    REQUIRE(model.hasType("User"));
}

// =============================================================================
// Delete Tests
// =============================================================================

TEST_CASE("Delete snapshot and schema", "[SnapshotStorage][Delete]") {
    TempDatabase tempDb;
    SnapshotStorage db(tempDb.path());

    auto id = db.saveSnapshot("users-api", schemaWithUser(false));
    db.saveSnapshot("users-api", schemaWithUser(true));
    db.saveSnapshot("users-api", schemaWithUser(true));

    db.deleteSnapshot(id);
    REQUIRE_FALSE(db.getSnapshot(id).has_value());
    REQUIRE(db.listSnapshots("users-api").size() == 2);

    REQUIRE(db.deleteSchema("users-api") == 2);
    REQUIRE(db.listSnapshots("users-api").empty());
    REQUIRE(db.deleteSchema("users-api") == 0);
}

TEST_CASE("Snapshots persist across connections", "[SnapshotStorage][Persistence]") {
    TempDatabase tempDb;
    int64_t id = 0;
    {
        SnapshotStorage db(tempDb.path());
        id = db.saveSnapshot("users-api", schemaWithUser(true));
    }

    SnapshotStorage reopened(tempDb.path());
    REQUIRE(reopened.getDbPath() == tempDb.path());
    REQUIRE(reopened.getSnapshot(id).has_value());
}
