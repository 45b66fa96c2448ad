#pragma once

#include "storage/SnapshotMetadata.hpp"
#include "schema/SchemaModel.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gqlevo {
namespace storage {

/**
 * SQLite-based store of introspection snapshots, versioned per schema.
 *
 * Documents are validated by building a model before being stored, so every
 * stored snapshot loads back into a SchemaModel.
 *
 * Usage:
 *   SnapshotStorage db("./schema_snapshots.db");
 *   db.saveSnapshot("billing-api", documentJson, "v1");
 *   db.saveSnapshot("billing-api", laterJson, "v2");
 *   auto metrics = CompatibilityScorer::trackEvolution(db.loadHistory("billing-api"));
 */
class SnapshotStorage {
public:
    /**
     * Open or create a SQLite database at the given path
     */
    explicit SnapshotStorage(const std::string& dbPath);
    ~SnapshotStorage();

    // Non-copyable
    SnapshotStorage(const SnapshotStorage&) = delete;
    SnapshotStorage& operator=(const SnapshotStorage&) = delete;

    // Movable
    SnapshotStorage(SnapshotStorage&&) noexcept;
    SnapshotStorage& operator=(SnapshotStorage&&) noexcept;

    // === Snapshots ===

    /**
     * Validate and store a document, returns the snapshot ID.
     * Throws the builder's SchemaError if the document is invalid.
     */
    int64_t saveSnapshot(const std::string& schemaSlug,
                         const std::string& documentJson,
                         const std::optional<std::string>& versionName = std::nullopt);

    std::optional<SchemaSnapshot> getSnapshot(int64_t snapshotId);
    std::optional<SchemaSnapshot> getLatestSnapshot(const std::string& schemaSlug);

    /**
     * Snapshots of a schema, oldest first
     */
    std::vector<SchemaSnapshot> listSnapshots(const std::string& schemaSlug);

    std::vector<SchemaHistoryInfo> listSchemas();

    void deleteSnapshot(int64_t snapshotId);

    /**
     * Delete every snapshot of a schema, returns how many were removed
     */
    size_t deleteSchema(const std::string& schemaSlug);

    // === Models ===

    /**
     * Build the model of a stored snapshot
     * Throws std::runtime_error if the snapshot doesn't exist
     */
    schema::SchemaModel loadModel(int64_t snapshotId);

    /**
     * Models of every snapshot of a schema, oldest first
     */
    std::vector<schema::SchemaModel> loadHistory(const std::string& schemaSlug);

    const std::string& getDbPath() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace storage
} // namespace gqlevo
