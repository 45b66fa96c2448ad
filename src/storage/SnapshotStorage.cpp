#include "storage/SnapshotStorage.hpp"
#include "schema/SchemaModelBuilder.hpp"
#include "common/Logger.hpp"
#include <sqlite3.h>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace gqlevo {
namespace storage {

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

/**
 * Get current UTC timestamp in ISO 8601 format
 */
std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

/**
 * RAII wrapper for SQLite prepared statements
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : m_stmt(nullptr) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &m_stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error("Failed to prepare statement: " +
                                     std::string(sqlite3_errmsg(db)));
        }
    }

    ~Statement() {
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bindText(int index, const std::string& value) {
        sqlite3_bind_text(m_stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bindOptionalText(int index, const std::optional<std::string>& value) {
        if (value) {
            bindText(index, *value);
        } else {
            sqlite3_bind_null(m_stmt, index);
        }
    }

    void bindInt64(int index, int64_t value) {
        sqlite3_bind_int64(m_stmt, index, value);
    }

    bool step() {
        int result = sqlite3_step(m_stmt);
        if (result == SQLITE_ROW) return true;
        if (result == SQLITE_DONE) return false;
        throw std::runtime_error("Step failed: " +
                                 std::string(sqlite3_errmsg(sqlite3_db_handle(m_stmt))));
    }

    std::string getText(int col) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, col));
        return text ? text : "";
    }

    std::optional<std::string> getOptionalText(int col) {
        if (sqlite3_column_type(m_stmt, col) == SQLITE_NULL) {
            return std::nullopt;
        }
        return getText(col);
    }

    int64_t getInt64(int col) {
        return sqlite3_column_int64(m_stmt, col);
    }

private:
    sqlite3_stmt* m_stmt;
};

const char* kSnapshotColumns =
    "SELECT id, schema_slug, version_name, document_json, type_count, created_at "
    "FROM schema_snapshots ";

SchemaSnapshot readSnapshot(Statement& stmt) {
    SchemaSnapshot snapshot;
    snapshot.id = stmt.getInt64(0);
    snapshot.schemaSlug = stmt.getText(1);
    snapshot.versionName = stmt.getOptionalText(2);
    snapshot.documentJson = stmt.getText(3);
    snapshot.typeCount = static_cast<size_t>(stmt.getInt64(4));
    snapshot.createdAt = stmt.getText(5);
    return snapshot;
}

} // anonymous namespace

// =============================================================================
// SnapshotStorage::Impl
// =============================================================================

class SnapshotStorage::Impl {
public:
    explicit Impl(const std::string& dbPath) : m_dbPath(dbPath), m_db(nullptr) {
        if (sqlite3_open(dbPath.c_str(), &m_db) != SQLITE_OK) {
            std::string error = m_db ? sqlite3_errmsg(m_db) : "out of memory";
            if (m_db) {
                sqlite3_close(m_db);
            }
            throw std::runtime_error("Failed to open database: " + error);
        }

        createTables();
    }

    ~Impl() {
        if (m_db) {
            sqlite3_close(m_db);
        }
    }

    void exec(const std::string& sql) {
        char* errMsg = nullptr;
        if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string error = errMsg ? errMsg : "Unknown error";
            sqlite3_free(errMsg);
            throw std::runtime_error("SQL error: " + error);
        }
    }

    void createTables() {
        exec(R"(
            CREATE TABLE IF NOT EXISTS schema_snapshots (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                schema_slug TEXT NOT NULL,
                version_name TEXT,
                document_json TEXT NOT NULL,
                type_count INTEGER NOT NULL DEFAULT 0,
                created_at TEXT NOT NULL
            )
        )");

        exec("CREATE INDEX IF NOT EXISTS idx_snapshots_schema ON schema_snapshots(schema_slug, id)");
    }

    // === Snapshots ===

    int64_t saveSnapshot(const std::string& schemaSlug,
                         const std::string& documentJson,
                         const std::optional<std::string>& versionName) {
        if (schemaSlug.empty()) {
            throw std::invalid_argument("Schema slug must not be empty");
        }

        // Rejects invalid documents before anything is written
        auto model = schema::SchemaModelBuilder::fromString(documentJson);

        Statement stmt(m_db,
            "INSERT INTO schema_snapshots (schema_slug, version_name, document_json, type_count, created_at) "
            "VALUES (?, ?, ?, ?, ?)");

        stmt.bindText(1, schemaSlug);
        stmt.bindOptionalText(2, versionName);
        stmt.bindText(3, documentJson);
        stmt.bindInt64(4, static_cast<int64_t>(model.typeCount()));
        stmt.bindText(5, currentTimestamp());
        stmt.step();

        int64_t id = sqlite3_last_insert_rowid(m_db);
        LOG_INFO("Saved snapshot " + std::to_string(id) + " of schema '" + schemaSlug + "' (" +
                 std::to_string(model.typeCount()) + " types)");
        return id;
    }

    std::optional<SchemaSnapshot> getSnapshot(int64_t snapshotId) {
        Statement stmt(m_db, std::string(kSnapshotColumns) + "WHERE id = ?");
        stmt.bindInt64(1, snapshotId);

        if (!stmt.step()) {
            return std::nullopt;
        }
        return readSnapshot(stmt);
    }

    std::optional<SchemaSnapshot> getLatestSnapshot(const std::string& schemaSlug) {
        Statement stmt(m_db, std::string(kSnapshotColumns) +
                             "WHERE schema_slug = ? ORDER BY id DESC LIMIT 1");
        stmt.bindText(1, schemaSlug);

        if (!stmt.step()) {
            return std::nullopt;
        }
        return readSnapshot(stmt);
    }

    std::vector<SchemaSnapshot> listSnapshots(const std::string& schemaSlug) {
        Statement stmt(m_db, std::string(kSnapshotColumns) +
                             "WHERE schema_slug = ? ORDER BY id ASC");
        stmt.bindText(1, schemaSlug);

        std::vector<SchemaSnapshot> result;
        while (stmt.step()) {
            result.push_back(readSnapshot(stmt));
        }
        return result;
    }

    std::vector<SchemaHistoryInfo> listSchemas() {
        Statement stmt(m_db,
            "SELECT schema_slug, COUNT(*), MIN(created_at), MAX(created_at) "
            "FROM schema_snapshots GROUP BY schema_slug ORDER BY schema_slug");

        std::vector<SchemaHistoryInfo> result;
        while (stmt.step()) {
            SchemaHistoryInfo info;
            info.schemaSlug = stmt.getText(0);
            info.snapshotCount = static_cast<size_t>(stmt.getInt64(1));
            info.firstCapturedAt = stmt.getText(2);
            info.lastCapturedAt = stmt.getText(3);
            result.push_back(info);
        }
        return result;
    }

    void deleteSnapshot(int64_t snapshotId) {
        Statement stmt(m_db, "DELETE FROM schema_snapshots WHERE id = ?");
        stmt.bindInt64(1, snapshotId);
        stmt.step();

        if (sqlite3_changes(m_db) == 0) {
            throw std::runtime_error("Snapshot not found: " + std::to_string(snapshotId));
        }
        LOG_INFO("Deleted snapshot " + std::to_string(snapshotId));
    }

    size_t deleteSchema(const std::string& schemaSlug) {
        Statement stmt(m_db, "DELETE FROM schema_snapshots WHERE schema_slug = ?");
        stmt.bindText(1, schemaSlug);
        stmt.step();

        auto removed = static_cast<size_t>(sqlite3_changes(m_db));
        LOG_INFO("Deleted " + std::to_string(removed) + " snapshots of schema '" + schemaSlug + "'");
        return removed;
    }

    const std::string& getDbPath() const { return m_dbPath; }

private:
    std::string m_dbPath;
    sqlite3* m_db;
};

// =============================================================================
// SnapshotStorage Public Interface
// =============================================================================

SnapshotStorage::SnapshotStorage(const std::string& dbPath)
    : m_impl(std::make_unique<Impl>(dbPath)) {}

SnapshotStorage::~SnapshotStorage() = default;

SnapshotStorage::SnapshotStorage(SnapshotStorage&&) noexcept = default;
SnapshotStorage& SnapshotStorage::operator=(SnapshotStorage&&) noexcept = default;

int64_t SnapshotStorage::saveSnapshot(const std::string& schemaSlug,
                                      const std::string& documentJson,
                                      const std::optional<std::string>& versionName) {
    return m_impl->saveSnapshot(schemaSlug, documentJson, versionName);
}

std::optional<SchemaSnapshot> SnapshotStorage::getSnapshot(int64_t snapshotId) {
    return m_impl->getSnapshot(snapshotId);
}

std::optional<SchemaSnapshot> SnapshotStorage::getLatestSnapshot(const std::string& schemaSlug) {
    return m_impl->getLatestSnapshot(schemaSlug);
}

std::vector<SchemaSnapshot> SnapshotStorage::listSnapshots(const std::string& schemaSlug) {
    return m_impl->listSnapshots(schemaSlug);
}

std::vector<SchemaHistoryInfo> SnapshotStorage::listSchemas() {
    return m_impl->listSchemas();
}

void SnapshotStorage::deleteSnapshot(int64_t snapshotId) {
    m_impl->deleteSnapshot(snapshotId);
}

size_t SnapshotStorage::deleteSchema(const std::string& schemaSlug) {
    return m_impl->deleteSchema(schemaSlug);
}

schema::SchemaModel SnapshotStorage::loadModel(int64_t snapshotId) {
    auto snapshot = m_impl->getSnapshot(snapshotId);
    if (!snapshot) {
        throw std::runtime_error("Snapshot not found: " + std::to_string(snapshotId));
    }
    return schema::SchemaModelBuilder::fromString(snapshot->documentJson);
}

std::vector<schema::SchemaModel> SnapshotStorage::loadHistory(const std::string& schemaSlug) {
    std::vector<schema::SchemaModel> models;
    for (const auto& snapshot : m_impl->listSnapshots(schemaSlug)) {
        models.push_back(schema::SchemaModelBuilder::fromString(snapshot.documentJson));
    }
    return models;
}

const std::string& SnapshotStorage::getDbPath() const {
    return m_impl->getDbPath();
}

} // namespace storage
} // namespace gqlevo
