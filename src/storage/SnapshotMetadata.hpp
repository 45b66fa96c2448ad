#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace gqlevo {
namespace storage {

/**
 * One captured introspection document of a schema
 */
struct SchemaSnapshot {
    int64_t id = 0;                          // Auto-incremented, gives capture order
    std::string schemaSlug;                  // Which schema/endpoint this belongs to
    std::optional<std::string> versionName;  // Optional label (e.g. "v2.3", "before release")
    std::string documentJson;                // Raw introspection document
    size_t typeCount = 0;                    // Non-internal types at capture time
    std::string createdAt;                   // ISO 8601 timestamp
};

/**
 * Summary of the snapshots stored for one schema
 */
struct SchemaHistoryInfo {
    std::string schemaSlug;
    size_t snapshotCount = 0;
    std::string firstCapturedAt;
    std::string lastCapturedAt;
};

} // namespace storage
} // namespace gqlevo
