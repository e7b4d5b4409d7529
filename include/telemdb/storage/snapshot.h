#ifndef TELEMDB_STORAGE_SNAPSHOT_H_
#define TELEMDB_STORAGE_SNAPSHOT_H_

#include <mutex>
#include <string>
#include <vector>

#include "telemdb/core/result.h"
#include "telemdb/storage/store.h"

namespace telemdb {
namespace storage {

/**
 * @brief Counts reported by the last successful snapshot or load
 */
struct SnapshotStats {
    size_t series = 0;
    size_t points = 0;
    size_t skipped = 0;  // malformed entries ignored on load
};

/**
 * @brief Writes the whole store to one JSON file and reads it back at startup
 *
 * File layout: one object mapping the canonical series key to an array of
 * points, each `{"timestamp": <ms>, "fields": {...}, "tags": {...}}`.
 * Writes go to `<path>.tmp` first and are renamed over the target, so a
 * reader never sees a partial file.
 *
 * Failures never touch the in-memory store; they are logged and returned.
 */
class SnapshotGateway {
public:
    SnapshotGateway(Store& store, std::string path);

    /**
     * @brief Serialize every series and atomically replace the snapshot file
     */
    core::Result<SnapshotStats> snapshot();

    /**
     * @brief Repopulate the store from the snapshot file
     *
     * A missing file is a cold start and succeeds with zero counts. A file that
     * does not parse leaves the store unchanged and returns an error.
     */
    core::Result<SnapshotStats> load();

    const std::string& path() const { return path_; }

    static std::string Serialize(const std::vector<SeriesSnapshot>& series);

    /**
     * @brief Parse a snapshot document
     * @param skipped Incremented for every malformed series or point
     */
    static core::Result<std::vector<SeriesSnapshot>> Deserialize(const std::string& json, size_t& skipped);

private:
    Store& store_;
    std::string path_;
    std::mutex write_mutex_;  // One writer at a time on the temp file
};

} // namespace storage
} // namespace telemdb

#endif // TELEMDB_STORAGE_SNAPSHOT_H_
