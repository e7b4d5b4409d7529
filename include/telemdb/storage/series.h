#pragma once

#include <optional>
#include <shared_mutex>

#include "telemdb/core/types.h"
#include "telemdb/storage/compactor.h"
#include "telemdb/storage/retention.h"

namespace telemdb {
namespace storage {

/**
 * @brief Points removed by one append
 */
struct AppendResult {
    size_t evicted = 0;     // retention and size rules
    size_t compacted = 0;   // compactor
};

/**
 * @brief All points sharing one series key, in insertion order
 *
 * Every mutation runs under the series lock, so insert, retention and
 * compaction on one series are serialized. Readers copy the point
 * references under a shared lock and work on the copy.
 */
class Series {
public:
    Series(core::SeriesID id, core::SeriesKey key);

    // Metadata accessors - No locking required as metadata is immutable
    core::SeriesID id() const { return id_; }
    const core::SeriesKey& key() const { return key_; }

    /**
     * @brief Append a point, then restore the invariants of this series only
     * @param compactor Compactor to run after retention, or nullptr to skip compaction
     */
    AppendResult append(core::PointPtr point,
                        const RetentionEnforcer& enforcer,
                        const Compactor* compactor,
                        core::Timestamp now);

    size_t enforce(const RetentionEnforcer& enforcer, core::Timestamp now);
    size_t compact(const Compactor& compactor);

    /**
     * @brief Replace the content, then apply retention
     * @return Number of points kept
     */
    size_t restore(core::PointList points, const RetentionEnforcer& enforcer, core::Timestamp now);

    void clear();

    // Storage state accessors - Locking required
    core::PointList points() const;
    size_t size() const;
    bool empty() const;
    std::optional<core::Timestamp> min_timestamp() const;
    std::optional<core::Timestamp> max_timestamp() const;

private:
    size_t compact_locked(const Compactor& compactor);

    const core::SeriesID id_;
    const core::SeriesKey key_;
    core::PointList points_;
    mutable std::shared_mutex mutex_;
};

} // namespace storage
} // namespace telemdb
