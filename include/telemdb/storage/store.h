#ifndef TELEMDB_STORAGE_STORE_H_
#define TELEMDB_STORAGE_STORE_H_

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "telemdb/core/clock.h"
#include "telemdb/core/config.h"
#include "telemdb/core/result.h"
#include "telemdb/core/types.h"
#include "telemdb/storage/index.h"

namespace telemdb {
namespace storage {

/**
 * @brief One insert request, used by insert_batch()
 */
struct PointRecord {
    std::string measurement;
    core::Tags::Map tags;
    core::Fields fields;
    std::optional<core::Timestamp> timestamp;
};

/**
 * @brief Result of a global retention sweep
 */
struct CleanupReport {
    size_t series_touched = 0;
    size_t points_removed = 0;
};

/**
 * @brief Store-wide statistics
 */
struct StoreStats {
    size_t series_count = 0;
    size_t total_points = 0;
    double average_points_per_series = 0.0;
    std::optional<core::Timestamp> oldest_timestamp;
    std::optional<core::Timestamp> newest_timestamp;
    core::Duration retention_period_ms = 0;
    size_t max_points_per_series = 0;
    bool compression_enabled = false;
};

/**
 * @brief Point references of one series taken at a single instant
 */
using SeriesSnapshot = std::pair<core::SeriesKey, core::PointList>;

/**
 * @brief Owner of every series and point
 *
 * Mutations are serialized per series. Readers receive copies of the point
 * reference lists and never hold a lock while filtering or reducing.
 */
class Store {
public:
    explicit Store(const core::StoreConfig& config,
                   std::shared_ptr<core::Clock> clock = core::DefaultClock());

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    /**
     * @brief Insert one point
     *
     * Creates the series on first use, appends, applies retention to that
     * series and, when compression is enabled, compacts it.
     *
     * @param timestamp Point time in ms; the clock's current time when absent
     * @return false on an empty measurement, an empty tag or field name, or a
     *         non-finite field value. Nothing is mutated in that case.
     */
    bool insert(const std::string& measurement,
                const core::Tags::Map& tags,
                const core::Fields& fields,
                std::optional<core::Timestamp> timestamp = std::nullopt);

    /**
     * @brief Insert several points
     * @return Number of accepted records
     */
    size_t insert_batch(const std::vector<PointRecord>& records);

    /**
     * @brief Apply size and age rules to every series
     *
     * Series that end up empty stay in the index.
     */
    CleanupReport cleanup();

    /**
     * @brief Run the compactor on one series
     * @return Number of points dropped
     */
    size_t compact(const core::SeriesKey& key);

    /**
     * @brief Run the compactor on every series
     * @return Number of points dropped
     */
    size_t compact_all();

    /**
     * @brief Drop every series and point
     */
    void clear();

    /**
     * @brief Replace the points of `key`, creating the series if needed
     *
     * Used by snapshot loading. Retention is applied to the restored points.
     * @return Number of points kept
     */
    size_t restore(const core::SeriesKey& key, core::PointList points);

    /**
     * @brief Point references of every series matching the filter
     */
    std::vector<SeriesSnapshot> select(const std::string& measurement, const core::Tags& filter) const;

    /**
     * @brief Point references of every series
     */
    std::vector<SeriesSnapshot> snapshot_all() const;

    StoreStats stats() const;

    core::Result<void> set_retention_period(core::Duration retention_ms);
    core::Result<void> set_max_points_per_series(size_t max_points);
    void set_compression_enabled(bool enabled);

    core::Duration retention_period() const { return retention_period_ms_.load(); }
    size_t max_points_per_series() const { return max_points_per_series_.load(); }
    bool compression_enabled() const { return compression_enabled_.load(); }
    double compression_threshold() const { return compression_threshold_; }

    const core::Clock& clock() const { return *clock_; }
    const SeriesIndex& index() const { return index_; }

private:
    RetentionEnforcer make_enforcer() const;

    SeriesIndex index_;
    std::shared_ptr<core::Clock> clock_;

    std::atomic<core::Duration> retention_period_ms_;
    std::atomic<size_t> max_points_per_series_;
    std::atomic<bool> compression_enabled_;
    const double compression_threshold_;
};

} // namespace storage
} // namespace telemdb

#endif // TELEMDB_STORAGE_STORE_H_
