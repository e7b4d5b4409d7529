#ifndef TELEMDB_TELEMDB_H_
#define TELEMDB_TELEMDB_H_

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "telemdb/core/clock.h"
#include "telemdb/core/config.h"
#include "telemdb/core/result.h"
#include "telemdb/core/types.h"
#include "telemdb/query/query_engine.h"
#include "telemdb/storage/scheduler.h"
#include "telemdb/storage/snapshot.h"
#include "telemdb/storage/store.h"

namespace telemdb {

/**
 * @brief Embedded time-series database
 *
 * Owns the store, the query engine, the snapshot gateway and the background
 * scheduler. Typical lifecycle:
 * ```
 * TelemetryDB db(core::StoreConfig::Default());
 * auto opened = db.open();        // loads the snapshot, starts background jobs
 * db.insert("speed", {{"carId", "1"}}, {{"value", 287.5}});
 * auto avg = db.aggregate("speed", {}, 60000, "avg");
 * db.close();                     // stops jobs, writes a final snapshot
 * ```
 */
class TelemetryDB {
public:
    static constexpr const char* kCleanupJob = "cleanup";
    static constexpr const char* kSnapshotJob = "snapshot";

    explicit TelemetryDB(const core::StoreConfig& config,
                         std::shared_ptr<core::Clock> clock = core::DefaultClock());
    ~TelemetryDB();

    TelemetryDB(const TelemetryDB&) = delete;
    TelemetryDB& operator=(const TelemetryDB&) = delete;

    /**
     * @brief Validate the configuration, load the snapshot and register jobs
     *
     * The scheduler thread is started only when enable_background_tasks is set.
     * A snapshot that fails to load is logged and the database starts empty.
     */
    core::Result<void> open();

    /**
     * @brief Stop background jobs and write a final snapshot
     *
     * Safe to call more than once; also invoked by the destructor.
     */
    core::Result<void> close();

    bool is_open() const { return open_.load(); }

    bool insert(const std::string& measurement,
                const core::Tags::Map& tags,
                const core::Fields& fields,
                std::optional<core::Timestamp> timestamp = std::nullopt);
    size_t insert_batch(const std::vector<storage::PointRecord>& records);

    core::PointList query(const std::string& measurement,
                          const core::Tags::Map& tags = {},
                          std::optional<core::Duration> time_range_ms = std::nullopt,
                          size_t limit = query::QueryEngine::kDefaultLimit) const;

    std::optional<query::AggregateValue> aggregate(const query::AggregateRequest& request) const;
    std::optional<query::AggregateValue> aggregate(const std::string& measurement,
                                                   const core::Tags::Map& tags = {},
                                                   std::optional<core::Duration> time_range_ms = std::nullopt,
                                                   const std::string& fn = "avg",
                                                   std::optional<std::string> group_by = std::nullopt,
                                                   const std::string& field = "value") const;

    core::Result<storage::SnapshotStats> snapshot();
    core::Result<storage::SnapshotStats> load();

    storage::StoreStats stats() const { return store_.stats(); }
    storage::CleanupReport cleanup() { return store_.cleanup(); }
    size_t compact_all() { return store_.compact_all(); }
    void clear() { store_.clear(); }

    core::Result<void> set_retention_period(core::Duration retention_ms);
    core::Result<void> set_max_points_per_series(size_t max_points);
    void set_compression_enabled(bool enabled) { store_.set_compression_enabled(enabled); }

    const core::StoreConfig& config() const { return config_; }
    storage::Store& store() { return store_; }
    const query::QueryEngine& queries() const { return queries_; }
    storage::Scheduler& scheduler() { return scheduler_; }
    storage::SnapshotGateway& persistence() { return persistence_; }

private:
    core::StoreConfig config_;
    storage::Store store_;
    query::QueryEngine queries_;
    storage::SnapshotGateway persistence_;
    storage::Scheduler scheduler_;
    std::atomic<bool> open_{false};
    bool jobs_registered_ = false;
};

} // namespace telemdb

#endif // TELEMDB_TELEMDB_H_
