#include "telemdb/telemdb.h"
#include "telemdb/common/logger.h"

namespace telemdb {

TelemetryDB::TelemetryDB(const core::StoreConfig& config, std::shared_ptr<core::Clock> clock)
    : config_(config),
      store_(config_, clock),
      queries_(store_),
      persistence_(store_, config_.snapshot_path()),
      scheduler_(clock) {
}

TelemetryDB::~TelemetryDB() {
    if (open_.load()) {
        auto result = close();
        if (!result.ok()) {
            TELEMDB_ERROR("Error closing database: {}", result.error());
        }
    }
}

core::Result<void> TelemetryDB::open() {
    if (open_.load()) {
        return core::Result<void>::error("Database already open");
    }

    auto valid = config_.validate();
    if (!valid.ok()) {
        TELEMDB_ERROR("Invalid configuration: {}", valid.error());
        return valid;
    }

    auto loaded = persistence_.load();
    if (!loaded.ok()) {
        // The store is untouched by a failed load, so we start empty
        TELEMDB_WARN("Starting with an empty store: {}", loaded.error());
    }

    if (!jobs_registered_) {
        auto cleanup_job = scheduler_.add_job(kCleanupJob, config_.cleanup_interval_ms, [this]() {
            store_.cleanup();
            return core::Result<void>();
        });
        if (!cleanup_job.ok()) {
            return cleanup_job;
        }

        auto snapshot_job = scheduler_.add_job(kSnapshotJob, config_.persistence_interval_ms, [this]() {
            auto result = persistence_.snapshot();
            if (!result.ok()) {
                return core::Result<void>::error(result.error(), result.error_code());
            }
            return core::Result<void>();
        });
        if (!snapshot_job.ok()) {
            return snapshot_job;
        }
        jobs_registered_ = true;
    }

    if (config_.enable_background_tasks) {
        auto started = scheduler_.start();
        if (!started.ok()) {
            return started;
        }
    }

    open_.store(true);
    TELEMDB_INFO("Time-series database opened (data file: {}, retention: {}ms, max points: {})",
                 persistence_.path(), config_.retention_period_ms, config_.max_points_per_series);
    return core::Result<void>();
}

core::Result<void> TelemetryDB::close() {
    if (!open_.exchange(false)) {
        return core::Result<void>();
    }

    auto stopped = scheduler_.stop();
    if (!stopped.ok()) {
        TELEMDB_ERROR("Failed to stop scheduler: {}", stopped.error());
    }

    auto saved = persistence_.snapshot();
    if (!saved.ok()) {
        return core::Result<void>::error("Final snapshot failed: " + saved.error(), saved.error_code());
    }

    TELEMDB_INFO("Time-series database closed");
    return core::Result<void>();
}

bool TelemetryDB::insert(const std::string& measurement,
                         const core::Tags::Map& tags,
                         const core::Fields& fields,
                         std::optional<core::Timestamp> timestamp) {
    return store_.insert(measurement, tags, fields, timestamp);
}

size_t TelemetryDB::insert_batch(const std::vector<storage::PointRecord>& records) {
    return store_.insert_batch(records);
}

core::PointList TelemetryDB::query(const std::string& measurement,
                                   const core::Tags::Map& tags,
                                   std::optional<core::Duration> time_range_ms,
                                   size_t limit) const {
    return queries_.query(measurement, tags, time_range_ms, limit);
}

std::optional<query::AggregateValue> TelemetryDB::aggregate(const query::AggregateRequest& request) const {
    return queries_.aggregate(request);
}

std::optional<query::AggregateValue> TelemetryDB::aggregate(const std::string& measurement,
                                                            const core::Tags::Map& tags,
                                                            std::optional<core::Duration> time_range_ms,
                                                            const std::string& fn,
                                                            std::optional<std::string> group_by,
                                                            const std::string& field) const {
    return queries_.aggregate(measurement, tags, time_range_ms, fn, std::move(group_by), field);
}

core::Result<storage::SnapshotStats> TelemetryDB::snapshot() {
    return persistence_.snapshot();
}

core::Result<storage::SnapshotStats> TelemetryDB::load() {
    return persistence_.load();
}

core::Result<void> TelemetryDB::set_retention_period(core::Duration retention_ms) {
    auto result = store_.set_retention_period(retention_ms);
    if (result.ok()) {
        config_.retention_period_ms = retention_ms;
    }
    return result;
}

core::Result<void> TelemetryDB::set_max_points_per_series(size_t max_points) {
    auto result = store_.set_max_points_per_series(max_points);
    if (result.ok()) {
        config_.max_points_per_series = max_points;
    }
    return result;
}

} // namespace telemdb
