#include "telemdb/storage/store.h"
#include "telemdb/common/logger.h"
#include "telemdb/core/error.h"

#include <algorithm>
#include <cmath>

namespace telemdb {
namespace storage {

Store::Store(const core::StoreConfig& config, std::shared_ptr<core::Clock> clock)
    : clock_(clock ? std::move(clock) : core::DefaultClock()),
      retention_period_ms_(config.retention_period_ms),
      max_points_per_series_(config.max_points_per_series),
      compression_enabled_(config.compression_enabled),
      compression_threshold_(config.compression_threshold) {
}

RetentionEnforcer Store::make_enforcer() const {
    return RetentionEnforcer(RetentionPolicy{retention_period_ms_.load(), max_points_per_series_.load()});
}

bool Store::insert(const std::string& measurement,
                   const core::Tags::Map& tags,
                   const core::Fields& fields,
                   std::optional<core::Timestamp> timestamp) {
    if (measurement.empty()) {
        TELEMDB_DEBUG("Rejected insert: empty measurement");
        return false;
    }
    for (const auto& [name, value] : fields) {
        if (name.empty()) {
            TELEMDB_DEBUG("Rejected insert into '{}': empty field name", measurement);
            return false;
        }
        if (!std::isfinite(value)) {
            TELEMDB_DEBUG("Rejected insert into '{}': field '{}' is not a finite number", measurement, name);
            return false;
        }
    }

    core::Tags tag_set;
    try {
        tag_set = core::Tags(tags);
    } catch (const core::InvalidArgumentError& e) {
        TELEMDB_DEBUG("Rejected insert into '{}': {}", measurement, e.what());
        return false;
    }

    const core::Timestamp now = clock_->now_ms();
    core::SeriesKey key(measurement, tag_set);
    auto point = std::make_shared<const core::Point>(timestamp.value_or(now), fields, std::move(tag_set));

    auto series = index_.get_or_create(key);
    const auto enforcer = make_enforcer();
    std::optional<Compactor> compactor;
    if (compression_enabled_.load()) {
        compactor.emplace(compression_threshold_);
    }

    auto result = series->append(std::move(point), enforcer, compactor ? &*compactor : nullptr, now);
    if (result.evicted > 0 || result.compacted > 0) {
        TELEMDB_TRACE("Insert into {} evicted {} and compacted {} points",
                      key.to_string(), result.evicted, result.compacted);
    }
    return true;
}

size_t Store::insert_batch(const std::vector<PointRecord>& records) {
    size_t accepted = 0;
    for (const auto& record : records) {
        if (insert(record.measurement, record.tags, record.fields, record.timestamp)) {
            ++accepted;
        }
    }
    if (accepted != records.size()) {
        TELEMDB_WARN("Batch insert rejected {} of {} records", records.size() - accepted, records.size());
    }
    return accepted;
}

CleanupReport Store::cleanup() {
    const core::Timestamp now = clock_->now_ms();
    const auto enforcer = make_enforcer();

    CleanupReport report;
    for (const auto& series : index_.all_series()) {
        const size_t removed = series->enforce(enforcer, now);
        if (removed > 0) {
            report.points_removed += removed;
            report.series_touched++;
        }
    }

    if (report.points_removed > 0) {
        TELEMDB_INFO("Cleaned up {} old data points from {} series",
                     report.points_removed, report.series_touched);
    }
    return report;
}

size_t Store::compact(const core::SeriesKey& key) {
    auto series = index_.find(key);
    if (!series) {
        return 0;
    }
    return series->compact(Compactor(compression_threshold_));
}

size_t Store::compact_all() {
    const Compactor compactor(compression_threshold_);
    size_t removed = 0;
    for (const auto& series : index_.all_series()) {
        removed += series->compact(compactor);
    }
    if (removed > 0) {
        TELEMDB_INFO("Compaction dropped {} points", removed);
    }
    return removed;
}

void Store::clear() {
    index_.clear();
    TELEMDB_INFO("Time-series store cleared");
}

size_t Store::restore(const core::SeriesKey& key, core::PointList points) {
    auto series = index_.get_or_create(key);
    return series->restore(std::move(points), make_enforcer(), clock_->now_ms());
}

std::vector<SeriesSnapshot> Store::select(const std::string& measurement, const core::Tags& filter) const {
    std::vector<SeriesSnapshot> result;
    for (const auto& series : index_.find_series(measurement, filter)) {
        result.emplace_back(series->key(), series->points());
    }
    return result;
}

std::vector<SeriesSnapshot> Store::snapshot_all() const {
    std::vector<SeriesSnapshot> result;
    for (const auto& series : index_.all_series()) {
        result.emplace_back(series->key(), series->points());
    }
    return result;
}

StoreStats Store::stats() const {
    StoreStats stats;
    stats.retention_period_ms = retention_period_ms_.load();
    stats.max_points_per_series = max_points_per_series_.load();
    stats.compression_enabled = compression_enabled_.load();

    for (const auto& series : index_.all_series()) {
        stats.series_count++;
        stats.total_points += series->size();

        auto oldest = series->min_timestamp();
        if (oldest && (!stats.oldest_timestamp || *oldest < *stats.oldest_timestamp)) {
            stats.oldest_timestamp = oldest;
        }
        auto newest = series->max_timestamp();
        if (newest && (!stats.newest_timestamp || *newest > *stats.newest_timestamp)) {
            stats.newest_timestamp = newest;
        }
    }

    if (stats.series_count > 0) {
        stats.average_points_per_series =
            static_cast<double>(stats.total_points) / static_cast<double>(stats.series_count);
    }
    return stats;
}

core::Result<void> Store::set_retention_period(core::Duration retention_ms) {
    if (retention_ms <= 0) {
        return core::Result<void>(core::InvalidArgumentError("Retention period must be positive"));
    }
    retention_period_ms_.store(retention_ms);
    TELEMDB_INFO("Retention period set to: {}ms", retention_ms);
    return core::Result<void>();
}

core::Result<void> Store::set_max_points_per_series(size_t max_points) {
    if (max_points == 0) {
        return core::Result<void>(core::InvalidArgumentError("Max points per series must be positive"));
    }
    max_points_per_series_.store(max_points);
    TELEMDB_INFO("Max points per series set to: {}", max_points);
    return core::Result<void>();
}

void Store::set_compression_enabled(bool enabled) {
    compression_enabled_.store(enabled);
    TELEMDB_INFO("Compression on insert {}", enabled ? "enabled" : "disabled");
}

} // namespace storage
} // namespace telemdb
