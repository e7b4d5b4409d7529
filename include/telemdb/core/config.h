#pragma once

#include <string>

#include "telemdb/core/result.h"
#include "telemdb/core/types.h"

namespace telemdb {
namespace core {

/**
 * @brief Configuration for the time-series store and its background tasks
 */
struct StoreConfig {
    Duration retention_period_ms;       // Maximum age of a point before eviction
    size_t max_points_per_series;       // Per-series cap, oldest points evicted first
    Duration persistence_interval_ms;   // Interval between snapshots
    Duration cleanup_interval_ms;       // Interval between retention sweeps
    bool compression_enabled;           // Run the compactor on every insert
    double compression_threshold;       // Relative change below which a point is redundant
    std::string data_dir;               // Directory holding the snapshot file
    std::string snapshot_file;          // Snapshot file name inside data_dir
    bool enable_background_tasks;       // Start the scheduler thread on open()

    // Default constructor
    StoreConfig() : retention_period_ms(24LL * 3600 * 1000),
                    max_points_per_series(10000),
                    persistence_interval_ms(5LL * 60 * 1000),
                    cleanup_interval_ms(3600LL * 1000),
                    compression_enabled(true),
                    compression_threshold(0.05),
                    data_dir("./data/timeseries"),
                    snapshot_file("timeseries.json"),
                    enable_background_tasks(false) {}  // Tests drive the scheduler by hand

    static StoreConfig Default() {
        StoreConfig config;
        config.enable_background_tasks = true;
        return config;
    }

    /**
     * @brief Full path of the snapshot file
     */
    std::string snapshot_path() const;

    /**
     * @brief Check ranges of every knob
     * @return Result naming the first invalid knob
     */
    Result<void> validate() const;
};

/**
 * @brief Read a JSON config file and overlay it on `base`
 *
 * Keys use the StoreConfig member names. Unknown keys are ignored with a
 * warning; a key with the wrong JSON type fails the whole load.
 */
Result<StoreConfig> LoadConfigFile(const std::string& path, const StoreConfig& base = StoreConfig::Default());

/**
 * @brief Same as LoadConfigFile, from an in-memory JSON document
 */
Result<StoreConfig> ParseConfig(const std::string& json, const StoreConfig& base = StoreConfig::Default());

} // namespace core
} // namespace telemdb
