#ifndef TELEMDB_TELEMETRY_RACE_RECORDER_H_
#define TELEMDB_TELEMETRY_RACE_RECORDER_H_

#include <optional>
#include <string>

#include "telemdb/core/types.h"
#include "telemdb/telemdb.h"

namespace telemdb {
namespace telemetry {

/**
 * @brief 3D car position on track
 */
struct Position {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

/**
 * @brief Per-car race telemetry on top of TelemetryDB
 *
 * Every sample is tagged with `carId`. Measurements:
 * - `speed`      field `value`
 * - `position`   fields `x`, `y`, `z`
 * - `tire_temp`  one field per tire
 * - `engine`     one field per engine channel
 */
class RaceTelemetryRecorder {
public:
    static constexpr core::Duration kDefaultRangeMs = 3600 * 1000;

    static constexpr const char* kCarTag = "carId";
    static constexpr const char* kSpeed = "speed";
    static constexpr const char* kPosition = "position";
    static constexpr const char* kTireTemp = "tire_temp";
    static constexpr const char* kEngine = "engine";

    explicit RaceTelemetryRecorder(TelemetryDB& db);

    bool record_speed(const std::string& car_id, double speed,
                      std::optional<core::Timestamp> ts = std::nullopt);
    bool record_position(const std::string& car_id, const Position& position,
                         std::optional<core::Timestamp> ts = std::nullopt);
    bool record_tire_temps(const std::string& car_id, const core::Fields& temps,
                           std::optional<core::Timestamp> ts = std::nullopt);
    bool record_engine(const std::string& car_id, const core::Fields& channels,
                       std::optional<core::Timestamp> ts = std::nullopt);

    core::PointList speed_history(const std::string& car_id, core::Duration range_ms = kDefaultRangeMs) const;
    core::PointList position_history(const std::string& car_id, core::Duration range_ms = kDefaultRangeMs) const;

    /**
     * @return std::nullopt when the car has no speed samples in range
     */
    std::optional<double> average_speed(const std::string& car_id, core::Duration range_ms = kDefaultRangeMs) const;
    std::optional<double> max_speed(const std::string& car_id, core::Duration range_ms = kDefaultRangeMs) const;

private:
    std::optional<double> speed_aggregate(const std::string& car_id, core::Duration range_ms,
                                          core::AggregationOp op) const;

    TelemetryDB& db_;
};

} // namespace telemetry
} // namespace telemdb

#endif // TELEMDB_TELEMETRY_RACE_RECORDER_H_
