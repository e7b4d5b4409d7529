#include "telemdb/telemetry/race_recorder.h"

#include <variant>

namespace telemdb {
namespace telemetry {

RaceTelemetryRecorder::RaceTelemetryRecorder(TelemetryDB& db) : db_(db) {}

bool RaceTelemetryRecorder::record_speed(const std::string& car_id, double speed,
                                         std::optional<core::Timestamp> ts) {
    return db_.insert(kSpeed, {{kCarTag, car_id}}, {{"value", speed}}, ts);
}

bool RaceTelemetryRecorder::record_position(const std::string& car_id, const Position& position,
                                            std::optional<core::Timestamp> ts) {
    return db_.insert(kPosition, {{kCarTag, car_id}},
                      {{"x", position.x}, {"y", position.y}, {"z", position.z}}, ts);
}

bool RaceTelemetryRecorder::record_tire_temps(const std::string& car_id, const core::Fields& temps,
                                              std::optional<core::Timestamp> ts) {
    return db_.insert(kTireTemp, {{kCarTag, car_id}}, temps, ts);
}

bool RaceTelemetryRecorder::record_engine(const std::string& car_id, const core::Fields& channels,
                                          std::optional<core::Timestamp> ts) {
    return db_.insert(kEngine, {{kCarTag, car_id}}, channels, ts);
}

core::PointList RaceTelemetryRecorder::speed_history(const std::string& car_id, core::Duration range_ms) const {
    return db_.query(kSpeed, {{kCarTag, car_id}}, range_ms);
}

core::PointList RaceTelemetryRecorder::position_history(const std::string& car_id, core::Duration range_ms) const {
    return db_.query(kPosition, {{kCarTag, car_id}}, range_ms);
}

std::optional<double> RaceTelemetryRecorder::average_speed(const std::string& car_id, core::Duration range_ms) const {
    return speed_aggregate(car_id, range_ms, core::AggregationOp::AVG);
}

std::optional<double> RaceTelemetryRecorder::max_speed(const std::string& car_id, core::Duration range_ms) const {
    return speed_aggregate(car_id, range_ms, core::AggregationOp::MAX);
}

std::optional<double> RaceTelemetryRecorder::speed_aggregate(const std::string& car_id, core::Duration range_ms,
                                                             core::AggregationOp op) const {
    query::AggregateRequest request;
    request.measurement = kSpeed;
    request.tags = {{kCarTag, car_id}};
    request.time_range_ms = range_ms;
    request.op = op;

    auto result = db_.aggregate(request);
    if (!result) {
        return std::nullopt;
    }
    const double* value = std::get_if<double>(&*result);
    if (!value) {
        return std::nullopt;
    }
    return *value;
}

} // namespace telemetry
} // namespace telemdb
