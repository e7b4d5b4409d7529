#include "telemdb/telemdb.h"
#include "telemdb/common/logger.h"
#include "telemdb/telemetry/race_recorder.h"
#include <iostream>
#include <variant>

using namespace telemdb;

int main() {
    std::cout << "=== telemdb Quick Start Example ===" << std::endl;
    common::Logger::Init();

    // Configure the store
    core::StoreConfig config;
    config.data_dir = "./telemdb_data";
    config.max_points_per_series = 1000;

    std::cout << "Opening database with data_dir: " << config.data_dir << std::endl;
    TelemetryDB db(config);

    auto open_result = db.open();
    if (!open_result.ok()) {
        std::cerr << "Open failed: " << open_result.error() << std::endl;
        return 1;
    }
    std::cout << "Database opened" << std::endl;

    // Record a short stint for two cars
    telemetry::RaceTelemetryRecorder recorder(db);
    const double speeds[] = {281.0, 295.5, 302.1, 276.4, 310.8};
    for (double speed : speeds) {
        recorder.record_speed("44", speed);
        recorder.record_speed("16", speed - 4.0);
    }
    recorder.record_position("44", {120.5, -42.0});
    recorder.record_tire_temps("44", {{"fl", 96.0}, {"fr", 98.5}, {"rl", 91.2}, {"rr", 92.7}});

    // Read
    auto history = recorder.speed_history("44");
    std::cout << "Car 44 speed history (" << history.size() << " points, newest first):" << std::endl;
    for (const auto& point : history) {
        std::cout << "  Timestamp: " << point->timestamp()
                  << ", Value: " << point->field("value").value_or(0.0) << std::endl;
    }

    if (auto avg = recorder.average_speed("44")) {
        std::cout << "Car 44 average speed: " << *avg << std::endl;
    }
    if (auto max = recorder.max_speed("16")) {
        std::cout << "Car 16 max speed: " << *max << std::endl;
    }

    // Group by car
    auto by_car = db.aggregate("speed", {}, std::nullopt, "max", std::string("carId"));
    if (by_car) {
        if (const auto* groups = std::get_if<std::map<std::string, double>>(&*by_car)) {
            for (const auto& [car, value] : *groups) {
                std::cout << "  max speed car " << car << ": " << value << std::endl;
            }
        }
    }

    auto stats = db.stats();
    std::cout << "Series: " << stats.series_count << ", points: " << stats.total_points << std::endl;

    // Close
    std::cout << "Closing database..." << std::endl;
    auto close_result = db.close();
    if (!close_result.ok()) {
        std::cerr << "Close failed: " << close_result.error() << std::endl;
        return 1;
    }
    std::cout << "Snapshot written to " << config.snapshot_path() << std::endl;
    return 0;
}
