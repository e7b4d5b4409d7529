#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "telemdb/common/logger.h"
#include "telemdb/config.h"
#include "telemdb/core/config.h"
#include "telemdb/telemdb.h"

// Global flag for shutdown
std::atomic<bool> g_running(true);

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running.store(false);
    }
}

namespace {

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [OPTIONS]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --data-dir DIR                 Snapshot directory (default: ./data/timeseries)" << std::endl;
    std::cout << "  --config FILE                  JSON configuration file" << std::endl;
    std::cout << "  --retention-ms MS              Maximum point age (default: 86400000)" << std::endl;
    std::cout << "  --max-points N                 Points kept per series (default: 10000)" << std::endl;
    std::cout << "  --cleanup-interval-ms MS       Retention sweep interval (default: 3600000)" << std::endl;
    std::cout << "  --persistence-interval-ms MS   Snapshot interval (default: 300000)" << std::endl;
    std::cout << "  --no-compression               Disable compaction on insert" << std::endl;
    std::cout << "  --log-level LEVEL              trace, debug, info, warn, error, critical, off" << std::endl;
    std::cout << "  --log-file FILE                Also append log output to FILE" << std::endl;
    std::cout << "  --version                      Print the version and exit" << std::endl;
    std::cout << "  --help, -h                     Show this help message" << std::endl;
}

// Command-line values override the config file, which overrides the defaults
struct Overrides {
    std::optional<std::string> data_dir;
    std::optional<int64_t> retention_ms;
    std::optional<int64_t> max_points;
    std::optional<int64_t> cleanup_interval_ms;
    std::optional<int64_t> persistence_interval_ms;
    bool no_compression = false;
};

std::optional<int64_t> ParseNumber(const std::string& flag, const std::string& text) {
    try {
        size_t consumed = 0;
        const int64_t value = std::stoll(text, &consumed);
        if (consumed == text.size()) {
            return value;
        }
    } catch (const std::exception&) {
        // Reported below
    }
    std::cerr << "Invalid value for " << flag << ": " << text << std::endl;
    return std::nullopt;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    std::optional<std::string> config_file;
    std::string log_file;
    spdlog::level::level_enum log_level = spdlog::level::info;
    Overrides overrides;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--data-dir" && has_value) {
            overrides.data_dir = argv[++i];
        } else if (arg == "--config" && has_value) {
            config_file = argv[++i];
        } else if (arg == "--retention-ms" && has_value) {
            overrides.retention_ms = ParseNumber(arg, argv[++i]);
            if (!overrides.retention_ms) return 1;
        } else if (arg == "--max-points" && has_value) {
            overrides.max_points = ParseNumber(arg, argv[++i]);
            if (!overrides.max_points) return 1;
        } else if (arg == "--cleanup-interval-ms" && has_value) {
            overrides.cleanup_interval_ms = ParseNumber(arg, argv[++i]);
            if (!overrides.cleanup_interval_ms) return 1;
        } else if (arg == "--persistence-interval-ms" && has_value) {
            overrides.persistence_interval_ms = ParseNumber(arg, argv[++i]);
            if (!overrides.persistence_interval_ms) return 1;
        } else if (arg == "--no-compression") {
            overrides.no_compression = true;
        } else if (arg == "--log-level" && has_value) {
            std::string level_str = argv[++i];
            auto level = telemdb::common::Logger::ParseLevel(level_str);
            if (level) {
                log_level = *level;
            } else {
                std::cerr << "Unknown log level: " << level_str << ". Using default (info)." << std::endl;
            }
        } else if (arg == "--log-file" && has_value) {
            log_file = argv[++i];
        } else if (arg == "--version") {
            std::cout << "telemdb " << TELEMDB_VERSION << std::endl;
            return 0;
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            std::cerr << "Use --help for usage information" << std::endl;
            return 1;
        }
    }

    if (!telemdb::common::Logger::Init(log_file, log_level)) {
        std::cerr << "Logging to stdout only" << std::endl;
    }

    telemdb::core::StoreConfig config = telemdb::core::StoreConfig::Default();
    if (config_file) {
        auto loaded = telemdb::core::LoadConfigFile(*config_file, config);
        if (!loaded.ok()) {
            std::cerr << "Failed to load config " << *config_file << ": " << loaded.error() << std::endl;
            return 1;
        }
        config = loaded.take_value();
    }

    if (overrides.data_dir) config.data_dir = *overrides.data_dir;
    if (overrides.retention_ms) config.retention_period_ms = *overrides.retention_ms;
    if (overrides.max_points) {
        if (*overrides.max_points <= 0) {
            std::cerr << "--max-points must be positive" << std::endl;
            return 1;
        }
        config.max_points_per_series = static_cast<size_t>(*overrides.max_points);
    }
    if (overrides.cleanup_interval_ms) config.cleanup_interval_ms = *overrides.cleanup_interval_ms;
    if (overrides.persistence_interval_ms) config.persistence_interval_ms = *overrides.persistence_interval_ms;
    if (overrides.no_compression) config.compression_enabled = false;

    try {
        telemdb::TelemetryDB db(config);

        auto opened = db.open();
        if (!opened.ok()) {
            std::cerr << "Failed to open database: " << opened.error() << std::endl;
            return 1;
        }

        TELEMDB_INFO("telemdb {} running. Press Ctrl+C to stop.", TELEMDB_VERSION);
        while (g_running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        TELEMDB_INFO("Shutting down...");

        auto closed = db.close();
        if (!closed.ok()) {
            TELEMDB_ERROR("Shutdown failed: {}", closed.error());
            return 1;
        }

        auto stats = db.stats();
        TELEMDB_INFO("Final state: {} series, {} points", stats.series_count, stats.total_points);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
