#ifndef TELEMDB_COMMON_LOGGER_H_
#define TELEMDB_COMMON_LOGGER_H_

#include <optional>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace telemdb {
namespace common {

/**
 * @brief Process-wide logging setup on top of spdlog
 *
 * Init() installs a logger named "telemdb" as the spdlog default. It always
 * writes to colored stdout and, when a path is given, also appends to a file.
 * Calling Init() again replaces the previous logger.
 */
class Logger {
public:
    static constexpr const char* kLoggerName = "telemdb";
    static constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v";

    static bool Init(const std::string& log_file = "",
                     spdlog::level::level_enum level = spdlog::level::info);
    static void SetLevel(spdlog::level::level_enum level);

    // Case-insensitive; "warning" and "err" are accepted as aliases
    static std::optional<spdlog::level::level_enum> ParseLevel(const std::string& name);
};

} // namespace common
} // namespace telemdb

#define TELEMDB_TRACE(...) spdlog::trace(__VA_ARGS__)
#define TELEMDB_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define TELEMDB_INFO(...)  spdlog::info(__VA_ARGS__)
#define TELEMDB_WARN(...)  spdlog::warn(__VA_ARGS__)
#define TELEMDB_ERROR(...) spdlog::error(__VA_ARGS__)
#define TELEMDB_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // TELEMDB_COMMON_LOGGER_H_
