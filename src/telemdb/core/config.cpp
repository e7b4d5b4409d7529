#include "telemdb/core/config.h"
#include "telemdb/common/logger.h"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

namespace telemdb {
namespace core {

std::string StoreConfig::snapshot_path() const {
    return (std::filesystem::path(data_dir) / snapshot_file).string();
}

Result<void> StoreConfig::validate() const {
    if (retention_period_ms <= 0) {
        return Result<void>(InvalidArgumentError("retention_period_ms must be positive"));
    }
    if (max_points_per_series == 0) {
        return Result<void>(InvalidArgumentError("max_points_per_series must be positive"));
    }
    if (persistence_interval_ms <= 0) {
        return Result<void>(InvalidArgumentError("persistence_interval_ms must be positive"));
    }
    if (cleanup_interval_ms <= 0) {
        return Result<void>(InvalidArgumentError("cleanup_interval_ms must be positive"));
    }
    if (!(compression_threshold > 0.0 && compression_threshold <= 1.0)) {
        return Result<void>(InvalidArgumentError("compression_threshold must be in (0, 1]"));
    }
    if (snapshot_file.empty()) {
        return Result<void>(InvalidArgumentError("snapshot_file cannot be empty"));
    }
    return Result<void>();
}

namespace {

Result<void> ReadDuration(const rapidjson::Value& v, const char* name, Duration& out) {
    if (!v.IsInt64()) {
        return Result<void>(InvalidArgumentError(std::string(name) + " must be an integer"));
    }
    out = v.GetInt64();
    return Result<void>();
}

} // namespace

Result<StoreConfig> ParseConfig(const std::string& json, const StoreConfig& base) {
    rapidjson::Document doc;
    doc.Parse(json.c_str());
    if (doc.HasParseError()) {
        return Result<StoreConfig>::error(
            std::string("Invalid config JSON at offset ") + std::to_string(doc.GetErrorOffset()) +
            ": " + rapidjson::GetParseError_En(doc.GetParseError()),
            Error::Code::INVALID_ARGUMENT);
    }
    if (!doc.IsObject()) {
        return Result<StoreConfig>(InvalidArgumentError("Config root must be a JSON object"));
    }

    StoreConfig config = base;
    for (auto it = doc.MemberBegin(); it != doc.MemberEnd(); ++it) {
        const std::string name = it->name.GetString();
        const rapidjson::Value& v = it->value;
        Result<void> field_result;

        if (name == "retention_period_ms") {
            field_result = ReadDuration(v, "retention_period_ms", config.retention_period_ms);
        } else if (name == "persistence_interval_ms") {
            field_result = ReadDuration(v, "persistence_interval_ms", config.persistence_interval_ms);
        } else if (name == "cleanup_interval_ms") {
            field_result = ReadDuration(v, "cleanup_interval_ms", config.cleanup_interval_ms);
        } else if (name == "max_points_per_series") {
            if (!v.IsUint64()) {
                return Result<StoreConfig>(InvalidArgumentError("max_points_per_series must be a non-negative integer"));
            }
            config.max_points_per_series = static_cast<size_t>(v.GetUint64());
        } else if (name == "compression_enabled") {
            if (!v.IsBool()) {
                return Result<StoreConfig>(InvalidArgumentError("compression_enabled must be a boolean"));
            }
            config.compression_enabled = v.GetBool();
        } else if (name == "compression_threshold") {
            if (!v.IsNumber()) {
                return Result<StoreConfig>(InvalidArgumentError("compression_threshold must be a number"));
            }
            config.compression_threshold = v.GetDouble();
        } else if (name == "data_dir") {
            if (!v.IsString()) {
                return Result<StoreConfig>(InvalidArgumentError("data_dir must be a string"));
            }
            config.data_dir = v.GetString();
        } else if (name == "snapshot_file") {
            if (!v.IsString()) {
                return Result<StoreConfig>(InvalidArgumentError("snapshot_file must be a string"));
            }
            config.snapshot_file = v.GetString();
        } else if (name == "enable_background_tasks") {
            if (!v.IsBool()) {
                return Result<StoreConfig>(InvalidArgumentError("enable_background_tasks must be a boolean"));
            }
            config.enable_background_tasks = v.GetBool();
        } else {
            TELEMDB_WARN("Ignoring unknown config key '{}'", name);
        }

        if (!field_result.ok()) {
            return Result<StoreConfig>::error(field_result.error(), field_result.error_code());
        }
    }

    auto valid = config.validate();
    if (!valid.ok()) {
        return Result<StoreConfig>::error(valid.error(), valid.error_code());
    }
    return Result<StoreConfig>(config);
}

Result<StoreConfig> LoadConfigFile(const std::string& path, const StoreConfig& base) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<StoreConfig>(IOError("Could not open configuration file", path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = ParseConfig(buffer.str(), base);
    if (result.ok()) {
        TELEMDB_INFO("Loaded configuration from {}", path);
    }
    return result;
}

} // namespace core
} // namespace telemdb
