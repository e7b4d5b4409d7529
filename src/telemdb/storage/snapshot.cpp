#include "telemdb/storage/snapshot.h"
#include "telemdb/common/logger.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

namespace telemdb {
namespace storage {

namespace {

core::PointPtr ParsePoint(const rapidjson::Value& entry, const core::Tags& tags) {
    if (!entry.IsObject()) {
        return nullptr;
    }
    auto ts = entry.FindMember("timestamp");
    if (ts == entry.MemberEnd() || !ts->value.IsInt64()) {
        return nullptr;
    }

    core::Fields fields;
    auto fit = entry.FindMember("fields");
    if (fit != entry.MemberEnd()) {
        if (!fit->value.IsObject()) {
            return nullptr;
        }
        for (auto f = fit->value.MemberBegin(); f != fit->value.MemberEnd(); ++f) {
            if (f->name.GetStringLength() == 0 || !f->value.IsNumber()) {
                return nullptr;
            }
            const double value = f->value.GetDouble();
            if (!std::isfinite(value)) {
                return nullptr;
            }
            fields.emplace(std::string(f->name.GetString(), f->name.GetStringLength()), value);
        }
    }

    // Point tags always equal the series tags; the copy in the file is informational.
    return std::make_shared<const core::Point>(ts->value.GetInt64(), std::move(fields), tags);
}

} // namespace

SnapshotGateway::SnapshotGateway(Store& store, std::string path)
    : store_(store), path_(std::move(path)) {}

std::string SnapshotGateway::Serialize(const std::vector<SeriesSnapshot>& series) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartObject();
    for (const auto& [key, points] : series) {
        const std::string name = key.to_string();
        writer.Key(name.c_str(), static_cast<rapidjson::SizeType>(name.size()));
        writer.StartArray();
        for (const auto& point : points) {
            writer.StartObject();
            writer.Key("timestamp");
            writer.Int64(point->timestamp());

            writer.Key("fields");
            writer.StartObject();
            for (const auto& [field, value] : point->fields()) {
                writer.Key(field.c_str(), static_cast<rapidjson::SizeType>(field.size()));
                writer.Double(value);
            }
            writer.EndObject();

            writer.Key("tags");
            writer.StartObject();
            for (const auto& [tag, value] : point->tags().map()) {
                writer.Key(tag.c_str(), static_cast<rapidjson::SizeType>(tag.size()));
                writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
            }
            writer.EndObject();

            writer.EndObject();
        }
        writer.EndArray();
    }
    writer.EndObject();

    return std::string(buffer.GetString(), buffer.GetSize());
}

core::Result<std::vector<SeriesSnapshot>> SnapshotGateway::Deserialize(const std::string& json, size_t& skipped) {
    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        return core::Result<std::vector<SeriesSnapshot>>::error(
            std::string("Invalid snapshot JSON at offset ") + std::to_string(doc.GetErrorOffset()) +
            ": " + rapidjson::GetParseError_En(doc.GetParseError()),
            core::Error::Code::INVALID_ARGUMENT);
    }
    if (!doc.IsObject()) {
        return core::Result<std::vector<SeriesSnapshot>>::error("Snapshot root must be a JSON object",
                                                               core::Error::Code::INVALID_ARGUMENT);
    }

    std::vector<SeriesSnapshot> result;
    for (auto member = doc.MemberBegin(); member != doc.MemberEnd(); ++member) {
        const std::string name(member->name.GetString(), member->name.GetStringLength());
        auto key = core::SeriesKey::parse(name);
        if (!key || !member->value.IsArray()) {
            TELEMDB_WARN("Skipping malformed snapshot series '{}'", name);
            skipped++;
            continue;
        }

        core::PointList points;
        points.reserve(member->value.Size());
        for (const auto& entry : member->value.GetArray()) {
            auto point = ParsePoint(entry, key->tags());
            if (!point) {
                skipped++;
                continue;
            }
            points.push_back(std::move(point));
        }
        result.emplace_back(std::move(*key), std::move(points));
    }
    return core::Result<std::vector<SeriesSnapshot>>(std::move(result));
}

core::Result<SnapshotStats> SnapshotGateway::snapshot() {
    std::lock_guard<std::mutex> lock(write_mutex_);

    auto series = store_.snapshot_all();
    SnapshotStats stats;
    stats.series = series.size();
    for (const auto& entry : series) {
        stats.points += entry.second.size();
    }

    const std::string payload = Serialize(series);

    const std::filesystem::path target(path_);
    std::filesystem::path temp = target;
    temp += ".tmp";

    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            TELEMDB_ERROR("Failed to create data directory {}: {}", target.parent_path().string(), ec.message());
            return core::Result<SnapshotStats>(core::IOError("Failed to create data directory", target.parent_path().string(), ec));
        }
    }

    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            TELEMDB_ERROR("Error persisting time-series data: cannot open {}", temp.string());
            return core::Result<SnapshotStats>(core::IOError("Cannot open snapshot file", temp.string()));
        }
        file.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        file.flush();
        if (!file.good()) {
            file.close();
            std::filesystem::remove(temp, ec);
            TELEMDB_ERROR("Error persisting time-series data: write to {} failed", temp.string());
            return core::Result<SnapshotStats>(core::IOError("Write failed", temp.string()));
        }
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        TELEMDB_ERROR("Error persisting time-series data: rename to {} failed: {}", path_, ec.message());
        return core::Result<SnapshotStats>(core::IOError("Rename failed", path_, ec));
    }

    TELEMDB_DEBUG("Time-series data persisted to {} ({} series, {} points)", path_, stats.series, stats.points);
    return core::Result<SnapshotStats>(stats);
}

core::Result<SnapshotStats> SnapshotGateway::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        if (ec) {
            TELEMDB_ERROR("Error loading persisted data: cannot stat {}: {}", path_, ec.message());
            return core::Result<SnapshotStats>(core::IOError("Cannot stat snapshot file", path_, ec));
        }
        TELEMDB_INFO("No snapshot at {}, starting with an empty store", path_);
        return core::Result<SnapshotStats>(SnapshotStats{});
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        TELEMDB_ERROR("Error loading persisted data: cannot open {}", path_);
        return core::Result<SnapshotStats>(core::IOError("Cannot open snapshot file", path_));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        TELEMDB_ERROR("Error loading persisted data: read of {} failed", path_);
        return core::Result<SnapshotStats>(core::IOError("Read failed", path_));
    }

    SnapshotStats stats;
    auto parsed = Deserialize(buffer.str(), stats.skipped);
    if (!parsed.ok()) {
        TELEMDB_ERROR("Error loading persisted data from {}: {}", path_, parsed.error());
        return core::Result<SnapshotStats>::error(parsed.error(), parsed.error_code());
    }

    for (auto& [key, points] : parsed.take_value()) {
        stats.points += store_.restore(key, std::move(points));
        stats.series++;
    }

    TELEMDB_INFO("Loaded {} series ({} points) from {}", stats.series, stats.points, path_);
    if (stats.skipped > 0) {
        TELEMDB_WARN("Skipped {} malformed snapshot entries", stats.skipped);
    }
    return core::Result<SnapshotStats>(stats);
}

} // namespace storage
} // namespace telemdb
