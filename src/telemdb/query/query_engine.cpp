#include "telemdb/query/query_engine.h"
#include "telemdb/common/logger.h"
#include "telemdb/core/error.h"

#include <algorithm>
#include <vector>

namespace telemdb {
namespace query {

QueryEngine::QueryEngine(const storage::Store& store) : store_(store) {}

core::PointList QueryEngine::query(const std::string& measurement,
                                   const core::Tags::Map& tags,
                                   std::optional<core::Duration> time_range_ms,
                                   size_t limit) const {
    core::PointList result;
    if (measurement.empty() || limit == 0) {
        return result;
    }

    core::Tags filter;
    try {
        filter = core::Tags(tags);
    } catch (const core::InvalidArgumentError& e) {
        TELEMDB_DEBUG("Query on '{}' has an invalid tag filter: {}", measurement, e.what());
        return result;
    }

    std::optional<core::Timestamp> cutoff;
    if (time_range_ms) {
        cutoff = store_.clock().now_ms() - *time_range_ms;
    }

    for (auto& [key, points] : store_.select(measurement, filter)) {
        for (auto& point : points) {
            if (cutoff && point->timestamp() < *cutoff) {
                continue;
            }
            result.push_back(std::move(point));
        }
    }

    std::stable_sort(result.begin(), result.end(),
                     [](const core::PointPtr& a, const core::PointPtr& b) {
                         return a->timestamp() > b->timestamp();
                     });
    if (result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

std::optional<AggregateValue> QueryEngine::aggregate(const AggregateRequest& request) const {
    const auto points = query(request.measurement, request.tags, request.time_range_ms, kAggregateLimit);
    if (points.empty()) {
        return std::nullopt;
    }

    if (!request.group_by) {
        std::vector<double> values;
        values.reserve(points.size());
        for (const auto& point : points) {
            if (auto value = point->field(request.field)) {
                values.push_back(*value);
            }
        }
        auto reduced = core::Reduce(values, request.op);
        if (!reduced) {
            return std::nullopt;
        }
        return AggregateValue(*reduced);
    }

    std::map<std::string, std::vector<double>> buckets;
    for (const auto& point : points) {
        auto value = point->field(request.field);
        if (!value) {
            continue;
        }
        auto bucket = point->tags().get(*request.group_by);
        buckets[bucket ? *bucket : kDefaultBucket].push_back(*value);
    }

    std::map<std::string, double> grouped;
    for (const auto& [bucket, values] : buckets) {
        if (auto reduced = core::Reduce(values, request.op)) {
            grouped.emplace(bucket, *reduced);
        }
    }
    return AggregateValue(std::move(grouped));
}

std::optional<AggregateValue> QueryEngine::aggregate(const std::string& measurement,
                                                     const core::Tags::Map& tags,
                                                     std::optional<core::Duration> time_range_ms,
                                                     const std::string& fn,
                                                     std::optional<std::string> group_by,
                                                     const std::string& field) const {
    AggregateRequest request;
    request.measurement = measurement;
    request.tags = tags;
    request.time_range_ms = time_range_ms;
    request.op = core::ParseAggregationOp(fn);
    request.group_by = std::move(group_by);
    request.field = field;
    return aggregate(request);
}

} // namespace query
} // namespace telemdb
