#ifndef TELEMDB_QUERY_QUERY_ENGINE_H_
#define TELEMDB_QUERY_QUERY_ENGINE_H_

#include <map>
#include <optional>
#include <string>
#include <variant>

#include "telemdb/core/aggregation.h"
#include "telemdb/core/types.h"
#include "telemdb/storage/store.h"

namespace telemdb {
namespace query {

/**
 * @brief Options for an aggregate query
 */
struct AggregateRequest {
    std::string measurement;
    core::Tags::Map tags;
    std::optional<core::Duration> time_range_ms;
    core::AggregationOp op = core::AggregationOp::AVG;
    std::optional<std::string> group_by;  // Tag name to bucket by
    std::string field = "value";          // Field reduced in every point
};

/**
 * @brief A scalar, or one value per group-by bucket
 */
using AggregateValue = std::variant<double, std::map<std::string, double>>;

/**
 * @brief Read-only range and aggregate queries over a Store
 */
class QueryEngine {
public:
    static constexpr size_t kDefaultLimit = 1000;
    static constexpr size_t kAggregateLimit = 10000;
    static constexpr const char* kDefaultBucket = "default";

    explicit QueryEngine(const storage::Store& store);

    /**
     * @brief Points of every matching series, newest first
     *
     * A series matches when its measurement equals `measurement` and it carries
     * every tag in `tags` with an equal value. When `time_range_ms` is set,
     * only points with timestamp >= now - time_range_ms are returned.
     * Points with equal timestamps keep their series and insertion order.
     *
     * An invalid tag filter (empty tag name) matches nothing.
     */
    core::PointList query(const std::string& measurement,
                          const core::Tags::Map& tags = {},
                          std::optional<core::Duration> time_range_ms = std::nullopt,
                          size_t limit = kDefaultLimit) const;

    /**
     * @brief Reduce one field over the matching points
     *
     * Points without the requested field are skipped. Without group_by the
     * result is a scalar; with group_by it maps each tag value (or "default"
     * for points lacking the tag) to its reduction, omitting buckets that
     * had no usable value.
     *
     * @return std::nullopt when nothing matched
     */
    std::optional<AggregateValue> aggregate(const AggregateRequest& request) const;

    /**
     * @brief Convenience overload taking the function by name
     *
     * Unrecognized names fall back to "avg".
     */
    std::optional<AggregateValue> aggregate(const std::string& measurement,
                                            const core::Tags::Map& tags,
                                            std::optional<core::Duration> time_range_ms,
                                            const std::string& fn = "avg",
                                            std::optional<std::string> group_by = std::nullopt,
                                            const std::string& field = "value") const;

private:
    const storage::Store& store_;
};

} // namespace query
} // namespace telemdb

#endif // TELEMDB_QUERY_QUERY_ENGINE_H_
