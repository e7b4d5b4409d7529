#pragma once

#include <optional>
#include <string>
#include <vector>

namespace telemdb {
namespace core {

enum class AggregationOp {
    AVG,
    SUM,
    MIN,
    MAX,
    COUNT
};

/**
 * @brief Parse an aggregation name ("avg", "sum", "min", "max", "count")
 *
 * Matching is case-insensitive. Unrecognized names map to AVG.
 */
AggregationOp ParseAggregationOp(const std::string& name);

const char* AggregationOpName(AggregationOp op);

/**
 * @brief Reduce values with the given operation
 * @return std::nullopt when `values` is empty
 */
std::optional<double> Reduce(const std::vector<double>& values, AggregationOp op);

} // namespace core
} // namespace telemdb
