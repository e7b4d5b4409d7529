#include "telemdb/core/aggregation.h"

#include <algorithm>
#include <cctype>
#include <numeric>

namespace telemdb {
namespace core {

AggregationOp ParseAggregationOp(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "sum") return AggregationOp::SUM;
    if (lower == "min") return AggregationOp::MIN;
    if (lower == "max") return AggregationOp::MAX;
    if (lower == "count") return AggregationOp::COUNT;
    return AggregationOp::AVG;
}

const char* AggregationOpName(AggregationOp op) {
    switch (op) {
        case AggregationOp::AVG: return "avg";
        case AggregationOp::SUM: return "sum";
        case AggregationOp::MIN: return "min";
        case AggregationOp::MAX: return "max";
        case AggregationOp::COUNT: return "count";
    }
    return "avg";
}

std::optional<double> Reduce(const std::vector<double>& values, AggregationOp op) {
    if (values.empty()) {
        return std::nullopt;
    }

    switch (op) {
        case AggregationOp::SUM:
            return std::accumulate(values.begin(), values.end(), 0.0);
        case AggregationOp::MIN:
            return *std::min_element(values.begin(), values.end());
        case AggregationOp::MAX:
            return *std::max_element(values.begin(), values.end());
        case AggregationOp::COUNT:
            return static_cast<double>(values.size());
        case AggregationOp::AVG:
            break;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

} // namespace core
} // namespace telemdb
