#include "telemdb/storage/compactor.h"
#include <algorithm>
#include <cmath>

namespace telemdb {
namespace storage {

namespace {

double field_or_zero(const core::Point& point, const std::string& name) {
    return point.field(name).value_or(0.0);
}

} // namespace

double Compactor::relative_change(double current, double reference) {
    return std::abs(current - reference) / std::max(std::abs(reference), 1.0);
}

bool Compactor::is_significant(const core::Point& current,
                               const core::Point& previous_kept,
                               const core::Point& next) const {
    for (const auto& [name, value] : current.fields()) {
        const double prev_value = field_or_zero(previous_kept, name);
        const double next_value = field_or_zero(next, name);
        if (relative_change(value, prev_value) > threshold_ ||
            relative_change(next_value, value) > threshold_) {
            return true;
        }
    }
    return false;
}

std::optional<core::PointList> Compactor::compact(const core::PointList& points) const {
    if (points.size() < kMinPoints) {
        return std::nullopt;
    }

    core::PointList kept;
    kept.reserve(points.size());
    kept.push_back(points.front());

    for (size_t i = 1; i + 1 < points.size(); ++i) {
        if (is_significant(*points[i], *kept.back(), *points[i + 1])) {
            kept.push_back(points[i]);
        }
    }
    kept.push_back(points.back());

    if (kept.size() >= points.size()) {
        return std::nullopt;
    }
    return kept;
}

} // namespace storage
} // namespace telemdb
