#include "telemdb/storage/retention.h"
#include <algorithm>

namespace telemdb {
namespace storage {

size_t RetentionEnforcer::apply(core::PointList& points, core::Timestamp now) const {
    size_t removed = enforce_size(points);
    removed += enforce_age(points, now);
    return removed;
}

size_t RetentionEnforcer::enforce_size(core::PointList& points) const {
    if (points.size() <= policy_.max_points_per_series) {
        return 0;
    }
    const size_t excess = points.size() - policy_.max_points_per_series;
    points.erase(points.begin(), points.begin() + static_cast<std::ptrdiff_t>(excess));
    return excess;
}

size_t RetentionEnforcer::enforce_age(core::PointList& points, core::Timestamp now) const {
    const core::Timestamp limit = cutoff(now);
    auto it = std::remove_if(points.begin(), points.end(), [limit](const core::PointPtr& p) {
        return p->timestamp() < limit;
    });
    const size_t removed = static_cast<size_t>(std::distance(it, points.end()));
    points.erase(it, points.end());
    return removed;
}

} // namespace storage
} // namespace telemdb
