#include "telemdb/storage/series.h"
#include <algorithm>
#include <mutex>

namespace telemdb {
namespace storage {

Series::Series(core::SeriesID id, core::SeriesKey key)
    : id_(id), key_(std::move(key)) {}

AppendResult Series::append(core::PointPtr point,
                            const RetentionEnforcer& enforcer,
                            const Compactor* compactor,
                            core::Timestamp now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    points_.push_back(std::move(point));

    AppendResult result;
    result.evicted = enforcer.apply(points_, now);
    if (compactor) {
        result.compacted = compact_locked(*compactor);
    }
    return result;
}

size_t Series::enforce(const RetentionEnforcer& enforcer, core::Timestamp now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return enforcer.apply(points_, now);
}

size_t Series::compact(const Compactor& compactor) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return compact_locked(compactor);
}

size_t Series::compact_locked(const Compactor& compactor) {
    auto compacted = compactor.compact(points_);
    if (!compacted) {
        return 0;
    }
    const size_t removed = points_.size() - compacted->size();
    points_ = std::move(*compacted);
    return removed;
}

size_t Series::restore(core::PointList points, const RetentionEnforcer& enforcer, core::Timestamp now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    points_ = std::move(points);
    enforcer.apply(points_, now);
    return points_.size();
}

void Series::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    points_.clear();
}

core::PointList Series::points() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return points_;
}

size_t Series::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return points_.size();
}

bool Series::empty() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return points_.empty();
}

std::optional<core::Timestamp> Series::min_timestamp() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (points_.empty()) {
        return std::nullopt;
    }
    auto it = std::min_element(points_.begin(), points_.end(), [](const auto& a, const auto& b) {
        return a->timestamp() < b->timestamp();
    });
    return (*it)->timestamp();
}

std::optional<core::Timestamp> Series::max_timestamp() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (points_.empty()) {
        return std::nullopt;
    }
    auto it = std::max_element(points_.begin(), points_.end(), [](const auto& a, const auto& b) {
        return a->timestamp() < b->timestamp();
    });
    return (*it)->timestamp();
}

} // namespace storage
} // namespace telemdb
