#ifndef TELEMDB_STORAGE_COMPACTOR_H_
#define TELEMDB_STORAGE_COMPACTOR_H_

#include <cstddef>
#include <optional>

#include "telemdb/core/types.h"

namespace telemdb {
namespace storage {

/**
 * @brief Lossy reduction of a series to the points that carry a significant change
 *
 * The first and last point are always kept. An interior point p[i] is kept if
 * any of its fields moved by more than the threshold relative to the previous
 * kept point, or if any field of p[i+1] moved by more than the threshold
 * relative to p[i]. Fields missing from a neighbour read as 0. Relative change
 * is |current - reference| / max(|reference|, 1).
 *
 * Dropped points are destroyed; there is no way to recover them.
 */
class Compactor {
public:
    static constexpr size_t kMinPoints = 10;
    static constexpr double kDefaultThreshold = 0.05;

    explicit Compactor(double threshold = kDefaultThreshold) : threshold_(threshold) {}

    /**
     * @brief Compute the compacted sequence
     * @return The shorter sequence, or nullopt when `points` has fewer than
     *         kMinPoints entries or nothing could be dropped
     */
    std::optional<core::PointList> compact(const core::PointList& points) const;

    static double relative_change(double current, double reference);

    double threshold() const { return threshold_; }

private:
    bool is_significant(const core::Point& current,
                        const core::Point& previous_kept,
                        const core::Point& next) const;

    double threshold_;
};

} // namespace storage
} // namespace telemdb

#endif // TELEMDB_STORAGE_COMPACTOR_H_
