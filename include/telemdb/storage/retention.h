#ifndef TELEMDB_STORAGE_RETENTION_H_
#define TELEMDB_STORAGE_RETENTION_H_

#include <cstddef>

#include "telemdb/core/types.h"

namespace telemdb {
namespace storage {

/**
 * @brief Limits applied to every series
 */
struct RetentionPolicy {
    core::Duration retention_period_ms;
    size_t max_points_per_series;
};

/**
 * @brief Restores the size and age invariants of a single series
 *
 * Size rule: keep at most max_points_per_series, evicting from the head.
 * Time rule: drop every point with timestamp < now - retention_period_ms.
 * Applying both is idempotent and the order does not matter.
 */
class RetentionEnforcer {
public:
    explicit RetentionEnforcer(const RetentionPolicy& policy) : policy_(policy) {}

    /**
     * @brief Apply both rules to `points`
     * @return Number of points removed
     */
    size_t apply(core::PointList& points, core::Timestamp now) const;

    size_t enforce_size(core::PointList& points) const;
    size_t enforce_age(core::PointList& points, core::Timestamp now) const;

    core::Timestamp cutoff(core::Timestamp now) const { return now - policy_.retention_period_ms; }

    const RetentionPolicy& policy() const { return policy_; }

private:
    RetentionPolicy policy_;
};

} // namespace storage
} // namespace telemdb

#endif // TELEMDB_STORAGE_RETENTION_H_
