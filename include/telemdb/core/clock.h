#ifndef TELEMDB_CORE_CLOCK_H_
#define TELEMDB_CORE_CLOCK_H_

#include <atomic>
#include <chrono>
#include <memory>

#include "telemdb/core/types.h"

namespace telemdb {
namespace core {

/**
 * @brief Source of "now" for retention cutoffs, time-range queries and the scheduler
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now_ms() const = 0;
};

/**
 * @brief Wall clock in milliseconds since Unix epoch
 */
class SystemClock : public Clock {
public:
    Timestamp now_ms() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

/**
 * @brief Clock that only moves when told to. Used by tests and replay tools.
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}

    Timestamp now_ms() const override { return now_.load(); }
    void set(Timestamp ts) { now_.store(ts); }
    void advance(Duration delta) { now_.fetch_add(delta); }

private:
    std::atomic<Timestamp> now_;
};

inline std::shared_ptr<Clock> DefaultClock() {
    static std::shared_ptr<Clock> clock = std::make_shared<SystemClock>();
    return clock;
}

} // namespace core
} // namespace telemdb

#endif // TELEMDB_CORE_CLOCK_H_
