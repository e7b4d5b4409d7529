#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "telemdb/core/clock.h"
#include "telemdb/core/result.h"

namespace telemdb {
namespace storage {

/**
 * @brief Scheduler configuration
 */
struct SchedulerConfig {
    // Upper bound on one worker sleep, so clock jumps are noticed
    std::chrono::milliseconds max_wait{1000};

    SchedulerConfig() = default;
};

/**
 * @brief Per-job statistics
 */
struct JobStats {
    uint64_t runs = 0;
    uint64_t failures = 0;
    std::optional<core::Timestamp> last_run;
    std::optional<core::Timestamp> next_run;
};

/**
 * @brief Periodic background jobs (retention sweep, snapshot) with a stop token
 *
 * Jobs are registered with an interval and first run one interval after
 * registration. start() launches a single worker thread that runs due jobs
 * one at a time; stop() wakes the worker, lets the running job finish, and
 * joins it. run_due() executes due jobs on the calling thread, so tests can
 * drive the scheduler from a ManualClock without sleeping.
 */
class Scheduler {
public:
    using JobFunction = std::function<core::Result<void>()>;

    explicit Scheduler(std::shared_ptr<core::Clock> clock = core::DefaultClock(),
                       const SchedulerConfig& config = SchedulerConfig{});
    ~Scheduler();

    // Disable copy
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Disable move
    Scheduler(Scheduler&&) = delete;
    Scheduler& operator=(Scheduler&&) = delete;

    /**
     * @brief Register a periodic job
     * @return Error on an empty or duplicate name, a non-positive interval or an empty function
     */
    core::Result<void> add_job(const std::string& name, core::Duration interval_ms, JobFunction fn);

    /**
     * @brief Launch the worker thread
     */
    core::Result<void> start();

    /**
     * @brief Stop the worker thread, waiting for an in-flight job to complete
     *
     * Safe to call more than once.
     */
    core::Result<void> stop();

    /**
     * @brief Run every job whose deadline is at or before `now`
     * @return Number of jobs executed
     */
    size_t run_due(core::Timestamp now);

    /**
     * @brief Run one job immediately, regardless of its deadline
     */
    core::Result<void> run_now(const std::string& name);

    std::optional<JobStats> job_stats(const std::string& name) const;
    size_t num_jobs() const;
    bool running() const { return running_.load(); }

private:
    struct Job {
        std::string name;
        core::Duration interval_ms;
        JobFunction fn;
        core::Timestamp next_run;
        JobStats stats;
    };

    void workerThread();
    bool execute(const std::string& name, const JobFunction& fn);
    void record(size_t index, bool success, core::Timestamp now);

    std::shared_ptr<core::Clock> clock_;
    SchedulerConfig config_;

    mutable std::mutex jobs_mutex_;
    std::condition_variable wake_condition_;
    std::vector<Job> jobs_;

    std::mutex run_mutex_;  // Jobs never run concurrently
    std::thread worker_;
    std::atomic<bool> running_{false};
    bool stop_requested_ = false;  // Guarded by jobs_mutex_
};

} // namespace storage
} // namespace telemdb
