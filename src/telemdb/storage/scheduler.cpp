#include "telemdb/storage/scheduler.h"
#include "telemdb/common/logger.h"

#include <algorithm>

namespace telemdb {
namespace storage {

Scheduler::Scheduler(std::shared_ptr<core::Clock> clock, const SchedulerConfig& config)
    : clock_(clock ? std::move(clock) : core::DefaultClock()), config_(config) {
}

Scheduler::~Scheduler() {
    stop();
}

core::Result<void> Scheduler::add_job(const std::string& name, core::Duration interval_ms, JobFunction fn) {
    if (name.empty()) {
        return core::Result<void>(core::InvalidArgumentError("Job name cannot be empty"));
    }
    if (interval_ms <= 0) {
        return core::Result<void>(core::InvalidArgumentError("Invalid interval for job '" + name + "': " + std::to_string(interval_ms)));
    }
    if (!fn) {
        return core::Result<void>(core::InvalidArgumentError("Job '" + name + "' has no function"));
    }

    std::lock_guard<std::mutex> lock(jobs_mutex_);
    for (const auto& job : jobs_) {
        if (job.name == name) {
            return core::Result<void>::error("Job already registered: " + name);
        }
    }

    Job job;
    job.name = name;
    job.interval_ms = interval_ms;
    job.fn = std::move(fn);
    job.next_run = clock_->now_ms() + interval_ms;
    job.stats.next_run = job.next_run;
    jobs_.push_back(std::move(job));

    wake_condition_.notify_all();
    return core::Result<void>();
}

core::Result<void> Scheduler::start() {
    if (running_.load()) {
        return core::Result<void>::error("Scheduler already running");
    }

    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        stop_requested_ = false;
    }
    running_.store(true);
    worker_ = std::thread(&Scheduler::workerThread, this);

    TELEMDB_INFO("Scheduler started with {} jobs", num_jobs());
    return core::Result<void>();
}

core::Result<void> Scheduler::stop() {
    if (!running_.load()) {
        return core::Result<void>();
    }

    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        stop_requested_ = true;
    }
    wake_condition_.notify_all();

    // A job in progress holds run_mutex_ and finishes before the worker exits
    if (worker_.joinable()) {
        worker_.join();
    }
    running_.store(false);

    TELEMDB_INFO("Scheduler stopped");
    return core::Result<void>();
}

size_t Scheduler::run_due(core::Timestamp now) {
    std::lock_guard<std::mutex> run_lock(run_mutex_);

    size_t executed = 0;
    for (size_t i = 0;; ++i) {
        std::string name;
        JobFunction fn;
        {
            std::lock_guard<std::mutex> lock(jobs_mutex_);
            if (i >= jobs_.size()) {
                break;
            }
            Job& job = jobs_[i];
            if (job.next_run > now) {
                continue;
            }
            name = job.name;
            fn = job.fn;
            job.next_run = now + job.interval_ms;
            job.stats.next_run = job.next_run;
        }

        const bool success = execute(name, fn);
        record(i, success, now);
        executed++;
    }
    return executed;
}

core::Result<void> Scheduler::run_now(const std::string& name) {
    std::lock_guard<std::mutex> run_lock(run_mutex_);

    size_t index = 0;
    JobFunction fn;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        auto it = std::find_if(jobs_.begin(), jobs_.end(), [&name](const Job& job) {
            return job.name == name;
        });
        if (it == jobs_.end()) {
            return core::Result<void>(core::NotFoundError("No such job: " + name));
        }
        index = static_cast<size_t>(std::distance(jobs_.begin(), it));
        fn = it->fn;
    }

    const bool success = execute(name, fn);
    record(index, success, clock_->now_ms());
    if (!success) {
        return core::Result<void>::error("Job '" + name + "' failed");
    }
    return core::Result<void>();
}

bool Scheduler::execute(const std::string& name, const JobFunction& fn) {
    try {
        auto result = fn();
        if (!result.ok()) {
            TELEMDB_WARN("Scheduled job '{}' failed ({} error): {}", name,
                         core::Error::CodeName(result.error_code()), result.error());
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        TELEMDB_ERROR("Scheduled job '{}' threw: {}", name, e.what());
        return false;
    }
}

void Scheduler::record(size_t index, bool success, core::Timestamp now) {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    JobStats& stats = jobs_[index].stats;
    stats.runs++;
    if (!success) {
        stats.failures++;
    }
    stats.last_run = now;
}

std::optional<JobStats> Scheduler::job_stats(const std::string& name) const {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    for (const auto& job : jobs_) {
        if (job.name == name) {
            return job.stats;
        }
    }
    return std::nullopt;
}

size_t Scheduler::num_jobs() const {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    return jobs_.size();
}

void Scheduler::workerThread() {
    std::unique_lock<std::mutex> lock(jobs_mutex_);

    while (!stop_requested_) {
        const core::Timestamp now = clock_->now_ms();

        core::Duration wait_ms = config_.max_wait.count();
        bool due = false;
        for (const auto& job : jobs_) {
            if (job.next_run <= now) {
                due = true;
                break;
            }
            wait_ms = std::min(wait_ms, job.next_run - now);
        }

        if (due) {
            lock.unlock();
            run_due(now);
            lock.lock();
            continue;
        }

        wake_condition_.wait_for(lock, std::chrono::milliseconds(wait_ms), [this] {
            return stop_requested_;
        });
    }
}

} // namespace storage
} // namespace telemdb
