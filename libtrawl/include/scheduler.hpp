//
// Created by Giuseppe Francione on 12/03/26.
//

/**
 * @file scheduler.hpp
 * @brief Bounded worker pool driving jobs through the executor.
 */

#ifndef TRAWL_SCHEDULER_HPP
#define TRAWL_SCHEDULER_HPP

#include "event_bus.hpp"
#include "job.hpp"
#include "job_executor.hpp"
#include "job_queue.hpp"
#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace trawl {

enum class SchedulerState {
    Open,     ///< Accepting jobs
    Draining, ///< Closed for submission, queued jobs still being processed
    Done      ///< run() returned
};

[[nodiscard]] std::string_view to_string(SchedulerState state) noexcept;

/**
 * @brief Aggregate result of a run.
 */
struct RunResult {
    unsigned completed = 0;
    unsigned skipped = 0;
    unsigned failed = 0;          ///< Failed and fatal outcomes
    unsigned cancelled_jobs = 0;  ///< Jobs abandoned because the run was stopped
    bool cancelled = false;       ///< The run was stopped from outside
    std::optional<std::string> fatal_error; ///< First fatal error, if any
    std::vector<JobOutcome> outcomes;       ///< In completion order

    [[nodiscard]] unsigned total() const noexcept {
        return completed + skipped + failed + cancelled_jobs;
    }
};

/**
 * @brief Runs submitted jobs on a fixed number of worker threads.
 *
 * @details Producers call submit() (possibly from their own thread, while
 * run() is active) and finally close(). run() starts the workers and
 * returns once every submitted job has an outcome, or promptly after
 * cancellation. A job failure never affects its siblings; a fatal outcome
 * stops the whole run.
 */
class Scheduler {
public:
    /**
     * @param executor Shared executor, must outlive the scheduler.
     * @param bus Bus receiving cancellation events for jobs never started.
     * @param concurrency Number of worker threads, at least 1.
     * @param queue_capacity Bound of the submission queue, at least 1.
     */
    Scheduler(JobExecutor& executor, EventBus& bus, unsigned concurrency = 5, std::size_t queue_capacity = 50);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Queues a job, blocking while the queue is full.
     * @throws SchedulerClosed after close() or once the run is over.
     * @throws OperationCancelled if @p st is stopped while blocked.
     */
    void submit(Job job, const std::stop_token& st = {});

    /// Signals that no more jobs will be submitted. Idempotent.
    void close();

    /**
     * @brief Processes jobs until the queue is closed and drained, or @p st is stopped.
     *
     * Jobs still queued when the run stops are reported as cancelled.
     * @throws std::logic_error if called more than once.
     */
    RunResult run(const std::stop_token& st = {});

    [[nodiscard]] SchedulerState state() const noexcept { return state_.load(); }
    [[nodiscard]] unsigned in_flight() const noexcept { return in_flight_.load(); }
    [[nodiscard]] unsigned peak_in_flight() const noexcept { return peak_in_flight_.load(); }
    [[nodiscard]] unsigned concurrency() const noexcept { return concurrency_; }
    [[nodiscard]] std::size_t queued() const { return queue_.size(); }

private:
    void worker_loop(const std::stop_token& st, std::stop_source& run_stop, RunResult& result, std::mutex& result_mtx);
    void job_started();

    JobExecutor& executor_;
    EventBus& bus_;
    const unsigned concurrency_;
    JobQueue queue_;

    std::atomic<SchedulerState> state_{SchedulerState::Open};
    std::atomic<bool> ran_{false};
    std::atomic<unsigned> in_flight_{0};
    std::atomic<unsigned> peak_in_flight_{0};
};

} // namespace trawl

#endif // TRAWL_SCHEDULER_HPP
