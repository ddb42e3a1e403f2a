//
// Created by Giuseppe Francione on 12/03/26.
//

#include "../../include/scheduler.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace trawl {

std::string_view to_string(const SchedulerState state) noexcept {
    switch (state) {
        case SchedulerState::Open:     return "open";
        case SchedulerState::Draining: return "draining";
        case SchedulerState::Done:     return "done";
    }
    return "unknown";
}

Scheduler::Scheduler(JobExecutor& executor, EventBus& bus, const unsigned concurrency, const std::size_t queue_capacity)
    : executor_(executor),
      bus_(bus),
      concurrency_(std::max(concurrency, 1u)),
      queue_(queue_capacity) {}

void Scheduler::submit(Job job, const std::stop_token& st) {
    if (state_.load() != SchedulerState::Open) {
        throw SchedulerClosed();
    }
    queue_.push(std::move(job), st);
}

void Scheduler::close() {
    auto expected = SchedulerState::Open;
    state_.compare_exchange_strong(expected, SchedulerState::Draining);
    queue_.close();
}

void Scheduler::job_started() {
    const unsigned now = ++in_flight_;
    unsigned peak = peak_in_flight_.load();
    while (now > peak && !peak_in_flight_.compare_exchange_weak(peak, now)) {
    }
}

void Scheduler::worker_loop(const std::stop_token& st,
                            std::stop_source& run_stop,
                            RunResult& result,
                            std::mutex& result_mtx) {
    while (!st.stop_requested()) {
        std::optional<Job> job = queue_.pop(st);
        if (!job) {
            break;
        }

        job_started();
        JobOutcome outcome;
        try {
            outcome = executor_.execute(*job, st);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error,
                        "Unexpected error in " + job->output_path.filename().string() + ": " + e.what(),
                        "Scheduler");
            outcome.job = *job;
            outcome.kind = OutcomeKind::Failed;
            outcome.reason = e.what();
            bus_.publish(JobFailedEvent{job->output_path, outcome.reason, outcome.attempts, false});
        }
        --in_flight_;

        const std::lock_guard lock(result_mtx);
        switch (outcome.kind) {
            case OutcomeKind::Completed: ++result.completed; break;
            case OutcomeKind::Skipped:   ++result.skipped; break;
            case OutcomeKind::Failed:    ++result.failed; break;
            case OutcomeKind::Cancelled: ++result.cancelled_jobs; break;
            case OutcomeKind::Fatal:
                ++result.failed;
                if (!result.fatal_error) {
                    result.fatal_error = outcome.reason;
                    Logger::log(LogLevel::Error, "Fatal error, stopping run: " + outcome.reason, "Scheduler");
                    run_stop.request_stop();
                }
                break;
        }
        result.outcomes.push_back(std::move(outcome));
    }
}

RunResult Scheduler::run(const std::stop_token& st) {
    if (ran_.exchange(true)) {
        throw std::logic_error("Scheduler::run called twice");
    }

    RunResult result;
    std::mutex result_mtx;
    std::stop_source run_stop;
    std::stop_callback forward_stop(st, [&run_stop] { run_stop.request_stop(); });

    Logger::log(LogLevel::Debug, "Starting " + std::to_string(concurrency_) + " workers", "Scheduler");
    {
        std::vector<std::jthread> workers;
        workers.reserve(concurrency_);
        for (unsigned i = 0; i < concurrency_; ++i) {
            workers.emplace_back([this, token = run_stop.get_token(), &run_stop, &result, &result_mtx] {
                worker_loop(token, run_stop, result, result_mtx);
            });
        }
        for (auto& w : workers) {
            w.join();
        }
    }

    // closing first makes a producer blocked in submit() give up
    auto expected = SchedulerState::Open;
    state_.compare_exchange_strong(expected, SchedulerState::Draining);
    queue_.close();

    for (auto& job : queue_.drain()) {
        bus_.publish(JobCancelledEvent{job.output_path});
        JobOutcome outcome;
        outcome.job = std::move(job);
        outcome.kind = OutcomeKind::Cancelled;
        outcome.reason = "cancelled before start";
        ++result.cancelled_jobs;
        result.outcomes.push_back(std::move(outcome));
    }

    result.cancelled = st.stop_requested();
    state_.store(SchedulerState::Done);

    Logger::log(LogLevel::Debug,
                "Run finished: " + std::to_string(result.completed) + " completed, " +
                    std::to_string(result.skipped) + " skipped, " + std::to_string(result.failed) + " failed, " +
                    std::to_string(result.cancelled_jobs) + " cancelled",
                "Scheduler");
    return result;
}

} // namespace trawl
