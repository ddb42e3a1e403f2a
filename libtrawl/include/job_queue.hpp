//
// Created by Giuseppe Francione on 11/03/26.
//

/**
 * @file job_queue.hpp
 * @brief Bounded FIFO handing jobs from producers to workers.
 */

#ifndef TRAWL_JOB_QUEUE_HPP
#define TRAWL_JOB_QUEUE_HPP

#include "job.hpp"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <vector>

namespace trawl {

/**
 * @brief Multi-producer, multi-consumer bounded queue of jobs.
 *
 * @details push() blocks while the queue is full, which is how a fast
 * producer is slowed down to the pace of the workers. Every blocking call
 * takes a stop token and wakes up when it is stopped.
 */
class JobQueue {
public:
    /// @param capacity Maximum number of queued jobs, at least 1.
    explicit JobQueue(std::size_t capacity);

    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;

    /**
     * @brief Appends a job, blocking while the queue is full.
     * @throws SchedulerClosed if the queue was closed (also while blocked).
     * @throws OperationCancelled if @p st is stopped while blocked.
     */
    void push(Job job, const std::stop_token& st);

    /**
     * @brief Takes the oldest job, blocking while the queue is empty and open.
     * @return std::nullopt once the queue is closed and empty, or when @p st is stopped.
     */
    std::optional<Job> pop(const std::stop_token& st);

    /// Marks the end of the stream. Idempotent.
    void close();

    /// Removes and returns every job still queued.
    std::vector<Job> drain();

    [[nodiscard]] bool closed() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mtx_;
    std::condition_variable_any not_full_;
    std::condition_variable_any not_empty_;
    std::deque<Job> jobs_;
    bool closed_{false};
};

} // namespace trawl

#endif // TRAWL_JOB_QUEUE_HPP
