//
// Created by Giuseppe Francione on 11/03/26.
//

#include "../../include/job_queue.hpp"
#include "../../include/errors.hpp"
#include <algorithm>

namespace trawl {

JobQueue::JobQueue(const std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

void JobQueue::push(Job job, const std::stop_token& st) {
    {
        std::unique_lock lock(mtx_);
        if (closed_) throw SchedulerClosed();
        const bool ready = not_full_.wait(lock, st, [this] {
            return closed_ || jobs_.size() < capacity_;
        });
        if (!ready) throw OperationCancelled();
        if (closed_) throw SchedulerClosed();
        jobs_.push_back(std::move(job));
    }
    not_empty_.notify_one();
}

std::optional<Job> JobQueue::pop(const std::stop_token& st) {
    std::optional<Job> job;
    {
        std::unique_lock lock(mtx_);
        const bool ready = not_empty_.wait(lock, st, [this] {
            return closed_ || !jobs_.empty();
        });
        if (!ready || jobs_.empty() || st.stop_requested()) return std::nullopt;
        job = std::move(jobs_.front());
        jobs_.pop_front();
    }
    not_full_.notify_one();
    return job;
}

void JobQueue::close() {
    {
        const std::lock_guard lock(mtx_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

std::vector<Job> JobQueue::drain() {
    std::vector<Job> rest;
    {
        const std::lock_guard lock(mtx_);
        rest.assign(std::make_move_iterator(jobs_.begin()), std::make_move_iterator(jobs_.end()));
        jobs_.clear();
    }
    not_full_.notify_all();
    return rest;
}

bool JobQueue::closed() const {
    const std::lock_guard lock(mtx_);
    return closed_;
}

std::size_t JobQueue::size() const {
    const std::lock_guard lock(mtx_);
    return jobs_.size();
}

} // namespace trawl
