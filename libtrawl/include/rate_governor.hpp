//
// Created by Giuseppe Francione on 05/03/26.
//

/**
 * @file rate_governor.hpp
 * @brief Aggregate bandwidth limiter shared by every transfer of a run.
 */

#ifndef TRAWL_RATE_GOVERNOR_HPP
#define TRAWL_RATE_GOVERNOR_HPP

#include "http_client.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <stop_token>

namespace trawl {

/**
 * @brief Token bucket metering bytes across all concurrent jobs.
 *
 * @details Tokens accrue at the configured rate up to a burst capacity of
 * one short window. A chunk larger than the current budget is still
 * granted, leaving the bucket in debt; the caller then sleeps until the
 * debt would be repaid. Since every caller waits for the total debt, N
 * concurrent transfers share one budget instead of getting one each.
 *
 * The bucket is only locked for the arithmetic; sleeping happens outside
 * the lock and is interrupted by the caller's stop token.
 */
class RateGovernor {
public:
    static constexpr std::uint64_t kUnbounded = 0;

    /**
     * @param bytes_per_second Aggregate rate, or kUnbounded to disable throttling.
     * @param burst_window Amount of budget (expressed as time at full rate)
     * that may accumulate while transfers are idle.
     */
    explicit RateGovernor(std::uint64_t bytes_per_second = kUnbounded,
                          std::chrono::milliseconds burst_window = std::chrono::milliseconds(250));

    RateGovernor(const RateGovernor&) = delete;
    RateGovernor& operator=(const RateGovernor&) = delete;

    [[nodiscard]] bool unbounded() const noexcept { return rate_ == kUnbounded; }
    [[nodiscard]] std::uint64_t rate() const noexcept { return rate_; }

    /**
     * @brief Meters @p bytes, blocking until the shared budget allows them.
     *
     * Never blocks in unbounded mode.
     * @throws OperationCancelled if @p st is stopped while waiting.
     */
    void acquire(std::size_t bytes, const std::stop_token& st);

    /**
     * @brief Total bytes granted since construction.
     */
    [[nodiscard]] std::uint64_t total_bytes() const;

private:
    using clock = std::chrono::steady_clock;

    const std::uint64_t rate_;
    const double capacity_;

    mutable std::mutex mtx_;
    double tokens_;
    clock::time_point last_refill_;
    std::uint64_t total_bytes_{0};
};

/**
 * @brief Wraps a byte sink so every chunk is metered by @p governor first.
 *
 * The governor and the stop token must outlive the returned sink.
 */
[[nodiscard]] ByteSink make_metered_sink(RateGovernor& governor, ByteSink inner, const std::stop_token& st);

} // namespace trawl

#endif // TRAWL_RATE_GOVERNOR_HPP
