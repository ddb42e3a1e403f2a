//
// Created by Giuseppe Francione on 06/03/26.
//

/**
 * @file cadence_guard.hpp
 * @brief Request pacing shared by every worker of a run.
 */

#ifndef TRAWL_CADENCE_GUARD_HPP
#define TRAWL_CADENCE_GUARD_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace trawl {

/**
 * @brief Forces a pause after every @c threshold remote requests.
 *
 * @details Remote anti-abuse systems key on how often requests arrive,
 * not on byte volume, so this guard counts requests and is independent
 * of the RateGovernor.
 *
 * The caller that would exceed the threshold sleeps for the pause, then
 * resets the counter. Callers that passed the guard earlier are not
 * affected; callers arriving during the pause block until it ends.
 */
class CadenceGuard {
public:
    /**
     * @param threshold Requests allowed between pauses; 0 disables the guard.
     * @param pause How long to pause once the threshold is reached.
     */
    CadenceGuard(unsigned threshold, std::chrono::milliseconds pause);

    CadenceGuard(const CadenceGuard&) = delete;
    CadenceGuard& operator=(const CadenceGuard&) = delete;

    /**
     * @brief Must be called right before every remote request.
     * @throws OperationCancelled if @p st is stopped while blocked or pausing.
     */
    void before_request(const std::stop_token& st);

    [[nodiscard]] unsigned threshold() const noexcept { return threshold_; }
    [[nodiscard]] std::chrono::milliseconds pause() const noexcept { return pause_; }

    /// Requests admitted since the last completed pause.
    [[nodiscard]] unsigned requests_since_pause() const;

    /// Number of completed pauses.
    [[nodiscard]] unsigned pauses() const;

private:
    const unsigned threshold_;
    const std::chrono::milliseconds pause_;

    mutable std::mutex mtx_;
    std::condition_variable_any cv_;
    unsigned count_{0};
    unsigned pauses_{0};
    bool pausing_{false};
};

} // namespace trawl

#endif // TRAWL_CADENCE_GUARD_HPP
