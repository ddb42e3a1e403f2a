//
// Created by Giuseppe Francione on 06/03/26.
//

/**
 * @file retry_policy.hpp
 * @brief Per-attempt state machine of the job executor.
 *
 * The functions here are pure: they decide what happens after an attempt
 * from the error class and the attempt number alone, without I/O.
 */

#ifndef TRAWL_RETRY_POLICY_HPP
#define TRAWL_RETRY_POLICY_HPP

#include "errors.hpp"
#include <chrono>
#include <optional>
#include <string_view>

namespace trawl {

enum class AttemptState {
    Attempting,      ///< An attempt is in progress
    BackingOff,      ///< Transient failure, waiting before the next attempt
    Succeeded,       ///< Output committed
    FailedTransient, ///< Transient failures exhausted the retry budget
    FailedPermanent  ///< Permanent or fatal failure, no retry
};

/**
 * @brief What to do when a remux fails after the raw download succeeded.
 */
enum class RemuxRetryPolicy {
    RemuxOnly, ///< Keep the raw download and retry only the remux step
    Refetch    ///< Discard the raw download and fetch again
};

[[nodiscard]] std::string_view to_string(AttemptState state) noexcept;
[[nodiscard]] std::string_view to_string(RemuxRetryPolicy policy) noexcept;

/**
 * @brief Transition taken when attempt number @p attempt ends.
 *
 * @param error Class of the failure, or std::nullopt if the attempt succeeded.
 * @param attempt 1-based number of the attempt that just ended.
 * @param retry_budget Retries allowed after the first attempt.
 * @return Succeeded, BackingOff, FailedTransient or FailedPermanent.
 */
[[nodiscard]] AttemptState next_state(std::optional<ErrorClass> error,
                                      unsigned attempt,
                                      unsigned retry_budget) noexcept;

/**
 * @brief Backoff before attempt @p attempt + 1: base * 2^(attempt-1), capped.
 */
[[nodiscard]] std::chrono::milliseconds backoff_delay(unsigned attempt,
                                                      std::chrono::milliseconds base,
                                                      std::chrono::milliseconds cap) noexcept;

} // namespace trawl

#endif // TRAWL_RETRY_POLICY_HPP
