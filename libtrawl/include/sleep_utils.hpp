//
// Created by Giuseppe Francione on 04/03/26.
//

#ifndef TRAWL_SLEEP_UTILS_HPP
#define TRAWL_SLEEP_UTILS_HPP

#include <chrono>
#include <stop_token>

namespace trawl {

    /**
     * @brief Sleeps for @p duration unless @p st is stopped first.
     *
     * Wakes up as soon as a stop is requested instead of finishing the
     * sleep. Used for backoff delays and throttling waits.
     *
     * @return true if the full duration elapsed, false if interrupted.
     */
    bool interruptible_sleep(std::chrono::nanoseconds duration, const std::stop_token& st);

} // namespace trawl

#endif // TRAWL_SLEEP_UTILS_HPP
