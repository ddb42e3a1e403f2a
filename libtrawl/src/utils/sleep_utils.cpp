//
// Created by Giuseppe Francione on 04/03/26.
//

#include "../../include/sleep_utils.hpp"
#include <condition_variable>
#include <mutex>

namespace trawl {

bool interruptible_sleep(const std::chrono::nanoseconds duration, const std::stop_token& st) {
    if (st.stop_requested()) return false;
    if (duration <= std::chrono::nanoseconds::zero()) return true;

    std::mutex mtx;
    std::condition_variable_any cv;
    std::unique_lock lock(mtx);
    // nothing ever notifies cv except the stop callback installed by wait_for
    cv.wait_for(lock, st, duration, [] { return false; });
    return !st.stop_requested();
}

} // namespace trawl
