//
// Created by Giuseppe Francione on 06/03/26.
//

#include "../../include/cadence_guard.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"

namespace trawl {

CadenceGuard::CadenceGuard(const unsigned threshold, const std::chrono::milliseconds pause)
    : threshold_(threshold), pause_(pause) {}

void CadenceGuard::before_request(const std::stop_token& st) {
    if (st.stop_requested()) throw OperationCancelled();

    std::unique_lock lock(mtx_);
    if (threshold_ == 0) {
        ++count_;
        return;
    }

    if (!cv_.wait(lock, st, [this] { return !pausing_; })) {
        throw OperationCancelled();
    }

    if (count_ >= threshold_) {
        pausing_ = true;
        Logger::log(LogLevel::Info,
                    std::to_string(count_) + " requests sent, pausing for " +
                    std::to_string(pause_.count()) + " ms",
                    "CadenceGuard");

        // releases mtx_ while sleeping; only a stop request ends it early
        cv_.wait_for(lock, st, pause_, [] { return false; });
        pausing_ = false;

        if (st.stop_requested()) {
            cv_.notify_all();
            throw OperationCancelled();
        }
        count_ = 0;
        ++pauses_;
        cv_.notify_all();
    }
    ++count_;
}

unsigned CadenceGuard::requests_since_pause() const {
    std::lock_guard lock(mtx_);
    return count_;
}

unsigned CadenceGuard::pauses() const {
    std::lock_guard lock(mtx_);
    return pauses_;
}

} // namespace trawl
