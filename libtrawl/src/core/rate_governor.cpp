//
// Created by Giuseppe Francione on 05/03/26.
//

#include "../../include/rate_governor.hpp"
#include "../../include/errors.hpp"
#include "../../include/sleep_utils.hpp"
#include <algorithm>

namespace trawl {

RateGovernor::RateGovernor(const std::uint64_t bytes_per_second,
                           const std::chrono::milliseconds burst_window)
    : rate_(bytes_per_second),
      capacity_(std::max(1.0, static_cast<double>(bytes_per_second) *
                              std::chrono::duration<double>(burst_window).count())),
      tokens_(capacity_),
      last_refill_(clock::now()) {}

void RateGovernor::acquire(const std::size_t bytes, const std::stop_token& st) {
    if (st.stop_requested()) throw OperationCancelled();
    if (bytes == 0) return;

    if (unbounded()) {
        std::lock_guard lock(mtx_);
        total_bytes_ += bytes;
        return;
    }

    double deficit;
    {
        std::lock_guard lock(mtx_);
        const auto now = clock::now();
        const double elapsed = std::chrono::duration<double>(now - last_refill_).count();
        last_refill_ = now;
        tokens_ = std::min(capacity_, tokens_ + elapsed * static_cast<double>(rate_));
        tokens_ -= static_cast<double>(bytes);
        total_bytes_ += bytes;
        deficit = -tokens_;
    }

    if (deficit > 0.0) {
        const auto wait = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::duration<double>(deficit / static_cast<double>(rate_)));
        if (!interruptible_sleep(wait, st)) {
            throw OperationCancelled();
        }
    }
}

std::uint64_t RateGovernor::total_bytes() const {
    std::lock_guard lock(mtx_);
    return total_bytes_;
}

ByteSink make_metered_sink(RateGovernor& governor, ByteSink inner, const std::stop_token& st) {
    return [&governor, sink = std::move(inner), &st](const std::span<const char> chunk) {
        governor.acquire(chunk.size(), st);
        sink(chunk);
    };
}

} // namespace trawl
