//
// Created by Giuseppe Francione on 06/03/26.
//

#include "../../include/retry_policy.hpp"
#include <algorithm>
#include <cstdint>

namespace trawl {

std::string_view to_string(const AttemptState state) noexcept {
    switch (state) {
        case AttemptState::Attempting:      return "attempting";
        case AttemptState::BackingOff:      return "backing-off";
        case AttemptState::Succeeded:       return "succeeded";
        case AttemptState::FailedTransient: return "failed-transient";
        case AttemptState::FailedPermanent: return "failed-permanent";
    }
    return "unknown";
}

std::string_view to_string(const RemuxRetryPolicy policy) noexcept {
    switch (policy) {
        case RemuxRetryPolicy::RemuxOnly: return "remux-only";
        case RemuxRetryPolicy::Refetch:   return "refetch";
    }
    return "unknown";
}

AttemptState next_state(const std::optional<ErrorClass> error,
                        const unsigned attempt,
                        const unsigned retry_budget) noexcept {
    if (!error) {
        return AttemptState::Succeeded;
    }
    if (*error != ErrorClass::Transient) {
        return AttemptState::FailedPermanent;
    }
    return attempt <= retry_budget ? AttemptState::BackingOff : AttemptState::FailedTransient;
}

std::chrono::milliseconds backoff_delay(const unsigned attempt,
                                        const std::chrono::milliseconds base,
                                        const std::chrono::milliseconds cap) noexcept {
    if (attempt == 0 || base <= std::chrono::milliseconds::zero()) {
        return std::chrono::milliseconds::zero();
    }
    // 2^20 * base is beyond any sane cap; stop doubling there
    const unsigned shift = std::min(attempt - 1, 20u);
    const std::chrono::milliseconds delay = base * (std::int64_t{1} << shift);
    return std::min(delay, cap);
}

} // namespace trawl
