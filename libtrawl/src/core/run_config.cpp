//
// Created by Giuseppe Francione on 13/03/26.
//

#include "../../include/run_config.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace trawl {

namespace {

std::string lowercase_trimmed(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    std::string out(text);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

} // namespace

void RunConfig::validate() const {
    if (concurrency == 0) {
        throw std::invalid_argument("concurrency must be at least 1");
    }
    if (queue_capacity == 0) {
        throw std::invalid_argument("queue capacity must be at least 1");
    }
    if (burst_window.count() <= 0) {
        throw std::invalid_argument("burst window must be positive");
    }
    if (cadence_threshold > 0 && cadence_pause.count() <= 0) {
        throw std::invalid_argument("cadence pause must be positive when a threshold is set");
    }
    if (backoff_base.count() < 0 || backoff_cap < backoff_base) {
        throw std::invalid_argument("backoff cap must be at least the backoff base");
    }
    if (connect_timeout.count() <= 0 || stall_timeout.count() <= 0) {
        throw std::invalid_argument("timeouts must be positive");
    }
}

ExecutorOptions RunConfig::executor_options() const {
    ExecutorOptions options;
    options.user_agent = user_agent;
    options.remux_policy = remux_policy;
    options.backoff_base = backoff_base;
    options.backoff_cap = backoff_cap;
    options.connect_timeout = connect_timeout;
    options.stall_timeout = stall_timeout;
    return options;
}

std::uint64_t parse_rate_limit(const std::string_view text) {
    std::string s = lowercase_trimmed(text);
    if (s == "0" || s == "unbounded" || s == "unlimited") {
        return RateGovernor::kUnbounded;
    }

    if (s.ends_with("/s")) s.resize(s.size() - 2);
    if (s.ends_with("b")) s.pop_back();

    std::uint64_t multiplier = 1;
    if (!s.empty()) {
        switch (s.back()) {
            case 'k': multiplier = 1024ULL; break;
            case 'm': multiplier = 1024ULL * 1024; break;
            case 'g': multiplier = 1024ULL * 1024 * 1024; break;
            default: break;
        }
        if (multiplier != 1) s.pop_back();
    }

    double value = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (s.empty() || ec != std::errc() || ptr != s.data() + s.size() || !std::isfinite(value) || value < 0) {
        throw std::invalid_argument("invalid rate limit: '" + std::string(text) + "'");
    }

    const double bytes = std::round(value * static_cast<double>(multiplier));
    // a positive rate must not round down to the unbounded value
    if (value > 0 && bytes < 1) {
        throw std::invalid_argument("rate limit below 1 byte/s: '" + std::string(text) + "'");
    }
    if (bytes >= 18446744073709551615.0) {
        throw std::invalid_argument("rate limit out of range: '" + std::string(text) + "'");
    }
    return static_cast<std::uint64_t>(bytes);
}

std::optional<RemuxRetryPolicy> parse_remux_policy(const std::string_view text) {
    const auto s = lowercase_trimmed(text);
    if (s == "remux-only" || s == "remux_only" || s == "remuxonly") return RemuxRetryPolicy::RemuxOnly;
    if (s == "refetch") return RemuxRetryPolicy::Refetch;
    return std::nullopt;
}

std::string format_bytes(const std::uintmax_t bytes) {
    static constexpr std::array<const char*, 5> units = {"B", "KiB", "MiB", "GiB", "TiB"};
    auto value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    if (unit == 0) {
        std::snprintf(buf, sizeof(buf), "%ju B", bytes);
    } else {
        std::snprintf(buf, sizeof(buf), "%.2f %s", value, units[unit]);
    }
    return buf;
}

} // namespace trawl
