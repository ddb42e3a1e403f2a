//
// Created by Giuseppe Francione on 13/03/26.
//

/**
 * @file run_config.hpp
 * @brief Every tunable of a run, with defaults.
 */

#ifndef TRAWL_RUN_CONFIG_HPP
#define TRAWL_RUN_CONFIG_HPP

#include "job_executor.hpp"
#include "retry_policy.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace trawl {

struct RunConfig {
    std::filesystem::path output_dir = ".";
    unsigned concurrency = 5;
    std::size_t queue_capacity = 50;
    unsigned retry_budget = 3;
    std::uint64_t rate_limit = RateGovernor::kUnbounded;  ///< Aggregate bytes/second
    std::chrono::milliseconds burst_window{250};
    unsigned cadence_threshold = 0;                       ///< 0 disables the pause
    std::chrono::milliseconds cadence_pause{30000};
    std::chrono::milliseconds backoff_base{1000};
    std::chrono::milliseconds backoff_cap{30000};
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds stall_timeout{60};
    std::string user_agent = "trawl/1.0";
    RemuxRetryPolicy remux_policy = RemuxRetryPolicy::RemuxOnly;
    bool skip_existing = true;
    bool allow_overwrite = false;

    /**
     * @brief Checks the values that have no meaningful interpretation.
     * @throws std::invalid_argument naming the offending setting.
     */
    void validate() const;

    [[nodiscard]] ExecutorOptions executor_options() const;
};

/**
 * @brief Parses a bandwidth limit such as "0", "unbounded", "500000", "512K", "1.5M/s" or "2GB".
 *
 * Suffixes are powers of 1024, case-insensitive, optionally followed by "B" and "/s".
 * @return Bytes per second, RateGovernor::kUnbounded for "0" or "unbounded".
 * @throws std::invalid_argument on anything else, including positive rates below 1 byte/s.
 */
[[nodiscard]] std::uint64_t parse_rate_limit(std::string_view text);

/**
 * @brief Parses "remux-only" or "refetch".
 */
[[nodiscard]] std::optional<RemuxRetryPolicy> parse_remux_policy(std::string_view text);

/**
 * @brief Human readable byte count ("1.50 MiB").
 */
[[nodiscard]] std::string format_bytes(std::uintmax_t bytes);

} // namespace trawl

#endif // TRAWL_RUN_CONFIG_HPP
