//
// Created by Giuseppe Francione on 23/03/26.
//

#include "../libtrawl/include/run_config.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace trawl;
using namespace std::chrono_literals;

TEST(RunConfig, DefaultsAreValid) {
    const RunConfig cfg;
    EXPECT_NO_THROW(cfg.validate());
    EXPECT_EQ(cfg.concurrency, 5u);
    EXPECT_EQ(cfg.queue_capacity, 50u);
    EXPECT_EQ(cfg.retry_budget, 3u);
    EXPECT_EQ(cfg.rate_limit, RateGovernor::kUnbounded);
    EXPECT_EQ(cfg.cadence_threshold, 0u);
    EXPECT_EQ(cfg.remux_policy, RemuxRetryPolicy::RemuxOnly);
    EXPECT_TRUE(cfg.skip_existing);
}

TEST(RunConfig, RejectsNonsense) {
    RunConfig cfg;
    cfg.concurrency = 0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = RunConfig{};
    cfg.queue_capacity = 0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = RunConfig{};
    cfg.backoff_base = 5s;
    cfg.backoff_cap = 1s;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = RunConfig{};
    cfg.cadence_threshold = 10;
    cfg.cadence_pause = 0ms;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST(RunConfig, ExecutorOptionsCarryValues) {
    RunConfig cfg;
    cfg.user_agent = "agent/2";
    cfg.remux_policy = RemuxRetryPolicy::Refetch;
    cfg.backoff_base = 250ms;
    const auto options = cfg.executor_options();
    EXPECT_EQ(options.user_agent, "agent/2");
    EXPECT_EQ(options.remux_policy, RemuxRetryPolicy::Refetch);
    EXPECT_EQ(options.backoff_base, 250ms);
    EXPECT_EQ(options.backoff_cap, 30s);
}

TEST(ParseRateLimit, AcceptsUnboundedSpellings) {
    EXPECT_EQ(parse_rate_limit("0"), RateGovernor::kUnbounded);
    EXPECT_EQ(parse_rate_limit("unbounded"), RateGovernor::kUnbounded);
    EXPECT_EQ(parse_rate_limit(" Unlimited "), RateGovernor::kUnbounded);
}

TEST(ParseRateLimit, AcceptsSuffixes) {
    EXPECT_EQ(parse_rate_limit("500000"), 500000u);
    EXPECT_EQ(parse_rate_limit("512K"), 512u * 1024);
    EXPECT_EQ(parse_rate_limit("512kb"), 512u * 1024);
    EXPECT_EQ(parse_rate_limit("2M"), 2u * 1024 * 1024);
    EXPECT_EQ(parse_rate_limit("1.5M/s"), 1572864u);
    EXPECT_EQ(parse_rate_limit("1GB/s"), 1024ull * 1024 * 1024);
}

TEST(ParseRateLimit, RejectsGarbage) {
    EXPECT_THROW((void) parse_rate_limit(""), std::invalid_argument);
    EXPECT_THROW((void) parse_rate_limit("fast"), std::invalid_argument);
    EXPECT_THROW((void) parse_rate_limit("-5K"), std::invalid_argument);
    EXPECT_THROW((void) parse_rate_limit("12X"), std::invalid_argument);
    EXPECT_THROW((void) parse_rate_limit("M"), std::invalid_argument);
}

TEST(ParseRateLimit, RejectsRatesThatRoundToZero) {
    EXPECT_THROW((void) parse_rate_limit("0.4"), std::invalid_argument);
    EXPECT_THROW((void) parse_rate_limit("0.2B/s"), std::invalid_argument);
    EXPECT_EQ(parse_rate_limit("0.6"), 1u);
    EXPECT_EQ(parse_rate_limit("0.001K"), 1u);
    EXPECT_EQ(parse_rate_limit("0.0"), RateGovernor::kUnbounded);
}

TEST(ParseRemuxPolicy, KnownNames) {
    EXPECT_EQ(parse_remux_policy("remux-only"), RemuxRetryPolicy::RemuxOnly);
    EXPECT_EQ(parse_remux_policy("REFETCH"), RemuxRetryPolicy::Refetch);
    EXPECT_FALSE(parse_remux_policy("sometimes").has_value());
}

TEST(FormatBytes, PicksUnit) {
    EXPECT_EQ(format_bytes(512), "512 B");
    EXPECT_EQ(format_bytes(1536), "1.50 KiB");
    EXPECT_EQ(format_bytes(3ull * 1024 * 1024), "3.00 MiB");
}
