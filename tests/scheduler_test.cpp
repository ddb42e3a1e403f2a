//
// Created by Giuseppe Francione on 22/03/26.
//

#include "../libtrawl/include/events.hpp"
#include "../libtrawl/include/scheduler.hpp"
#include "test_fakes.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <thread>

using namespace trawl;
using namespace trawl::test;
using namespace std::chrono_literals;
using ::testing::IsEmpty;

namespace {

class SchedulerTest : public ::testing::Test {
protected:
    TempDir dir;
    OutputIndex index;
    RateGovernor governor;
    CadenceGuard cadence{0, 0ms};
    FakeHttpClient http;
    FakeRemuxer remuxer;
    EventBus bus;

    ExecutorOptions options() const {
        ExecutorOptions o;
        o.backoff_base = 0ms;
        o.backoff_cap = 0ms;
        return o;
    }

    Job job(const std::string& name) const {
        Job j;
        j.url = "https://media.test/" + name + ".mp4";
        j.output_path = dir / (name + ".mp4");
        j.retry_budget = 1;
        return j;
    }

    void serve(const std::string& name, const std::chrono::milliseconds delay = 0ms) {
        auto reply = FakeHttpClient::ok("body of " + name);
        reply.delay = delay;
        http.route("https://media.test/" + name + ".mp4", reply);
    }
};

} // namespace

TEST_F(SchedulerTest, RunsEveryJobWithinConcurrencyBound) {
    constexpr int kJobs = 12;
    for (int i = 0; i < kJobs; ++i) {
        serve("job" + std::to_string(i), 50ms);
    }

    JobExecutor executor(index, governor, cadence, http, remuxer, bus, options());
    Scheduler scheduler(executor, bus, 3, 4);

    std::jthread producer([&] {
        for (int i = 0; i < kJobs; ++i) {
            scheduler.submit(job("job" + std::to_string(i)));
        }
        scheduler.close();
    });

    const auto result = scheduler.run();
    producer.join();

    EXPECT_EQ(result.completed, static_cast<unsigned>(kJobs));
    EXPECT_EQ(result.total(), static_cast<unsigned>(kJobs));
    EXPECT_EQ(result.outcomes.size(), static_cast<std::size_t>(kJobs));
    EXPECT_FALSE(result.cancelled);
    EXPECT_FALSE(result.fatal_error.has_value());
    EXPECT_LE(scheduler.peak_in_flight(), 3u);
    EXPECT_GE(scheduler.peak_in_flight(), 2u);
    EXPECT_EQ(scheduler.in_flight(), 0u);
    EXPECT_EQ(scheduler.state(), SchedulerState::Done);
}

TEST_F(SchedulerTest, MixedOutcomesAreCountedOnce) {
    serve("good1");
    serve("good2");
    http.route("https://media.test/missing.mp4", FakeHttpClient::fail(ErrorClass::Permanent, 404, "HTTP 404"));
    http.route("https://media.test/flaky.mp4", FakeHttpClient::fail(ErrorClass::Transient, 503, "HTTP 503"));
    write_file(dir / "old.mp4", "x");
    index = OutputIndex::build(dir.path());

    JobExecutor executor(index, governor, cadence, http, remuxer, bus, options());
    Scheduler scheduler(executor, bus, 2, 10);
    for (const auto* name : {"good1", "missing", "old", "flaky", "good2"}) {
        scheduler.submit(job(name));
    }
    scheduler.close();

    const auto result = scheduler.run();
    EXPECT_EQ(result.completed, 2u);
    EXPECT_EQ(result.skipped, 1u);
    EXPECT_EQ(result.failed, 2u);
    EXPECT_EQ(result.cancelled_jobs, 0u);
    EXPECT_EQ(result.total(), 5u);
    EXPECT_THAT(temp_files_in(dir.path()), IsEmpty());
}

TEST_F(SchedulerTest, SingleWorkerKeepsSubmissionOrder) {
    std::vector<std::string> started;
    bus.subscribe<JobStartEvent>([&started](const JobStartEvent& e) {
        started.push_back(e.output_path.stem().string());
    });
    for (const auto* name : {"a", "b", "c", "d"}) {
        serve(name);
    }

    JobExecutor executor(index, governor, cadence, http, remuxer, bus, options());
    Scheduler scheduler(executor, bus, 1, 2);
    std::jthread producer([&] {
        for (const auto* name : {"a", "b", "c", "d"}) {
            scheduler.submit(job(name));
        }
        scheduler.close();
    });

    const auto result = scheduler.run();
    producer.join();
    EXPECT_EQ(result.completed, 4u);
    EXPECT_EQ(started, (std::vector<std::string>{"a", "b", "c", "d"}));
}

TEST_F(SchedulerTest, SubmitAfterCloseThrows) {
    JobExecutor executor(index, governor, cadence, http, remuxer, bus, options());
    Scheduler scheduler(executor, bus, 1, 1);
    EXPECT_EQ(scheduler.state(), SchedulerState::Open);
    scheduler.close();
    scheduler.close();
    EXPECT_EQ(scheduler.state(), SchedulerState::Draining);
    EXPECT_THROW(scheduler.submit(job("late")), SchedulerClosed);

    const auto result = scheduler.run();
    EXPECT_EQ(result.total(), 0u);
    EXPECT_EQ(scheduler.state(), SchedulerState::Done);
    EXPECT_THROW(scheduler.submit(job("later")), SchedulerClosed);
}

TEST_F(SchedulerTest, CancellationReturnsPromptly) {
    for (int i = 0; i < 6; ++i) {
        serve("slow" + std::to_string(i), 10s);
    }

    JobExecutor executor(index, governor, cadence, http, remuxer, bus, options());
    Scheduler scheduler(executor, bus, 2, 10);
    for (int i = 0; i < 6; ++i) {
        scheduler.submit(job("slow" + std::to_string(i)));
    }
    scheduler.close();

    std::stop_source stop;
    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(150ms);
        stop.request_stop();
    });

    const auto start = std::chrono::steady_clock::now();
    const auto result = scheduler.run(stop.get_token());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.completed, 0u);
    EXPECT_EQ(result.failed, 0u);
    EXPECT_EQ(result.cancelled_jobs, 6u);
    EXPECT_EQ(result.outcomes.size(), 6u);
    EXPECT_THAT(temp_files_in(dir.path()), IsEmpty());
}

TEST_F(SchedulerTest, CancellationReleasesBlockedProducer) {
    for (int i = 0; i < 4; ++i) {
        serve("slow" + std::to_string(i), 10s);
    }

    JobExecutor executor(index, governor, cadence, http, remuxer, bus, options());
    Scheduler scheduler(executor, bus, 1, 1);
    std::stop_source stop;

    std::atomic<bool> producer_stopped{false};
    std::jthread producer([&] {
        try {
            for (int i = 0; i < 4; ++i) {
                scheduler.submit(job("slow" + std::to_string(i)), stop.get_token());
            }
        } catch (const OperationCancelled&) {
            producer_stopped = true;
        } catch (const SchedulerClosed&) {
            producer_stopped = true;
        }
        scheduler.close();
    });

    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(150ms);
        stop.request_stop();
    });

    const auto result = scheduler.run(stop.get_token());
    producer.join();
    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(producer_stopped.load());
}

TEST_F(SchedulerTest, FatalOutcomeStopsTheRun) {
    http.route("https://media.test/disk.mp4", FakeHttpClient::fail(ErrorClass::Fatal, 0, "No space left on device"));
    for (int i = 0; i < 5; ++i) {
        serve("after" + std::to_string(i), 10s);
    }

    JobExecutor executor(index, governor, cadence, http, remuxer, bus, options());
    Scheduler scheduler(executor, bus, 1, 10);
    scheduler.submit(job("disk"));
    for (int i = 0; i < 5; ++i) {
        scheduler.submit(job("after" + std::to_string(i)));
    }
    scheduler.close();

    const auto start = std::chrono::steady_clock::now();
    const auto result = scheduler.run();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

    ASSERT_TRUE(result.fatal_error.has_value());
    EXPECT_EQ(*result.fatal_error, "No space left on device");
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.failed, 1u);
    EXPECT_EQ(result.cancelled_jobs, 5u);
    EXPECT_EQ(http.calls(), 1u);
}

TEST_F(SchedulerTest, RunTwiceIsAnError) {
    JobExecutor executor(index, governor, cadence, http, remuxer, bus, options());
    Scheduler scheduler(executor, bus, 1, 1);
    scheduler.close();
    (void) scheduler.run();
    EXPECT_THROW((void) scheduler.run(), std::logic_error);
}
