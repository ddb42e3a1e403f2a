//
// Created by Giuseppe Francione on 02/04/26.
//

#include "../libtrawl/include/manifest_producer.hpp"
#include "test_fakes.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cerrno>
#include <sstream>
#include <system_error>
#include <thread>
#include <unistd.h>

using namespace trawl;
using namespace trawl::test;
using namespace std::chrono_literals;
using ::testing::IsEmpty;

namespace {

// both ends closed on destruction
class Pipe {
public:
    Pipe() {
        if (::pipe(fds_) != 0) throw std::system_error(errno, std::generic_category(), "pipe");
    }
    ~Pipe() {
        close_write();
        ::close(fds_[0]);
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    [[nodiscard]] int read_fd() const { return fds_[0]; }

    void write(const std::string& text) const {
        ASSERT_EQ(::write(fds_[1], text.data(), text.size()), static_cast<ssize_t>(text.size()));
    }

    void close_write() {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    int fds_[2] = {-1, -1};
};

class ManifestProducerTest : public ::testing::Test {
protected:
    TempDir dir;
    OutputIndex index;
    RateGovernor governor;
    CadenceGuard cadence{0, 0ms};
    FakeHttpClient http;
    FakeRemuxer remuxer;
    EventBus bus;

    JobExecutor executor{index, governor, cadence, http, remuxer, bus, options()};

    static ExecutorOptions options() {
        ExecutorOptions o;
        o.backoff_base = 0ms;
        o.backoff_cap = 0ms;
        return o;
    }

    JobDefaults defaults() const {
        JobDefaults d;
        d.output_dir = dir.path();
        d.retry_budget = 0;
        return d;
    }

    // polls until pred() holds, false after two seconds
    template <typename Pred>
    static bool eventually(Pred pred) {
        for (int i = 0; i < 200; ++i) {
            if (pred()) return true;
            std::this_thread::sleep_for(10ms);
        }
        return pred();
    }
};

} // namespace

TEST_F(ManifestProducerTest, SkipsMalformedLinesAndSubmitsTheRest) {
    http.route("https://media.test/a.mp4", FakeHttpClient::ok("first"));
    http.route("https://media.test/b.mp4", FakeHttpClient::ok("second"));

    std::istringstream manifest(
        "# exported list\n"
        "https://media.test/a.mp4\tone\n"
        "\n"
        "no-tab-here\n"
        "https://media.test/b.mp4\ttwo\thttps://media.test/page\r\n"
        "https://media.test/c.mp4\t\n"
        "a\tb\tc\td\n");

    Scheduler scheduler(executor, bus, 2, 10);
    const ProducerStats stats = produce_jobs(manifest, defaults(), scheduler, {});

    EXPECT_EQ(stats.submitted, 2u);
    EXPECT_EQ(stats.malformed, 3u);
    EXPECT_EQ(scheduler.queued(), 2u);
    EXPECT_EQ(scheduler.state(), SchedulerState::Draining);

    const auto result = scheduler.run();
    EXPECT_EQ(result.completed, 2u);
    EXPECT_EQ(result.total(), stats.submitted);
    EXPECT_EQ(read_file(dir / "one.mp4"), "first");
    EXPECT_EQ(read_file(dir / "two.mp4"), "second");

    for (const auto& request : http.requests()) {
        if (request.url == "https://media.test/b.mp4") {
            EXPECT_EQ(request.referer, "https://media.test/page");
        } else {
            EXPECT_TRUE(request.referer.empty());
        }
    }
}

TEST_F(ManifestProducerTest, ClosesSchedulerAtEndOfInput) {
    std::istringstream manifest("# nothing to do\n\n");
    Scheduler scheduler(executor, bus, 1, 1);

    const ProducerStats stats = produce_jobs(manifest, defaults(), scheduler, {});
    EXPECT_EQ(stats.submitted, 0u);
    EXPECT_EQ(scheduler.state(), SchedulerState::Draining);

    const auto result = scheduler.run();
    EXPECT_EQ(result.total(), 0u);
    EXPECT_THAT(result.outcomes, IsEmpty());
}

TEST_F(ManifestProducerTest, StopsWhenSchedulerIsClosed) {
    std::istringstream manifest("https://media.test/a.mp4\tone\nhttps://media.test/b.mp4\ttwo\n");
    Scheduler scheduler(executor, bus, 1, 4);
    scheduler.close();

    const ProducerStats stats = produce_jobs(manifest, defaults(), scheduler, {});
    EXPECT_EQ(stats.submitted, 0u);
    EXPECT_EQ(scheduler.queued(), 0u);
}

TEST_F(ManifestProducerTest, StopReleasesProducerBlockedOnFullQueue) {
    std::istringstream manifest(
        "https://media.test/a.mp4\tone\n"
        "https://media.test/b.mp4\ttwo\n"
        "https://media.test/c.mp4\tthree\n");

    // capacity 1 and no run: the second submit blocks
    Scheduler scheduler(executor, bus, 1, 1);
    std::stop_source stop;
    std::atomic<bool> finished{false};
    ProducerStats stats;

    std::jthread producer([&] {
        stats = produce_jobs(manifest, defaults(), scheduler, stop.get_token());
        finished = true;
    });

    ASSERT_TRUE(eventually([&] { return scheduler.queued() == 1; }));
    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(finished.load());

    stop.request_stop();
    ASSERT_TRUE(eventually([&] { return finished.load(); }));
    producer.join();

    EXPECT_EQ(stats.submitted, 1u);
    EXPECT_EQ(scheduler.state(), SchedulerState::Draining);
}

TEST_F(ManifestProducerTest, StopEndsProducerOnIdleOpenInput) {
    Pipe pipe;
    pipe.write("https://media.test/a.mp4\tone\n");

    Scheduler scheduler(executor, bus, 1, 10);
    std::stop_source stop;
    std::atomic<bool> finished{false};
    ProducerStats stats;

    std::jthread producer([&] {
        FdLineReader reader(pipe.read_fd(), 20ms);
        stats = produce_jobs(reader, defaults(), scheduler, stop.get_token());
        finished = true;
    });

    // the write end stays open, so only the stop can end the read
    ASSERT_TRUE(eventually([&] { return scheduler.queued() == 1; }));
    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(finished.load());

    stop.request_stop();
    EXPECT_TRUE(eventually([&] { return finished.load(); }));
    producer.join();

    EXPECT_EQ(stats.submitted, 1u);
    EXPECT_EQ(scheduler.state(), SchedulerState::Draining);
}

TEST(FdLineReader, SplitsLinesAndKeepsUnterminatedTail) {
    Pipe pipe;
    pipe.write("first\nsecond\r\n\nlast");
    pipe.close_write();

    FdLineReader reader(pipe.read_fd(), 20ms);
    const std::stop_token none;
    EXPECT_EQ(reader.next(none), "first");
    EXPECT_EQ(reader.next(none), "second\r");
    EXPECT_EQ(reader.next(none), "");
    EXPECT_EQ(reader.next(none), "last");
    EXPECT_EQ(reader.next(none), std::nullopt);
    EXPECT_EQ(reader.next(none), std::nullopt);
}

TEST(FdLineReader, ThrowsWhenStoppedWhileWaiting) {
    Pipe pipe;
    FdLineReader reader(pipe.read_fd(), 20ms);
    std::stop_source stop;

    std::jthread stopper([&stop] {
        std::this_thread::sleep_for(100ms);
        stop.request_stop();
    });

    const auto start = std::chrono::steady_clock::now();
    EXPECT_THROW((void) reader.next(stop.get_token()), OperationCancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST(MakeJob, AppliesDefaultsAndResolvesName) {
    JobDefaults d;
    d.output_dir = "/downloads";
    d.headers = {"X-Token: abc"};
    d.skip_if_exists = false;
    d.retry_budget = 7;
    d.allow_overwrite = true;

    const Job job = make_job("https://media.test/live/index.m3u8", "My: Show", "https://media.test/", d);
    EXPECT_EQ(job.output_path, std::filesystem::path("/downloads") / "My_ Show.mp4");
    EXPECT_EQ(job.referer, "https://media.test/");
    EXPECT_EQ(job.headers, d.headers);
    EXPECT_FALSE(job.skip_if_exists);
    EXPECT_EQ(job.retry_budget, 7u);
    EXPECT_TRUE(job.allow_overwrite);
}

TEST(MakeJob, EmptyNameGetsTimestamp) {
    const Job job = make_job("https://media.test/clip.webm", "", "", JobDefaults{});
    EXPECT_THAT(job.output_path.filename().string(),
                ::testing::MatchesRegex("[0-9]{4}-[0-9]{2}-[0-9]{2}_[0-9]{2}-[0-9]{2}-[0-9]{2}[.][0-9]{3}[.]webm"));
}
