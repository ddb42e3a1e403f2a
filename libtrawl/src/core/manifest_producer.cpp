//
// Created by Giuseppe Francione on 17/03/26.
//

#include "../../include/manifest_producer.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/manifest.hpp"
#include "../../include/output_path.hpp"
#include <cerrno>
#include <poll.h>
#include <stdexcept>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace trawl {

namespace {

constexpr const char* kTag = "manifest";

// next_line(st) yields the next raw line, nullopt at end of input
template <typename NextLine>
ProducerStats produce(NextLine&& next_line,
                      const JobDefaults& defaults,
                      Scheduler& scheduler,
                      const std::stop_token& st) {
    ProducerStats stats;
    std::size_t line_no = 0;

    try {
        while (!st.stop_requested()) {
            const std::optional<std::string> line = next_line(st);
            if (!line) break;
            ++line_no;

            std::optional<ManifestEntry> entry;
            try {
                entry = parse_manifest_line(*line);
            } catch (const std::invalid_argument& e) {
                ++stats.malformed;
                Logger::log(LogLevel::Warning,
                            "Manifest line " + std::to_string(line_no) + " skipped: " + e.what(),
                            kTag);
                continue;
            }
            if (!entry) continue;

            scheduler.submit(make_job(entry->url, entry->name, entry->referer, defaults), st);
            ++stats.submitted;
        }
    } catch (const OperationCancelled&) {
        Logger::log(LogLevel::Debug, "Producer cancelled after " + std::to_string(stats.submitted) + " jobs", kTag);
    } catch (const SchedulerClosed&) {
        Logger::log(LogLevel::Debug, "Scheduler closed, producer stopping", kTag);
    } catch (const std::system_error& e) {
        Logger::log(LogLevel::Error,
                    "Read error in manifest after line " + std::to_string(line_no) + ": " + e.what(),
                    kTag);
    }

    scheduler.close();
    Logger::log(LogLevel::Info,
                "Queued " + std::to_string(stats.submitted) + " jobs (" + std::to_string(stats.malformed) +
                    " malformed lines)",
                kTag);
    return stats;
}

} // namespace

FdLineReader::FdLineReader(const int fd, const std::chrono::milliseconds poll_interval)
    : fd_(fd), poll_interval_(poll_interval) {}

std::optional<std::string> FdLineReader::next(const std::stop_token& st) {
    for (;;) {
        if (const auto nl = buffer_.find('\n'); nl != std::string::npos) {
            std::string line = buffer_.substr(0, nl);
            buffer_.erase(0, nl + 1);
            return line;
        }
        if (eof_) {
            if (buffer_.empty()) return std::nullopt;
            return std::exchange(buffer_, {});
        }
        if (st.stop_requested()) throw OperationCancelled();

        pollfd pfd{fd_, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, static_cast<int>(poll_interval_.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "poll");
        }
        if (ready == 0) continue;

        char chunk[4096];
        const ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw std::system_error(errno, std::generic_category(), "read");
        }
        if (n == 0) {
            eof_ = true;
        } else {
            buffer_.append(chunk, static_cast<std::size_t>(n));
        }
    }
}

Job make_job(const std::string& url,
             const std::string& name,
             const std::string& referer,
             const JobDefaults& defaults) {
    Job job;
    job.url = url;
    job.referer = referer;
    job.headers = defaults.headers;
    job.output_path = resolve_output_path(defaults.output_dir, name.empty() ? timestamp_name() : name, url);
    job.skip_if_exists = defaults.skip_if_exists;
    job.retry_budget = defaults.retry_budget;
    job.allow_overwrite = defaults.allow_overwrite;
    return job;
}

ProducerStats produce_jobs(std::istream& in,
                           const JobDefaults& defaults,
                           Scheduler& scheduler,
                           const std::stop_token& st) {
    const ProducerStats stats = produce(
        [&in](const std::stop_token&) -> std::optional<std::string> {
            std::string line;
            if (!std::getline(in, line)) return std::nullopt;
            return line;
        },
        defaults, scheduler, st);
    if (in.bad()) {
        Logger::log(LogLevel::Error, "Manifest stream went bad before end of input", kTag);
    }
    return stats;
}

ProducerStats produce_jobs(FdLineReader& reader,
                           const JobDefaults& defaults,
                           Scheduler& scheduler,
                           const std::stop_token& st) {
    return produce([&reader](const std::stop_token& token) { return reader.next(token); },
                   defaults, scheduler, st);
}

} // namespace trawl
