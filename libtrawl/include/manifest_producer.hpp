//
// Created by Giuseppe Francione on 17/03/26.
//

#ifndef TRAWL_MANIFEST_PRODUCER_HPP
#define TRAWL_MANIFEST_PRODUCER_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>
#include "job.hpp"
#include "scheduler.hpp"

namespace trawl {

/**
 * @brief Job template applied to every manifest line.
 */
struct JobDefaults {
    std::filesystem::path output_dir;
    std::vector<std::string> headers;
    bool skip_if_exists = true;
    unsigned retry_budget = 3;
    bool allow_overwrite = false;
};

struct ProducerStats {
    std::size_t submitted = 0;
    std::size_t malformed = 0;
};

/**
 * @brief Line reader over a file descriptor that gives up when a stop is requested.
 *
 * Meant for pipes and terminals, where a blocking read could outlive the run.
 * The descriptor is polled with a short timeout and the stop token checked
 * in between. The descriptor is not owned.
 */
class FdLineReader {
public:
    explicit FdLineReader(int fd, std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));

    /**
     * @brief Next line without its terminator, nullopt at end of input.
     * @throws OperationCancelled when @p st is stopped while waiting.
     * @throws std::system_error on a read error.
     */
    std::optional<std::string> next(const std::stop_token& st);

private:
    int fd_;
    std::chrono::milliseconds poll_interval_;
    std::string buffer_;
    bool eof_ = false;
};

/**
 * @brief Reads manifest lines from @p in and submits one job per entry.
 *
 * Blocks while the scheduler queue is full. Malformed lines are logged and
 * skipped. Stops early when @p st is stopped or the scheduler stops
 * accepting jobs, and always closes the scheduler before returning.
 */
ProducerStats produce_jobs(std::istream& in,
                           const JobDefaults& defaults,
                           Scheduler& scheduler,
                           const std::stop_token& st);

/// Same as above, reading through @p reader so a stop interrupts an idle input.
ProducerStats produce_jobs(FdLineReader& reader,
                           const JobDefaults& defaults,
                           Scheduler& scheduler,
                           const std::stop_token& st);

/**
 * @brief Builds the job of a single --url invocation or manifest entry.
 *
 * An empty @p name is replaced by a timestamp.
 */
Job make_job(const std::string& url,
             const std::string& name,
             const std::string& referer,
             const JobDefaults& defaults);

} // namespace trawl

#endif // TRAWL_MANIFEST_PRODUCER_HPP
