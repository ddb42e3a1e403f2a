//
// Created by Giuseppe Francione on 03/03/26.
//

#ifndef TRAWL_JOB_HPP
#define TRAWL_JOB_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace trawl {

/**
 * @brief One unit of work: fetch a remote resource to a resolved local path.
 *
 * Jobs are plain values. They are created by a producer, copied into the
 * scheduler's queue and consumed exactly once by a worker.
 */
struct Job {
    std::string url;                      ///< Remote source locator
    std::string referer;                  ///< Referer header, empty for none
    std::vector<std::string> headers;     ///< Extra "Name: value" request headers
    std::filesystem::path output_path;    ///< Final path, extension already normalized
    bool skip_if_exists = true;           ///< Skip when the output index knows the logical name
    unsigned retry_budget = 3;            ///< Retries after the first attempt
    bool allow_overwrite = false;         ///< Replace an existing file at output_path

    /// Output file name without extension, as matched against the OutputIndex.
    [[nodiscard]] std::string logical_name() const {
        return output_path.stem().string();
    }
};

/**
 * @brief Final disposition of a job.
 */
enum class OutcomeKind {
    Completed,
    Skipped,
    Failed,
    Cancelled, ///< The run was stopped before the job finished
    Fatal      ///< The job hit a condition that aborts the whole run
};

[[nodiscard]] constexpr std::string_view to_string(const OutcomeKind kind) noexcept {
    switch (kind) {
        case OutcomeKind::Completed: return "completed";
        case OutcomeKind::Skipped:   return "skipped";
        case OutcomeKind::Failed:    return "failed";
        case OutcomeKind::Cancelled: return "cancelled";
        case OutcomeKind::Fatal:     return "fatal";
    }
    return "unknown";
}

/**
 * @brief Result of executing one job, reported as data to the scheduler.
 */
struct JobOutcome {
    Job job;
    OutcomeKind kind = OutcomeKind::Failed;
    unsigned attempts = 0;                 ///< Network attempts made (0 for skipped jobs)
    std::uintmax_t bytes = 0;              ///< Size of the final file for completed jobs
    std::string reason;                    ///< Failure, skip or cancellation reason
    std::chrono::milliseconds duration{0};
};

} // namespace trawl

#endif // TRAWL_JOB_HPP
