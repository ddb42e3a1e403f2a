//
// Created by Giuseppe Francione on 03/03/26.
//

#ifndef TRAWL_EVENTS_HPP
#define TRAWL_EVENTS_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace trawl {

/**
 * @brief Events published by the job executor and the scheduler.
 *
 * Plain data carriers for EventBus subscribers (CLI progress output,
 * report collection). Published from worker threads.
 */

/**
 * @brief Emitted when a job leaves the queue and its first attempt begins.
 */
struct JobStartEvent {
    std::string url;                    ///< Remote source
    std::filesystem::path output_path;  ///< Destination
};

/**
 * @brief Emitted when an attempt failed transiently and the job backs off.
 */
struct JobRetryEvent {
    std::filesystem::path output_path;
    unsigned attempt = 0;                 ///< Attempt that just failed (1-based)
    std::chrono::milliseconds delay{0};   ///< Backoff before the next attempt
    std::string reason;
};

/**
 * @brief Emitted when the output file has been committed.
 */
struct JobCompleteEvent {
    std::filesystem::path output_path;
    std::uintmax_t bytes = 0;
    unsigned attempts = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when a job is skipped because its output already exists.
 */
struct JobSkippedEvent {
    std::filesystem::path output_path;
    std::string reason;
};

/**
 * @brief Emitted when a job fails for good (retries exhausted, permanent or fatal error).
 */
struct JobFailedEvent {
    std::filesystem::path output_path;
    std::string error_message;
    unsigned attempts = 0;
    bool fatal = false;
};

/**
 * @brief Emitted when a job is abandoned because the run was stopped.
 */
struct JobCancelledEvent {
    std::filesystem::path output_path;
};

} // namespace trawl

#endif // TRAWL_EVENTS_HPP
