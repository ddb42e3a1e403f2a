//
// Created by Giuseppe Francione on 02/03/26.
//

/**
 * @file errors.hpp
 * @brief Exception types and error classification used across libtrawl.
 *
 * Network and filesystem failures are raised as TransferError carrying an
 * ErrorClass. The job executor catches them and turns them into outcomes;
 * they never cross a worker thread boundary.
 */

#ifndef TRAWL_ERRORS_HPP
#define TRAWL_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace trawl {

/**
 * @brief How a failed attempt should be treated by the retry machine.
 */
enum class ErrorClass {
    Transient, ///< Worth retrying: timeouts, resets, 5xx, rate limiting, partial streams
    Permanent, ///< Retrying cannot help: 4xx, unsupported content, existing output
    Fatal      ///< The whole run must stop: disk full, unwritable output directory
};

[[nodiscard]] std::string_view to_string(ErrorClass cls) noexcept;

/**
 * @brief A failed fetch, write or commit step of a job.
 */
class TransferError : public std::runtime_error {
public:
    TransferError(ErrorClass cls, const std::string& what, long http_status = 0);

    [[nodiscard]] ErrorClass error_class() const noexcept { return cls_; }

    /// HTTP status that caused the error, 0 when not HTTP related.
    [[nodiscard]] long http_status() const noexcept { return http_status_; }

private:
    ErrorClass cls_;
    long http_status_;
};

/**
 * @brief The remux step failed after a successful download.
 */
class RemuxError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Raised by every suspension point when the run's stop token fires.
 *
 * Not an error outcome: the executor maps it to a cancelled job.
 */
class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled() : std::runtime_error("operation cancelled") {}
};

/**
 * @brief Raised by Scheduler::submit once the scheduler no longer accepts jobs.
 */
class SchedulerClosed : public std::logic_error {
public:
    SchedulerClosed() : std::logic_error("submit on closed scheduler") {}
};

/**
 * @brief Maps an HTTP status to an error class.
 *
 * 408, 425, 429 and 5xx are transient; other 4xx are permanent.
 */
[[nodiscard]] ErrorClass classify_http_status(long status) noexcept;

/**
 * @brief Maps a filesystem error to an error class.
 *
 * Out of space, quota, permission and read-only conditions are fatal,
 * since every following job would hit them too. Everything else is transient.
 */
[[nodiscard]] ErrorClass classify_filesystem_error(const std::error_code& ec) noexcept;

/**
 * @brief Throws a TransferError for an I/O failure on a local path.
 * @param ec The error reported by the OS.
 * @param what Short description of the failed operation.
 */
[[noreturn]] void throw_io_error(const std::error_code& ec, const std::string& what);

} // namespace trawl

#endif // TRAWL_ERRORS_HPP
