//
// Created by Giuseppe Francione on 02/03/26.
//

#ifndef TRAWL_LOG_SINK_HPP
#define TRAWL_LOG_SINK_HPP

#include <string_view>

namespace trawl {

/**
 * @brief Severity levels for log messages.
 *
 * Levels are ordered: a sink configured for a level also receives
 * everything more severe than it.
 */
enum class LogLevel {
    Debug,   ///< Per-request and per-chunk diagnostics
    Info,    ///< Job lifecycle and run progress
    Warning, ///< Retries, skipped manifest lines, recoverable problems
    Error    ///< Failed jobs and fatal run conditions
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations define where log lines go (console, file). Logger
 * fans every message out to all installed sinks; sinks decide on their
 * own whether a level is wanted.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that emitted the message (e.g. "Scheduler").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace trawl

#endif // TRAWL_LOG_SINK_HPP
