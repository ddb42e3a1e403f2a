//
// Created by Giuseppe Francione on 02/03/26.
//

/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade.
 *
 * Every component of libtrawl logs through Logger::log with a tag naming
 * itself. The host process decides where messages end up by installing
 * one or more ILogSink implementations.
 */

#ifndef TRAWL_LOGGER_HPP
#define TRAWL_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trawl {

class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "trawl").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "trawl");

    /**
     * @brief Converts a LogLevel to its fixed-width label ("DEBUG", "INFO ", ...).
     */
    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO ";
            case LogLevel::Warning: return "WARN ";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Parses a level name, ignoring case.
     *
     * Accepts DEBUG, INFO, WARN, WARNING and ERROR.
     * @return The level, or std::nullopt for an unknown name (including "NONE").
     */
    static std::optional<LogLevel> parse_level(std::string_view level);

    /**
     * @brief Formats one log line as "HH:MM:SS.mmm LEVEL [tag] message".
     *
     * Shared by the console and file sinks so both agree on layout.
     */
    static std::string format_line(LogLevel level,
                                   std::string_view msg,
                                   std::string_view tag);

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
};

} // namespace trawl

#endif // TRAWL_LOGGER_HPP
