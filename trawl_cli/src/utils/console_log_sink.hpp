//
// Created by Giuseppe Francione on 15/03/26.
//

#ifndef TRAWL_CONSOLE_LOG_SINK_HPP
#define TRAWL_CONSOLE_LOG_SINK_HPP

#include "../../../libtrawl/include/log_sink.hpp"
#include "../../../libtrawl/include/logger.hpp"
#include "color.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Writes log lines at or above a threshold to stderr, colored by level.
 */
class ConsoleLogSink final : public trawl::ILogSink {
public:
    trawl::LogLevel log_level = trawl::LogLevel::Warning;
    bool use_colors = true;

    void log(const trawl::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;

        const char* color = "";
        switch (level) {
            case trawl::LogLevel::Debug:   color = GRAY; break;
            case trawl::LogLevel::Info:    color = BLUE; break;
            case trawl::LogLevel::Warning: color = YELLOW; break;
            case trawl::LogLevel::Error:   color = RED; break;
        }

        const std::string line = trawl::Logger::format_line(level, message, tag);
        std::lock_guard lock(mtx_);
        if (use_colors) {
            std::cerr << color << line << RESET << '\n';
        } else {
            std::cerr << line << '\n';
        }
    }

private:
    std::mutex mtx_;
};

#endif // TRAWL_CONSOLE_LOG_SINK_HPP
