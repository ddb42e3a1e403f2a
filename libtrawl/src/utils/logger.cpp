//
// Created by Giuseppe Francione on 02/03/26.
//

#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace trawl {

std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
std::mutex Logger::mtx_;

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    std::lock_guard lock(mtx_);
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    std::lock_guard lock(mtx_);
    for (const auto& sink : sinks_) {
        if (sink) {
            sink->log(level, msg, tag);
        }
    }
}

std::optional<LogLevel> Logger::parse_level(const std::string_view level) {
    std::string upper(level);
    std::ranges::transform(upper, upper.begin(), [](const unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO") return LogLevel::Info;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warning;
    if (upper == "ERROR") return LogLevel::Error;
    return std::nullopt;
}

std::string Logger::format_line(const LogLevel level,
                                const std::string_view msg,
                                const std::string_view tag) {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif

    std::ostringstream out;
    out << std::put_time(&local, "%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << ms.count()
        << ' ' << level_to_string(level);
    if (!tag.empty()) out << " [" << tag << "]";
    out << ' ' << msg;
    return out.str();
}

} // namespace trawl
