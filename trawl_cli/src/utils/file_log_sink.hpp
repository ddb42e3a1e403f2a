//
// Created by Giuseppe Francione on 15/03/26.
//

#ifndef TRAWL_FILE_LOG_SINK_HPP
#define TRAWL_FILE_LOG_SINK_HPP

#include "../../../libtrawl/include/log_sink.hpp"
#include "../../../libtrawl/include/logger.hpp"
#include <filesystem>
#include <fstream>
#include <mutex>

class FileLogSink final : public trawl::ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const trawl::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!out_.is_open()) return;

        std::lock_guard lock(mtx_);
        out_ << trawl::Logger::format_line(level, message, tag) << '\n';
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // TRAWL_FILE_LOG_SINK_HPP
