//
// Created by Giuseppe Francione on 17/03/26.
//

#include "report_generator.hpp"
#include "../utils/color.hpp"
#include "../../../libtrawl/include/logger.hpp"
#include "../../../libtrawl/include/run_config.hpp"
#include <algorithm>
#include <format>
#include <fstream>
#include <iostream>
#include <string>

#ifdef _WIN32

#include <windows.h>

#else

#include <sys/ioctl.h>
#include <unistd.h>

#endif

unsigned get_terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
#endif
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (const char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static const char* outcome_color(const trawl::OutcomeKind kind) {
    switch (kind) {
        case trawl::OutcomeKind::Completed: return GREEN;
        case trawl::OutcomeKind::Skipped:   return YELLOW;
        case trawl::OutcomeKind::Cancelled: return CYAN;
        default:                            return RED;
    }
}

void print_console_report(const trawl::RunResult& result,
                          const unsigned concurrency,
                          const double total_seconds,
                          const bool use_colors) {
    std::vector<const trawl::JobOutcome*> rows;
    for (const auto& o : result.outcomes) {
        if (o.kind != trawl::OutcomeKind::Completed) rows.push_back(&o);
    }
    std::ranges::sort(rows, [](const auto* a, const auto* b) {
        return a->job.output_path < b->job.output_path;
    });

    if (!rows.empty()) {
        const unsigned term_width = get_terminal_width();
        constexpr size_t result_width = 11;
        constexpr size_t attempts_width = 10;
        const size_t name_width = std::clamp<size_t>(term_width / 3, 16, 48);

        auto truncate = [](const std::string& s, const size_t max_len) {
            return s.size() <= max_len ? s : s.substr(0, max_len - 3) + "...";
        };

        const auto fmt_str = std::string("{:<") + std::to_string(name_width) + "}"
                           + "{:<" + std::to_string(result_width) + "}"
                           + "{:<" + std::to_string(attempts_width) + "}"
                           + "{}\n";

        std::cout << "\n" << std::vformat(fmt_str, std::make_format_args("File", "Result", "Attempts", "Reason"));

        for (const auto* o : rows) {
            const std::string name = truncate(o->job.output_path.filename().string(), name_width - 1);
            const std::string kind(trawl::to_string(o->kind));
            const std::string cell = std::format("{:<{}}", kind, result_width);
            std::cout << std::format("{:<{}}", name, name_width)
                      << (use_colors ? outcome_color(o->kind) : "") << cell << (use_colors ? RESET : "")
                      << std::format("{:<{}}", o->attempts, attempts_width)
                      << o->reason << "\n";
        }
    }

    std::uintmax_t total_bytes = 0;
    for (const auto& o : result.outcomes) {
        if (o.kind == trawl::OutcomeKind::Completed) total_bytes += o.bytes;
    }

    std::cout << "\nCompleted: " << result.completed
              << "  Skipped: " << result.skipped
              << "  Failed: " << result.failed
              << "  Cancelled: " << result.cancelled_jobs << "\n";
    std::cout << "Downloaded: " << trawl::format_bytes(total_bytes) << "\n";
    std::cout << "Total time: " << std::format("{:.2f}", total_seconds)
              << " s (" << concurrency << " worker" << (concurrency > 1U ? "s" : "") << ")\n";
    if (result.fatal_error) {
        std::cout << (use_colors ? RED : "") << "Run aborted: " << *result.fatal_error
                  << (use_colors ? RESET : "") << "\n";
    } else if (result.cancelled) {
        std::cout << "Run interrupted.\n";
    }
}

bool export_csv_report(const trawl::RunResult& result,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) {
        trawl::Logger::log(trawl::LogLevel::Error, "Can't write report: " + output_path.string(), "report");
        return false;
    }

    out << "File,URL,Result,Attempts,Size(KB),Time(s),Reason\n";

    for (const auto& o : result.outcomes) {
        out << csv_escape(o.job.output_path.filename().string()) << ","
            << csv_escape(o.job.url) << ","
            << trawl::to_string(o.kind) << ","
            << o.attempts << ","
            << (o.bytes / 1024) << ","
            << std::format("{:.2f}", static_cast<double>(o.duration.count()) / 1000.0) << ","
            << csv_escape(o.reason) << "\n";
    }

    out << "\n\nCompleted,Skipped,Failed,Cancelled,Total time(s)\n";
    out << result.completed << ","
        << result.skipped << ","
        << result.failed << ","
        << result.cancelled_jobs << ","
        << std::format("{:.2f}", total_seconds) << "\n";

    out.flush();
    if (!out) {
        trawl::Logger::log(trawl::LogLevel::Error, "Failed writing report: " + output_path.string(), "report");
        return false;
    }
    return true;
}
