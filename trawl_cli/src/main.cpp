//
// Created by Giuseppe Francione on 18/03/26.
//

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stop_token>
#include <thread>
#include <unistd.h>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libtrawl/include/cadence_guard.hpp"
#include "../../libtrawl/include/event_bus.hpp"
#include "../../libtrawl/include/events.hpp"
#include "../../libtrawl/include/http_client.hpp"
#include "../../libtrawl/include/job_executor.hpp"
#include "../../libtrawl/include/logger.hpp"
#include "../../libtrawl/include/manifest_producer.hpp"
#include "../../libtrawl/include/output_index.hpp"
#include "../../libtrawl/include/rate_governor.hpp"
#include "../../libtrawl/include/remuxer.hpp"
#include "../../libtrawl/include/run_config.hpp"
#include "../../libtrawl/include/scheduler.hpp"
#include "../../libtrawl/include/sleep_utils.hpp"

using namespace trawl;
namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};

// handle ctrl+c or termination signals; the stop itself is requested by the watcher thread
void signal_handler(const int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        interrupted.store(true);
    }
}

static void install_log_sinks(const Settings& settings, const bool use_colors) {
    Logger::clear_sinks();

    if (!settings.log_file.empty()) {
        auto file_sink = std::make_unique<FileLogSink>(settings.log_file, true);
        if (!file_sink->is_open()) {
            std::cerr << RED << "Can't open log file: " << settings.log_file.string() << RESET << std::endl;
        } else {
            Logger::add_sink(std::move(file_sink));
        }
    }

    auto console_sink = std::make_unique<ConsoleLogSink>();
    console_sink->log_level = settings.quiet ? LogLevel::Error
                                             : Logger::parse_level(settings.log_level).value_or(LogLevel::Warning);
    console_sink->use_colors = use_colors;
    Logger::add_sink(std::move(console_sink));
}

int main(int argc, char* argv[]) {

    CLI::App app{"trawl: polite concurrent media downloader."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    const bool use_colors = !settings.no_color && isatty(fileno(stderr)) != 0;
    install_log_sinks(settings, use_colors);
    const RunConfig& cfg = settings.config;

    std::error_code ec;
    fs::create_directories(cfg.output_dir, ec);
    if (ec) {
        Logger::log(LogLevel::Error, "Can't create output directory " + cfg.output_dir.string() + ": " + ec.message(), "main");
        return 1;
    }

    OutputIndex index;
    if (cfg.skip_existing) {
        try {
            index = OutputIndex::build(cfg.output_dir);
        } catch (const fs::filesystem_error& e) {
            Logger::log(LogLevel::Error, std::string("Can't index output directory: ") + e.what(), "main");
            return 1;
        }
    }

    // manifest source, opened before any thread starts
    std::ifstream manifest_file;
    if (!settings.single_item() && settings.jobs != "-") {
        manifest_file.open(settings.jobs);
        if (!manifest_file) {
            Logger::log(LogLevel::Error, "Can't open manifest " + settings.jobs, "main");
            return 1;
        }
    }

    std::stop_source stop;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::jthread signal_watcher([&stop](const std::stop_token& st) {
        while (!st.stop_requested()) {
            if (interrupted.load()) {
                std::cerr << CYAN
                          << "\n[INTERRUPT] Stop detected. Waiting for downloads to unwind..."
                          << RESET << std::endl;
                stop.request_stop();
                return;
            }
            interruptible_sleep(std::chrono::milliseconds(100), st);
        }
    });

    RateGovernor governor(cfg.rate_limit, cfg.burst_window);
    CadenceGuard cadence(cfg.cadence_threshold, cfg.cadence_pause);
    CurlHttpClient http;
    AvRemuxer remuxer;
    EventBus bus;

    if (!governor.unbounded()) {
        Logger::log(LogLevel::Info, "Rate limit: " + format_bytes(governor.rate()) + "/s", "main");
    }

    // subscribe to events: print each final disposition
    const auto print = [&](const char* color, const std::string& label, const std::string& text) {
        if (settings.quiet) return;
        std::cerr << (use_colors ? color : "") << "[" << label << "] " << text
                  << (use_colors ? RESET : "") << std::endl;
    };

    bus.subscribe<JobStartEvent>([&](const JobStartEvent& e) {
        Logger::log(LogLevel::Debug, "Start " + e.output_path.filename().string() + " <- " + e.url, "main");
    });
    bus.subscribe<JobRetryEvent>([&](const JobRetryEvent& e) {
        print(YELLOW, "RETRY", e.output_path.filename().string() + " attempt " + std::to_string(e.attempt) +
                                  " failed (" + e.reason + "), next in " + std::to_string(e.delay.count()) + " ms");
    });
    bus.subscribe<JobCompleteEvent>([&](const JobCompleteEvent& e) {
        print(GREEN, "DONE", e.output_path.filename().string() + " (" + format_bytes(e.bytes) + ", " +
                                 std::to_string(e.attempts) + " attempt" + (e.attempts > 1 ? "s" : "") + ")");
    });
    bus.subscribe<JobSkippedEvent>([&](const JobSkippedEvent& e) {
        print(GRAY, "SKIP", e.output_path.filename().string() + " (" + e.reason + ")");
    });
    bus.subscribe<JobFailedEvent>([&](const JobFailedEvent& e) {
        print(RED, e.fatal ? "FATAL" : "FAIL", e.output_path.filename().string() + " " + e.error_message);
    });
    bus.subscribe<JobCancelledEvent>([&](const JobCancelledEvent& e) {
        Logger::log(LogLevel::Debug, "Cancelled " + e.output_path.filename().string(), "main");
    });

    JobExecutor executor(index, governor, cadence, http, remuxer, bus, cfg.executor_options());
    Scheduler scheduler(executor, bus, cfg.concurrency, cfg.queue_capacity);

    JobDefaults defaults;
    defaults.output_dir = cfg.output_dir;
    defaults.headers = settings.headers;
    defaults.skip_if_exists = cfg.skip_existing;
    defaults.retry_budget = cfg.retry_budget;
    defaults.allow_overwrite = cfg.allow_overwrite;

    const auto start_total = std::chrono::steady_clock::now();

    std::jthread producer;
    if (settings.single_item()) {
        scheduler.submit(make_job(settings.url, settings.name, settings.referer, defaults), stop.get_token());
        scheduler.close();
    } else {
        producer = std::jthread([&, token = stop.get_token()] {
            if (settings.jobs == "-") {
                // stdin may stay open and idle, read it so an interrupt still ends the producer
                FdLineReader reader(STDIN_FILENO);
                produce_jobs(reader, defaults, scheduler, token);
            } else {
                produce_jobs(manifest_file, defaults, scheduler, token);
            }
        });
    }

    const RunResult result = scheduler.run(stop.get_token());

    if (producer.joinable()) {
        producer.join();
    }
    signal_watcher.request_stop();

    const double total_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_total).count();

    if (!settings.quiet) {
        print_console_report(result, cfg.concurrency, total_seconds, use_colors && isatty(fileno(stdout)) != 0);
    }

    // export CSV if requested
    if (!settings.report_path.empty()) {
        export_csv_report(result, settings.report_path, total_seconds);
    }

    if (result.cancelled || interrupted.load()) {
        return 130; // standard exit code for SIGINT
    }
    if (result.fatal_error || result.failed > 0) {
        return 1;
    }
    return 0;
}
