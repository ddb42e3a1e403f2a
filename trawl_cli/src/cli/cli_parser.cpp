//
// Created by Giuseppe Francione on 16/03/26.
//

#include "cli_parser.hpp"
#include "../../../libtrawl/include/logger.hpp"
#include <CLI/CLI.hpp>
#include <map>
#include <stdexcept>

namespace {
// helper for validating rate limit strings
struct RateLimitValidator : CLI::Validator {
    RateLimitValidator() {
        name_ = "RATE";
        func_ = [](const std::string& str) {
            try {
                (void) trawl::parse_rate_limit(str);
            } catch (const std::invalid_argument& e) {
                return std::string(e.what()) + ". Use e.g. 0, unbounded, 500K, 2M/s.";
            }
            return std::string(); // ok
        };
    }
};

struct LogLevelValidator : CLI::Validator {
    LogLevelValidator() {
        name_ = "LEVEL";
        func_ = [](const std::string& str) {
            if (!trawl::Logger::parse_level(str).has_value()) {
                return "Invalid log level: '" + str + "'. Must be one of: DEBUG, INFO, WARNING, ERROR.";
            }
            return std::string();
        };
    }
};
} // namespace

void setup_cli_parser(CLI::App& app, Settings& settings) {
    auto& cfg = settings.config;

    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "1.0");

    // --- Sources ---
    auto* url_opt = app.add_option("-u,--url", settings.url,
                                   "Download a single URL.");

    app.add_option("-n,--name", settings.name,
                   "Output name for --url (default: current timestamp).")
                   ->needs(url_opt);

    app.add_option("--referer", settings.referer,
                   "Referer header for --url.")
                   ->needs(url_opt);

    app.add_option("-H,--header", settings.headers,
                   "Extra request header 'Name: value'. (Can be used multiple times).")
                   ->check([](const std::string& str) {
                       if (str.find(':') == std::string::npos) return "Header '" + str + "' must be 'Name: value'.";
                       return std::string();
                   });

    auto* jobs_opt = app.add_option("-j,--jobs", settings.jobs,
                                    "Job manifest with one 'URL<TAB>NAME[<TAB>REFERER]' per line ('-' for stdin).")
                                    ->check([](const std::string& str) {
                                        if (str == "-") return std::string();
                                        if (!std::filesystem::is_regular_file(str)) return "Manifest '" + str + "' not found.";
                                        return std::string();
                                    });

    url_opt->excludes(jobs_opt);

    // --- Output ---
    app.add_option("-o,--output-dir", cfg.output_dir,
                   "Directory receiving the downloads (created if missing).")
                   ->default_val(".");

    app.add_flag("--no-skip-existing", settings.no_skip_existing,
                 "Don't skip jobs whose name is already in the output directory.\n"
                 "An existing file still fails the job unless --overwrite is given.");

    app.add_flag("--overwrite", cfg.allow_overwrite,
                 "Replace output files that already exist.");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last();

    // --- Scheduling ---
    app.add_option("-c,--concurrency", cfg.concurrency,
                   "Jobs downloaded in parallel.")
                   ->default_val(cfg.concurrency)
                   ->check(CLI::PositiveNumber);

    app.add_option("--queue-size", cfg.queue_capacity,
                   "Jobs buffered ahead of the workers.")
                   ->default_val(cfg.queue_capacity)
                   ->check(CLI::PositiveNumber);

    app.add_option("-r,--retries", cfg.retry_budget,
                   "Retries after a transient failure.")
                   ->default_val(cfg.retry_budget)
                   ->check(CLI::NonNegativeNumber);

    app.add_option("--backoff-base", settings.backoff_base_ms,
                   "Delay in ms before the first retry; doubles on every retry.")
                   ->default_val(settings.backoff_base_ms);

    app.add_option("--backoff-cap", settings.backoff_cap_ms,
                   "Maximum retry delay in ms.")
                   ->default_val(settings.backoff_cap_ms);

    app.add_option("--remux-retry", cfg.remux_policy,
                   "After a failed remux: 'remux-only' (default) retries the remux, 'refetch' downloads again.")
        ->default_val(trawl::RemuxRetryPolicy::RemuxOnly)
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, trawl::RemuxRetryPolicy>{
                {"remux-only", trawl::RemuxRetryPolicy::RemuxOnly},
                {"refetch", trawl::RemuxRetryPolicy::Refetch}
            }, CLI::ignore_case));

    // --- Politeness ---
    app.add_option("-l,--rate-limit", settings.rate_limit,
                   "Aggregate bandwidth cap in bytes/s, e.g. 500K or 2M (0 = unbounded).")
                   ->default_val("0")
                   ->check(RateLimitValidator());

    app.add_option("--cadence-threshold", cfg.cadence_threshold,
                   "Pause after this many requests (0 = never).")
                   ->default_val(cfg.cadence_threshold);

    app.add_option("--cadence-pause", settings.cadence_pause_seconds,
                   "Length of the cadence pause in seconds.")
                   ->default_val(settings.cadence_pause_seconds)
                   ->check(CLI::PositiveNumber);

    app.add_option("--user-agent", cfg.user_agent,
                   "User-Agent header sent with every request.")
                   ->default_val(cfg.user_agent);

    app.add_option("--connect-timeout", settings.connect_timeout_seconds,
                   "Connection timeout in seconds.")
                   ->default_val(settings.connect_timeout_seconds)
                   ->check(CLI::PositiveNumber);

    app.add_option("--stall-timeout", settings.stall_timeout_seconds,
                   "Abort a transfer after this many seconds without data.")
                   ->default_val(settings.stall_timeout_seconds)
                   ->check(CLI::PositiveNumber);

    // --- Logging ---
    app.add_option("--log-level", settings.log_level,
                   "Console log level: DEBUG, INFO, WARNING, ERROR.")
                   ->default_val("WARNING")
                   ->check(LogLevelValidator());

    app.add_flag("--debug", settings.debug,
                 "Shorthand for --log-level DEBUG.");

    app.add_option("--log-file", settings.log_file,
                   "Also append logs to a file (all levels).");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output.");

    app.add_flag("--no-color", settings.no_color,
                 "Disable colored console output.");

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (settings.url.empty() == settings.jobs.empty()) {
            throw CLI::ValidationError("Exactly one of --url or --jobs is required.");
        }

        auto& c = settings.config;
        c.rate_limit = trawl::parse_rate_limit(settings.rate_limit);
        c.cadence_pause = std::chrono::seconds(settings.cadence_pause_seconds);
        c.backoff_base = std::chrono::milliseconds(settings.backoff_base_ms);
        c.backoff_cap = std::chrono::milliseconds(settings.backoff_cap_ms);
        c.connect_timeout = std::chrono::seconds(settings.connect_timeout_seconds);
        c.stall_timeout = std::chrono::seconds(settings.stall_timeout_seconds);
        c.skip_existing = !settings.no_skip_existing;
        if (settings.debug) {
            settings.log_level = "DEBUG";
        }

        try {
            c.validate();
        } catch (const std::invalid_argument& e) {
            throw CLI::ValidationError(e.what());
        }
    });
}
