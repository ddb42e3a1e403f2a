//
// Created by Giuseppe Francione on 16/03/26.
//

#ifndef TRAWL_CLI_PARSER_HPP
#define TRAWL_CLI_PARSER_HPP

#include <filesystem>
#include <string>
#include <vector>
#include "../../../libtrawl/include/run_config.hpp"

// forward declaration
namespace CLI { class App; }

struct Settings {
    trawl::RunConfig config;

    // single item mode
    std::string url;
    std::string name;
    std::string referer;
    std::vector<std::string> headers;

    // manifest mode, "-" for stdin
    std::string jobs;

    std::string rate_limit = "0";
    unsigned cadence_pause_seconds = 30;
    unsigned backoff_base_ms = 1000;
    unsigned backoff_cap_ms = 30000;
    unsigned connect_timeout_seconds = 30;
    unsigned stall_timeout_seconds = 60;
    bool no_skip_existing = false;

    std::string log_level = "WARNING";
    std::filesystem::path log_file;
    std::filesystem::path report_path;
    bool quiet = false;
    bool debug = false;
    bool no_color = false;

    [[nodiscard]] bool single_item() const { return !url.empty(); }
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 *
 * After a successful parse, settings.config is filled in and validated.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // TRAWL_CLI_PARSER_HPP
