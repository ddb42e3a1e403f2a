//
// Created by Giuseppe Francione on 17/03/26.
//

#ifndef TRAWL_REPORT_GENERATOR_HPP
#define TRAWL_REPORT_GENERATOR_HPP

#include <filesystem>
#include "../../../libtrawl/include/scheduler.hpp"

/**
 * @brief Prints the per-job table (everything but completed jobs) and the run totals.
 */
void print_console_report(const trawl::RunResult& result,
                          unsigned concurrency,
                          double total_seconds,
                          bool use_colors);

/**
 * @brief Writes one CSV row per job outcome plus a totals section.
 * @return false if the file couldn't be written.
 */
bool export_csv_report(const trawl::RunResult& result,
                       const std::filesystem::path& output_path,
                       double total_seconds);

unsigned get_terminal_width();

#endif // TRAWL_REPORT_GENERATOR_HPP
