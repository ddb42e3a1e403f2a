//
// Created by Giuseppe Francione on 13/03/26.
//

#ifndef TRAWL_OUTPUT_PATH_HPP
#define TRAWL_OUTPUT_PATH_HPP

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

namespace trawl {

    /**
     * @brief Makes a user supplied name safe to use as a single file name.
     *
     * Path separators, control characters and characters reserved on
     * common filesystems are replaced by '_', surrounding whitespace and
     * dots are trimmed. An empty result becomes "untitled".
     */
    std::string sanitize_file_name(std::string_view name);

    /**
     * @brief Final output path of a job named @p name fetched from @p url.
     *
     * Segmented sources (.m3u8, .ts) and URLs without a known media
     * extension map to ".mp4"; ".mkv" and ".webm" are kept. A media
     * extension already present at the end of @p name is replaced.
     */
    std::filesystem::path resolve_output_path(const std::filesystem::path &dir,
                                              std::string_view name,
                                              std::string_view url);

    /**
     * @brief Default job name built from a point in time: "YYYY-MM-DD_HH-MM-SS.mmm" (local time).
     */
    std::string timestamp_name(std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

} // namespace trawl

#endif // TRAWL_OUTPUT_PATH_HPP
