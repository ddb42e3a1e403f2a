//
// Created by Giuseppe Francione on 04/03/26.
//

/**
 * @file output_index.hpp
 * @brief Snapshot of the files already present in the output directory.
 */

#ifndef TRAWL_OUTPUT_INDEX_HPP
#define TRAWL_OUTPUT_INDEX_HPP

#include <array>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_set>

namespace trawl {

/**
 * @brief Immutable set of file names found in a directory at startup.
 *
 * @details Built once before the run and only read afterwards, so any
 * number of workers may query it without synchronization. Lookups are by
 * logical name: the job's output name without extension, since the final
 * container can differ from what the source served.
 */
class OutputIndex {
public:
    /// Extensions tried, in order, before the bare logical name.
    static constexpr std::array<std::string_view, 4> kOutputExtensions = {
        ".mp4", ".ts", ".mkv", ".webm"
    };

    OutputIndex() = default;

    /**
     * @brief Scans @p directory (non-recursively) for regular files.
     *
     * A missing directory yields an empty index, since a first run has no
     * prior output. Hidden temporary files left by an interrupted process
     * are not indexed.
     *
     * @throws std::filesystem::filesystem_error on any other I/O error.
     */
    static OutputIndex build(const std::filesystem::path& directory);

    /**
     * @brief True if any produced variant of @p logical_name is indexed.
     *
     * Tries every entry of kOutputExtensions, then the bare name.
     */
    [[nodiscard]] bool contains(std::string_view logical_name) const;

    [[nodiscard]] std::size_t size() const noexcept { return names_.size(); }
    [[nodiscard]] bool empty() const noexcept { return names_.empty(); }

private:
    explicit OutputIndex(std::unordered_set<std::string> names) : names_(std::move(names)) {}

    std::unordered_set<std::string> names_;
};

} // namespace trawl

#endif // TRAWL_OUTPUT_INDEX_HPP
