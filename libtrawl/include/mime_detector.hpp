//
// Created by Giuseppe Francione on 07/03/26.
//

#ifndef TRAWL_MIME_DETECTOR_HPP
#define TRAWL_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>

namespace trawl {

    /**
     * @brief Content-based file type detection.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file from its content.
         *
         * @param path The filesystem path to the file.
         * @return The MIME type (e.g., "video/mp4"), or an empty string if
         * detection is unavailable or failed.
         *
         * @note On Linux/macOS, this uses libmagic.
         * @note On Windows, this falls back to a map of file extensions,
         * which is useless for temporary files; callers then rely on the
         * response headers.
         */
        static std::string detect(const std::filesystem::path& path);
    };

} // namespace trawl

#endif // TRAWL_MIME_DETECTOR_HPP
