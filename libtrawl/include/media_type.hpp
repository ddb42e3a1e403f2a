//
// Created by Giuseppe Francione on 07/03/26.
//

/**
 * @file media_type.hpp
 * @brief Media formats trawl recognizes and how each one is stored.
 *
 * Maps between MediaFormat, MIME types and extensions, and decides which
 * formats must be remuxed before they are committed.
 */

#ifndef TRAWL_MEDIA_TYPE_HPP
#define TRAWL_MEDIA_TYPE_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace trawl {

enum class MediaFormat {
    Mp4,
    MpegTs,
    Matroska,
    WebM,
    HlsPlaylist,
    Html,
    Unknown
};

[[nodiscard]] std::string_view to_string(MediaFormat format) noexcept;

/**
 * @brief Looks up a MIME type (parameters such as "; charset=" are ignored).
 */
[[nodiscard]] std::optional<MediaFormat> format_from_mime(std::string_view mime);

/**
 * @brief Looks up a file extension (with leading dot, any case).
 */
[[nodiscard]] std::optional<MediaFormat> format_from_extension(std::string_view ext);

/**
 * @brief Extension of the URL's path component (query and fragment stripped), lowercase.
 */
[[nodiscard]] std::string url_extension(std::string_view url);

/**
 * @brief True for segmented or streaming formats that must be remuxed into MP4.
 */
[[nodiscard]] constexpr bool needs_remux(const MediaFormat format) noexcept {
    return format == MediaFormat::MpegTs || format == MediaFormat::HlsPlaylist;
}

/**
 * @brief True for formats that can be committed (possibly after remuxing).
 */
[[nodiscard]] constexpr bool is_storable(const MediaFormat format) noexcept {
    return format != MediaFormat::Html && format != MediaFormat::Unknown;
}

/**
 * @brief Extension of the file trawl writes for @p format.
 *
 * Remuxed formats end up as ".mp4".
 */
[[nodiscard]] std::string_view output_extension(MediaFormat format) noexcept;

/**
 * @brief Identifies downloaded content.
 *
 * Order of evidence: an "#EXTM3U" header, the libmagic MIME type of the
 * file, the response Content-Type, then the URL extension.
 *
 * @param path Downloaded file.
 * @param content_type Content-Type header of the response, may be empty.
 * @param url URL the content came from.
 */
[[nodiscard]] MediaFormat sniff_media_format(const std::filesystem::path& path,
                                             std::string_view content_type,
                                             std::string_view url);

} // namespace trawl

#endif // TRAWL_MEDIA_TYPE_HPP
