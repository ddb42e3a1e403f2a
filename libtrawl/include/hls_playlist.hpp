//
// Created by Giuseppe Francione on 08/03/26.
//

/**
 * @file hls_playlist.hpp
 * @brief Minimal HLS (m3u8) playlist reader.
 */

#ifndef TRAWL_HLS_PLAYLIST_HPP
#define TRAWL_HLS_PLAYLIST_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace trawl {

struct HlsVariant {
    std::string uri;             ///< Absolute URI of the variant playlist
    std::uint64_t bandwidth = 0; ///< BANDWIDTH attribute, 0 if absent
};

/**
 * @brief Parsed playlist. Either a master playlist (variants) or a media
 * playlist (segments), never both.
 */
struct HlsPlaylist {
    bool is_master = false;
    std::vector<HlsVariant> variants;
    std::vector<std::string> segments; ///< Absolute segment URIs in play order
    std::string init_segment;          ///< EXT-X-MAP URI, empty if none
    bool encrypted = false;            ///< An EXT-X-KEY with a method other than NONE was seen
    std::string key_method;

    /// Variant with the highest bandwidth. Requires a non-empty variant list.
    [[nodiscard]] const HlsVariant& best_variant() const;
};

/**
 * @brief Parses playlist text. Relative URIs are resolved against @p base_url.
 *
 * @throws TransferError (permanent) if the text is not an HLS playlist or
 * lists neither variants nor segments.
 */
[[nodiscard]] HlsPlaylist parse_hls_playlist(std::string_view text, const std::string& base_url);

/**
 * @brief Resolves a possibly relative reference against an absolute base URL.
 *
 * @throws TransferError (permanent) if the result is not a valid URL.
 */
[[nodiscard]] std::string resolve_url(const std::string& base, const std::string& reference);

} // namespace trawl

#endif // TRAWL_HLS_PLAYLIST_HPP
