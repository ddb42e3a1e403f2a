//
// Created by Giuseppe Francione on 14/03/26.
//

#ifndef TRAWL_MANIFEST_HPP
#define TRAWL_MANIFEST_HPP

#include <optional>
#include <string>
#include <string_view>

namespace trawl {

/**
 * @brief One line of a job manifest: "URL<TAB>NAME[<TAB>REFERER]".
 */
struct ManifestEntry {
    std::string url;
    std::string name;
    std::string referer;
};

/**
 * @brief Parses one manifest line.
 *
 * @return std::nullopt for blank lines and '#' comments.
 * @throws std::invalid_argument if the line lacks a URL or a name, or has
 * too many fields.
 */
[[nodiscard]] std::optional<ManifestEntry> parse_manifest_line(std::string_view line);

} // namespace trawl

#endif // TRAWL_MANIFEST_HPP
