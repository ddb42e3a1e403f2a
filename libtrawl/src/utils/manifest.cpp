//
// Created by Giuseppe Francione on 14/03/26.
//

#include "../../include/manifest.hpp"
#include <stdexcept>
#include <vector>

namespace trawl {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\r')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

} // namespace

std::optional<ManifestEntry> parse_manifest_line(const std::string_view line) {
    const auto content = trim(line);
    if (content.find_first_not_of('\t') == std::string_view::npos || content.front() == '#') {
        return std::nullopt;
    }

    std::vector<std::string_view> fields;
    std::size_t pos = 0;
    while (true) {
        const auto tab = content.find('\t', pos);
        fields.push_back(trim(content.substr(pos, tab == std::string_view::npos ? std::string_view::npos : tab - pos)));
        if (tab == std::string_view::npos) break;
        pos = tab + 1;
    }

    if (fields.size() < 2 || fields.size() > 3) {
        throw std::invalid_argument("expected URL<TAB>NAME[<TAB>REFERER], got " + std::to_string(fields.size()) + " field(s)");
    }
    if (fields[0].empty()) {
        throw std::invalid_argument("missing URL");
    }
    if (fields[1].empty()) {
        throw std::invalid_argument("missing name");
    }

    ManifestEntry entry;
    entry.url = std::string(fields[0]);
    entry.name = std::string(fields[1]);
    if (fields.size() == 3) {
        entry.referer = std::string(fields[2]);
    }
    return entry;
}

} // namespace trawl
