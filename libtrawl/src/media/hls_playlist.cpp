//
// Created by Giuseppe Francione on 08/03/26.
//

#include "../../include/hls_playlist.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <charconv>
#include <memory>
#include <new>

namespace trawl {

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* u) const noexcept { curl_url_cleanup(u); }
};

struct CurlStrDeleter {
    void operator()(char* s) const noexcept { curl_free(s); }
};

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

// value of KEY=value or KEY="value" in an attribute list
std::string attribute(std::string_view attrs, std::string_view key) {
    std::size_t pos = 0;
    while (pos < attrs.size()) {
        const auto eq = attrs.find('=', pos);
        if (eq == std::string_view::npos) break;
        const auto name = trim(attrs.substr(pos, eq - pos));
        std::size_t value_begin = eq + 1;
        std::size_t value_end;
        std::string_view value;
        if (value_begin < attrs.size() && attrs[value_begin] == '"') {
            const auto close = attrs.find('"', value_begin + 1);
            value_end = close == std::string_view::npos ? attrs.size() : close;
            value = attrs.substr(value_begin + 1, value_end - value_begin - 1);
            value_end = attrs.find(',', value_end);
        } else {
            value_end = attrs.find(',', value_begin);
            value = trim(attrs.substr(value_begin, value_end == std::string_view::npos
                                                        ? std::string_view::npos
                                                        : value_end - value_begin));
        }
        if (name == key) return std::string(value);
        if (value_end == std::string_view::npos) break;
        pos = value_end + 1;
    }
    return {};
}

} // namespace

const HlsVariant& HlsPlaylist::best_variant() const {
    return *std::ranges::max_element(variants, {}, &HlsVariant::bandwidth);
}

std::string resolve_url(const std::string& base, const std::string& reference) {
    std::unique_ptr<CURLU, CurlUrlDeleter> url(curl_url());
    if (!url) throw std::bad_alloc();

    if (curl_url_set(url.get(), CURLUPART_URL, base.c_str(), 0) != CURLUE_OK ||
        curl_url_set(url.get(), CURLUPART_URL, reference.c_str(), 0) != CURLUE_OK) {
        throw TransferError(ErrorClass::Permanent, "Malformed playlist URI: " + reference);
    }

    char* raw = nullptr;
    if (curl_url_get(url.get(), CURLUPART_URL, &raw, 0) != CURLUE_OK || !raw) {
        throw TransferError(ErrorClass::Permanent, "Malformed playlist URI: " + reference);
    }
    const std::unique_ptr<char, CurlStrDeleter> holder(raw);
    return std::string(raw);
}

HlsPlaylist parse_hls_playlist(const std::string_view text, const std::string& base_url) {
    HlsPlaylist playlist;
    std::size_t pos = 0;
    bool first_line = true;
    bool pending_variant = false;
    std::uint64_t pending_bandwidth = 0;

    while (pos <= text.size()) {
        const auto eol = text.find('\n', pos);
        auto line = trim(text.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos));
        pos = eol == std::string_view::npos ? text.size() + 1 : eol + 1;

        if (first_line) {
            if (line.starts_with("\xEF\xBB\xBF")) line.remove_prefix(3);
            if (line != "#EXTM3U") {
                throw TransferError(ErrorClass::Permanent, "Not an HLS playlist");
            }
            first_line = false;
            continue;
        }
        if (line.empty()) continue;

        if (line.starts_with("#EXT-X-STREAM-INF:")) {
            const auto attrs = line.substr(18);
            const auto bw = attribute(attrs, "BANDWIDTH");
            pending_bandwidth = 0;
            std::from_chars(bw.data(), bw.data() + bw.size(), pending_bandwidth);
            pending_variant = true;
        } else if (line.starts_with("#EXT-X-KEY:")) {
            const auto method = attribute(line.substr(11), "METHOD");
            if (!method.empty() && method != "NONE") {
                playlist.encrypted = true;
                playlist.key_method = method;
            }
        } else if (line.starts_with("#EXT-X-MAP:")) {
            const auto uri = attribute(line.substr(11), "URI");
            if (!uri.empty()) playlist.init_segment = resolve_url(base_url, uri);
        } else if (line.front() == '#') {
            // EXTINF, EXT-X-TARGETDURATION, EXT-X-ENDLIST and unknown tags carry nothing we use
            continue;
        } else if (pending_variant) {
            playlist.variants.push_back({resolve_url(base_url, std::string(line)), pending_bandwidth});
            pending_variant = false;
        } else {
            playlist.segments.push_back(resolve_url(base_url, std::string(line)));
        }
    }

    playlist.is_master = !playlist.variants.empty();
    if (playlist.is_master) {
        playlist.segments.clear();
    } else if (playlist.segments.empty()) {
        throw TransferError(ErrorClass::Permanent, "HLS playlist lists no segments");
    }

    Logger::log(LogLevel::Debug,
                playlist.is_master
                    ? "Master playlist with " + std::to_string(playlist.variants.size()) + " variants"
                    : "Media playlist with " + std::to_string(playlist.segments.size()) + " segments",
                "HlsPlaylist");
    return playlist;
}

} // namespace trawl
