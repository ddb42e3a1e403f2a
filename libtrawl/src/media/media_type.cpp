//
// Created by Giuseppe Francione on 07/03/26.
//

#include "../../include/media_type.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <unordered_map>

namespace trawl {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

const std::unordered_map<std::string, MediaFormat> mime_to_format = {
    {"video/mp4", MediaFormat::Mp4},
    {"audio/mp4", MediaFormat::Mp4},
    {"video/mp2t", MediaFormat::MpegTs},
    {"video/x-matroska", MediaFormat::Matroska},
    {"video/webm", MediaFormat::WebM},
    {"application/vnd.apple.mpegurl", MediaFormat::HlsPlaylist},
    {"application/x-mpegurl", MediaFormat::HlsPlaylist},
    {"audio/mpegurl", MediaFormat::HlsPlaylist},
    {"audio/x-mpegurl", MediaFormat::HlsPlaylist},
    {"text/html", MediaFormat::Html},
    {"application/xhtml+xml", MediaFormat::Html},
};

const std::unordered_map<std::string, MediaFormat> ext_to_format = {
    {".mp4", MediaFormat::Mp4},
    {".m4v", MediaFormat::Mp4},
    {".ts", MediaFormat::MpegTs},
    {".mkv", MediaFormat::Matroska},
    {".webm", MediaFormat::WebM},
    {".m3u8", MediaFormat::HlsPlaylist},
    {".html", MediaFormat::Html},
    {".htm", MediaFormat::Html},
};

bool starts_with_extm3u(const std::filesystem::path& path) {
    const FilePtr in(open_file(path, "rb"));
    if (!in) return false;
    std::array<char, 10> head{};
    const auto n = std::fread(head.data(), 1, head.size(), in.get());
    std::string_view view(head.data(), n);
    // tolerate a UTF-8 byte order mark
    if (view.starts_with("\xEF\xBB\xBF")) view.remove_prefix(3);
    return view.starts_with("#EXTM3U");
}

} // namespace

std::string_view to_string(const MediaFormat format) noexcept {
    switch (format) {
        case MediaFormat::Mp4:         return "mp4";
        case MediaFormat::MpegTs:      return "mpeg-ts";
        case MediaFormat::Matroska:    return "matroska";
        case MediaFormat::WebM:        return "webm";
        case MediaFormat::HlsPlaylist: return "hls";
        case MediaFormat::Html:        return "html";
        case MediaFormat::Unknown:     return "unknown";
    }
    return "unknown";
}

std::optional<MediaFormat> format_from_mime(const std::string_view mime) {
    auto key = to_lower(mime.substr(0, mime.find(';')));
    while (!key.empty() && std::isspace(static_cast<unsigned char>(key.back()))) key.pop_back();
    const auto it = mime_to_format.find(key);
    if (it == mime_to_format.end()) return std::nullopt;
    return it->second;
}

std::optional<MediaFormat> format_from_extension(const std::string_view ext) {
    const auto it = ext_to_format.find(to_lower(ext));
    if (it == ext_to_format.end()) return std::nullopt;
    return it->second;
}

std::string url_extension(const std::string_view url) {
    std::string_view path = url;
    if (const auto scheme = path.find("://"); scheme != std::string_view::npos) {
        path.remove_prefix(scheme + 3);
        const auto slash = path.find('/');
        path = slash == std::string_view::npos ? std::string_view{} : path.substr(slash);
    }
    path = path.substr(0, path.find_first_of("?#"));
    const auto last_slash = path.rfind('/');
    const auto name = last_slash == std::string_view::npos ? path : path.substr(last_slash + 1);
    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0) return {};
    return to_lower(name.substr(dot));
}

std::string_view output_extension(const MediaFormat format) noexcept {
    switch (format) {
        case MediaFormat::Matroska: return ".mkv";
        case MediaFormat::WebM:     return ".webm";
        default:                    return ".mp4";
    }
}

MediaFormat sniff_media_format(const std::filesystem::path& path,
                               const std::string_view content_type,
                               const std::string_view url) {
    if (starts_with_extm3u(path)) {
        return MediaFormat::HlsPlaylist;
    }

    const auto mime = MimeDetector::detect(path);
    if (auto fmt = format_from_mime(mime)) {
        Logger::log(LogLevel::Debug, "libmagic: " + mime + " for " + path.filename().string(), "MediaType");
        return *fmt;
    }
    if (auto fmt = format_from_mime(content_type)) {
        return *fmt;
    }
    if (auto fmt = format_from_extension(url_extension(url))) {
        return *fmt;
    }

    Logger::log(LogLevel::Debug,
                "Unrecognized content (magic: " + (mime.empty() ? std::string("n/a") : mime) +
                ", content-type: " + std::string(content_type) + ")",
                "MediaType");
    return MediaFormat::Unknown;
}

} // namespace trawl
