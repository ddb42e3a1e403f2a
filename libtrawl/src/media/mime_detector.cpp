//
// Created by Giuseppe Francione on 07/03/26.
//
#ifndef _WIN32
#include <magic.h>
#endif
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

std::string trawl::MimeDetector::detect(const std::filesystem::path& path)
{
#ifndef _WIN32
    const magic_t magic = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
    if (!magic) return {};
    if (magic_load(magic, nullptr) != 0)
    {
        Logger::log(LogLevel::Warning, std::string("magic_load failed: ") + magic_error(magic), "libmagic");
        magic_close(magic);
        return {};
    }
    const char* mime = magic_file(magic, path.string().c_str());
    std::string result = mime ? mime : "";
    magic_close(magic);
    return result;
#else
    static const std::unordered_map<std::string, std::string> ext_to_mime = {
        {".mp4", "video/mp4"}, {".ts", "video/MP2T"}, {".mkv", "video/x-matroska"},
        {".webm", "video/webm"}, {".m3u8", "application/vnd.apple.mpegurl"}, {".html", "text/html"}
    };
    auto ext = path.extension().string();
    std::ranges::transform(ext, ext.begin(), ::tolower);
    auto it = ext_to_mime.find(ext);
    return it != ext_to_mime.end() ? it->second : "application/octet-stream";
#endif
}
