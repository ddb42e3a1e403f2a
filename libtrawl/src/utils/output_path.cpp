//
// Created by Giuseppe Francione on 13/03/26.
//

#include "../../include/output_path.hpp"
#include "../../include/media_type.hpp"
#include <cstdio>
#include <ctime>

namespace trawl {

    std::string sanitize_file_name(const std::string_view name) {
        std::string out;
        out.reserve(name.size());
        for (const char c : name) {
            const auto uc = static_cast<unsigned char>(c);
            switch (c) {
                case '/': case '\\': case ':': case '*': case '?':
                case '"': case '<': case '>': case '|':
                    out += '_';
                    break;
                default:
                    out += uc < 0x20 || uc == 0x7f ? '_' : c;
            }
        }

        const auto first = out.find_first_not_of(" .\t");
        if (first == std::string::npos) {
            return "untitled";
        }
        const auto last = out.find_last_not_of(" .\t");
        return out.substr(first, last - first + 1);
    }

    std::filesystem::path resolve_output_path(const std::filesystem::path &dir,
                                              const std::string_view name,
                                              const std::string_view url) {
        std::string base = sanitize_file_name(name);

        // "clip.mp4" and "clip" name the same output
        if (const auto dot = base.rfind('.'); dot != std::string::npos && dot > 0) {
            if (format_from_extension(base.substr(dot)).has_value()) {
                base.resize(dot);
            }
        }

        std::string_view ext = ".mp4";
        if (const auto source = format_from_extension(url_extension(url))) {
            if (*source == MediaFormat::Matroska || *source == MediaFormat::WebM) {
                ext = output_extension(*source);
            }
        }
        return dir / (base + std::string(ext));
    }

    std::string timestamp_name(const std::chrono::system_clock::time_point when) {
        const auto t = std::chrono::system_clock::to_time_t(when);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() % 1000;
        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &t);
#else
        localtime_r(&t, &tm);
#endif
        char buf[40];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d_%02d-%02d-%02d.%03d",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
        return buf;
    }

} // namespace trawl
