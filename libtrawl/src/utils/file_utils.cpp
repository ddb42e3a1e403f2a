//
// Created by Giuseppe Francione on 03/03/26.
//

#include "../../include/file_utils.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <cerrno>
#include <system_error>

namespace trawl {

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        // get absolute path, required for the long path prefix
        std::error_code ec;
        auto abs_path = std::filesystem::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }

        // prepend the magic prefix to bypass MAX_PATH
        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    std::filesystem::path make_temp_path_for(const std::filesystem::path& final_path,
                                             const std::string_view label) {
        std::string name = "." + final_path.filename().string();
        name += ".";
        name += label;
        name += "." + RandomUtils::random_suffix() + ".part";
        return final_path.parent_path() / name;
    }

    bool is_temp_path(const std::filesystem::path& path) {
        const auto name = path.filename().string();
        return name.starts_with(".") && path.extension() == ".part";
    }

    void remove_quietly(const std::filesystem::path& path, const std::string_view tag) {
        std::error_code ec;
        if (std::filesystem::remove(path, ec)) {
            Logger::log(LogLevel::Debug, "Removed temp file: " + path.string(), tag);
        } else if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove temp file: " + path.string() + " (" + ec.message() + ")", tag);
        }
    }

    std::string read_text_file(const std::filesystem::path& path) {
        const FilePtr in(open_file(path, "rb"));
        if (!in) {
            throw_io_error(std::error_code(errno, std::generic_category()), "Failed to open " + path.string());
        }
        std::string text;
        char buf[8192];
        std::size_t n;
        while ((n = std::fread(buf, 1, sizeof(buf), in.get())) > 0) {
            text.append(buf, n);
        }
        if (std::ferror(in.get())) {
            throw_io_error(std::error_code(EIO, std::generic_category()), "Failed to read " + path.string());
        }
        return text;
    }

} // namespace trawl
