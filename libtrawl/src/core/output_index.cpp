//
// Created by Giuseppe Francione on 04/03/26.
//

#include "../../include/output_index.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace trawl {

OutputIndex OutputIndex::build(const fs::path& directory) {
    std::error_code ec;
    if (!fs::exists(directory, ec)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            throw fs::filesystem_error("Failed to stat output directory", directory, ec);
        }
        Logger::log(LogLevel::Debug, "Output directory does not exist yet: " + directory.string(), "OutputIndex");
        return {};
    }

    std::unordered_set<std::string> names;
    for (const auto& entry : fs::directory_iterator(directory)) {
        if (!entry.is_regular_file() || is_temp_path(entry.path())) {
            continue;
        }
        names.insert(entry.path().filename().string());
    }

    Logger::log(LogLevel::Info,
                "Indexed " + std::to_string(names.size()) + " existing files in " + directory.string(),
                "OutputIndex");
    return OutputIndex(std::move(names));
}

bool OutputIndex::contains(const std::string_view logical_name) const {
    if (logical_name.empty()) {
        return false;
    }
    std::string candidate(logical_name);
    const auto base_len = candidate.size();
    for (const auto ext : kOutputExtensions) {
        candidate.resize(base_len);
        candidate += ext;
        if (names_.contains(candidate)) {
            return true;
        }
    }
    candidate.resize(base_len);
    return names_.contains(candidate);
}

} // namespace trawl
