//
// Created by Giuseppe Francione on 03/03/26.
//

#ifndef TRAWL_FILE_UTILS_HPP
#define TRAWL_FILE_UTILS_HPP

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace trawl {

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed (errno is set).
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    struct FileCloser {
        void operator()(FILE *f) const noexcept {
            if (f) std::fclose(f);
        }
    };

    using FilePtr = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief Builds a hidden temporary path next to a final output path.
     *
     * The result lives in the same directory as @p final_path so the
     * eventual rename stays on one filesystem and is atomic. Pattern:
     * ".{filename}.{label}.{random}.part".
     */
    std::filesystem::path make_temp_path_for(const std::filesystem::path &final_path,
                                             std::string_view label);

    /**
     * @brief True if @p path looks like a temporary file made by make_temp_path_for.
     */
    bool is_temp_path(const std::filesystem::path &path);

    /**
     * @brief Removes a file if present, logging (not throwing) on failure.
     * @param path File to remove.
     * @param tag Logger tag of the caller.
     */
    void remove_quietly(const std::filesystem::path &path, std::string_view tag = "file_utils");

    /**
     * @brief Reads a whole file into a string. Throws TransferError on I/O failure.
     */
    std::string read_text_file(const std::filesystem::path &path);

    /**
     * @brief Owns a temporary path and deletes the file when going out of scope.
     *
     * Used by the job executor so that no exit path, including exceptions
     * and cancellation, leaves a partial file behind.
     */
    class ScopedTempFile {
    public:
        ScopedTempFile(const std::filesystem::path &final_path, std::string_view label)
            : path_(make_temp_path_for(final_path, label)) {}

        ~ScopedTempFile() { remove(); }

        ScopedTempFile(const ScopedTempFile &) = delete;
        ScopedTempFile &operator=(const ScopedTempFile &) = delete;

        [[nodiscard]] const std::filesystem::path &path() const noexcept { return path_; }

        void remove() const { remove_quietly(path_, "ScopedTempFile"); }

    private:
        std::filesystem::path path_;
    };

} // namespace trawl

#endif // TRAWL_FILE_UTILS_HPP
