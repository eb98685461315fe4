//
// Created by the packrat authors on 18/10/26.
//

/**
 * @file file_utils.hpp
 * @brief Small filesystem helpers shared by the pack and unpack engines.
 */

#ifndef PACKRAT_FILE_UTILS_HPP
#define PACKRAT_FILE_UTILS_HPP

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string_view>

namespace packrat {

    struct FileCloser {
        void operator()(FILE* f) const noexcept { if (f) std::fclose(f); }
    };

    ///< Owning C file handle, closed on scope exit.
    using FilePtr = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb", "wbx").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE* open_file(const std::filesystem::path& path, const char* mode);

    /**
     * @brief Creates a new file for binary writing.
     *
     * Without @p overwrite the file must not exist yet (exclusive create).
     *
     * @throws IOError if the file exists (and @p overwrite is false) or can't be opened.
     */
    FilePtr create_output_file(const std::filesystem::path& path, bool overwrite, std::string_view tag);

    /**
     * @brief Creates @p dir and all missing ancestors.
     * @throws IOError if creation fails or @p dir exists as a non-directory.
     */
    void ensure_directories(const std::filesystem::path& dir, std::string_view tag);

    /**
     * @brief Lexically normalized absolute form of @p path, resolving the
     * existing prefix through symlinks. Used to compare input paths.
     * @throws IOError if the path can't be resolved.
     */
    std::filesystem::path canonical_key(const std::filesystem::path& path);

} // namespace packrat

#endif // PACKRAT_FILE_UTILS_HPP
