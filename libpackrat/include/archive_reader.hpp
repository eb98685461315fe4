//
// Created by the packrat authors on 18/10/26.
//

/**
 * @file archive_reader.hpp
 * @brief Extraction engine: recreates archive entries on disk.
 */

#ifndef PACKRAT_ARCHIVE_READER_HPP
#define PACKRAT_ARCHIVE_READER_HPP

#include "archive_codec.hpp"
#include "options.hpp"
#include "progress_tracker.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace packrat {

/**
 * @brief Drains an IEntryReader into a destination folder.
 *
 * @details Entries are processed in archive order. Missing parent
 * folders are created on demand, so archives without explicit
 * folder entries extract fine. Nothing is rolled back on failure.
 */
class ArchiveReader {
public:
    ArchiveReader(IEntryReader& codec, const Options& options, ProgressTracker& progress,
                  std::filesystem::path destination);

    /**
     * @brief Extracts every remaining entry.
     * @throws IOError on any filesystem or codec failure.
     */
    void extract_all();

    /**
     * @brief Destination path of entry @p name below @p destination.
     *
     * Backslashes are treated as separators and leading '/' are dropped.
     * A name such as "./" resolves to @p destination itself.
     * @throws IOError if the name is empty or points outside @p destination.
     */
    static std::filesystem::path resolve_destination(const std::filesystem::path& destination,
                                                     const std::string& name);

private:
    std::uintmax_t extract_file(const std::filesystem::path& out_path);

    IEntryReader& codec_;
    const Options& options_;
    ProgressTracker& progress_;
    std::filesystem::path destination_;
    std::vector<char> buffer_;
};

} // namespace packrat

#endif // PACKRAT_ARCHIVE_READER_HPP
