//
// Created by the packrat authors on 18/10/26.
//

/**
 * @file archive_writer.hpp
 * @brief Packaging engine: turns input paths into archive entries.
 */

#ifndef PACKRAT_ARCHIVE_WRITER_HPP
#define PACKRAT_ARCHIVE_WRITER_HPP

#include "archive_codec.hpp"
#include "options.hpp"
#include "progress_tracker.hpp"
#include <filesystem>
#include <functional>
#include <memory>
#include <vector>

namespace packrat {

/**
 * @brief Walks input paths and streams them into an IEntryWriter.
 *
 * @details Each input is visited depth-first, parents before children,
 * in the order the filesystem lists siblings. Folders become empty
 * "name/" entries, files are copied through a single buffer of
 * Options::buffer_size() bytes. Progress advances after every entry.
 */
class ArchiveWriter {
public:
    using EntryWriterFactory = std::function<std::unique_ptr<IEntryWriter>()>;

    ArchiveWriter(IEntryWriter& codec, const Options& options, ProgressTracker& progress);

    /**
     * @brief Adds @p input and everything below it, named relative to @p root.
     * @throws IOError on any filesystem or codec failure.
     */
    void add(const std::filesystem::path& input, const std::filesystem::path& root);

    /**
     * @brief Rejects an empty input list and inputs resolving to the same path.
     * @throws ValidationError naming the offending path.
     */
    static void validate_inputs(const std::vector<std::filesystem::path>& paths);

    /**
     * @brief Runs a whole packaging request.
     *
     * Validates, estimates the total size, then asks @p open_codec for the
     * codec writer, so nothing is created when validation or estimation
     * fails. The codec is closed on success and destroyed on every path.
     */
    static void run(const Options& options,
                    const std::vector<std::filesystem::path>& paths,
                    const EntryWriterFactory& open_codec);

private:
    void visit(const std::filesystem::path& node, const std::filesystem::path& root, bool is_directory);
    void add_directory(const std::filesystem::path& node, const std::string& name);
    std::uintmax_t add_file(const std::filesystem::path& node, const std::string& name);

    IEntryWriter& codec_;
    ProgressTracker& progress_;
    std::vector<char> buffer_;
};

} // namespace packrat

#endif // PACKRAT_ARCHIVE_WRITER_HPP
