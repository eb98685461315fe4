//
// Created by the packrat authors on 18/10/26.
//

/**
 * @file archive_codec.hpp
 * @brief Stream-oriented interfaces to the archive codec.
 *
 * The pack/unpack engines only ever see archives through these two
 * interfaces: entries are opened, fed or drained, and closed one at a
 * time, in order. The byte layout and compression live behind them.
 */

#ifndef PACKRAT_ARCHIVE_CODEC_HPP
#define PACKRAT_ARCHIVE_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <optional>
#include <span>
#include <string>

namespace packrat {

/**
 * @brief One logical archive entry.
 *
 * Names use '/' as separator; directory names end with '/'.
 */
struct ArchiveEntry {
    std::string name;
    bool is_directory = false;
    bool is_symlink = false;            ///< Never written by packrat; skipped on extraction
    std::optional<std::uintmax_t> size; ///< Uncompressed size; unset when the codec doesn't know it
    std::time_t mtime = 0;              ///< Modification time (seconds since epoch), 0 if unknown
};

/**
 * @brief Write side of the codec.
 */
class IEntryWriter {
public:
    virtual ~IEntryWriter() = default;

    /**
     * @brief Starts a new entry. Directory entries carry no data and are
     * closed right away by the caller.
     */
    virtual void open_entry(const ArchiveEntry& entry) = 0;

    /**
     * @brief Appends bytes to the entry opened last.
     */
    virtual void write(std::span<const char> bytes) = 0;

    virtual void close_entry() = 0;

    /**
     * @brief Writes the archive trailer. No entry may be opened afterwards.
     */
    virtual void close() = 0;
};

/**
 * @brief Read side of the codec.
 */
class IEntryReader {
public:
    virtual ~IEntryReader() = default;

    /**
     * @brief Advances to the next entry in archive order.
     * Any unread data of the current entry is skipped.
     * @return The entry, or std::nullopt at the end of the archive.
     */
    virtual std::optional<ArchiveEntry> next_entry() = 0;

    /**
     * @brief Reads decoded bytes of the current entry.
     * @return Number of bytes stored in @p buffer, 0 at the end of the entry.
     */
    virtual std::size_t read(std::span<char> buffer) = 0;

    virtual void close_entry() = 0;

    virtual void close() = 0;
};

} // namespace packrat

#endif // PACKRAT_ARCHIVE_CODEC_HPP
