//
// Created by the packrat authors on 18/10/26.
//

/**
 * @file zip_codec.hpp
 * @brief ZIP implementation of the codec interfaces, backed by libarchive.
 */

#ifndef PACKRAT_ZIP_CODEC_HPP
#define PACKRAT_ZIP_CODEC_HPP

#include "archive_codec.hpp"
#include "file_utils.hpp"
#include "options.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <istream>
#include <memory>
#include <ostream>
#include <vector>

namespace packrat {

struct ArchiveReadDeleter {
    void operator()(archive* a) const noexcept;
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const noexcept;
};

struct ArchiveEntryDeleter {
    void operator()(archive_entry* e) const noexcept;
};

/**
 * @brief Writes a ZIP archive to a std::ostream or an open C file.
 *
 * @details The output does not need to be seekable: sizes and CRCs are
 * emitted in data descriptors after each entry. An archive is only
 * complete after close(); destroying an unclosed writer marks the
 * libarchive handle as failed, so no central directory is written.
 */
class ZipEntryWriter final : public IEntryWriter {
public:
    ZipEntryWriter(std::ostream& out, Compression compression);

    /// Takes ownership of @p file; close() flushes and closes it.
    ZipEntryWriter(FilePtr file, Compression compression);

    ~ZipEntryWriter() override;

    ZipEntryWriter(const ZipEntryWriter&) = delete;
    ZipEntryWriter& operator=(const ZipEntryWriter&) = delete;

    void open_entry(const ArchiveEntry& entry) override;
    void write(std::span<const char> bytes) override;
    void close_entry() override;
    void close() override;

private:
    void set_format(Compression compression);
    static la_ssize_t write_callback(archive* a, void* client_data, const void* buffer, size_t length);

    std::ostream* out_ = nullptr;
    FilePtr file_;
    // declared after file_: the handle is released before the file closes
    std::unique_ptr<archive, ArchiveWriteDeleter> archive_;
    std::unique_ptr<archive_entry, ArchiveEntryDeleter> entry_;
    bool closed_ = false;
};

/**
 * @brief Reads a ZIP archive from a std::istream.
 */
class ZipEntryReader final : public IEntryReader {
public:
    enum class Mode {
        /// Forward-only walk over local headers; works on any stream.
        Streaming,
        /// Reads the central directory; needs a seekable stream, gives
        /// reliable sizes for every entry.
        RandomAccess
    };

    /**
     * @param in Source stream, read from its current position.
     * @param mode See Mode.
     * @param block_size Size of the chunks handed to libarchive.
     */
    ZipEntryReader(std::istream& in, Mode mode, std::size_t block_size);

    std::optional<ArchiveEntry> next_entry() override;
    std::size_t read(std::span<char> buffer) override;
    void close_entry() override;
    void close() override;

private:
    static la_ssize_t read_callback(archive* a, void* client_data, const void** buffer);
    static la_int64_t seek_callback(archive* a, void* client_data, la_int64_t offset, int whence);

    std::istream& in_;
    std::vector<char> block_;
    std::unique_ptr<archive, ArchiveReadDeleter> archive_;
    bool entry_open_ = false;
};

} // namespace packrat

#endif // PACKRAT_ZIP_CODEC_HPP
