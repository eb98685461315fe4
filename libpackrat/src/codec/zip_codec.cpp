//
// Created by the packrat authors on 18/10/26.
//

#include "../../include/zip_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <cerrno>
#include <cstdio>
#include <string>
#include <utility>

namespace packrat {

static const char* codec_tag() {
    return "ZipCodec";
}

static std::string error_text(archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? std::string(msg) : std::string("unknown libarchive error");
}

// ARCHIVE_WARN is logged and tolerated, anything below it aborts
static void check(archive* a, const int r, const std::string& what) {
    if (r == ARCHIVE_OK) return;
    if (r == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + what + ": " + error_text(a), codec_tag());
        return;
    }
    Logger::log(LogLevel::Error, what + ": " + error_text(a), codec_tag());
    throw IOError(what + ": " + error_text(a));
}

void ArchiveReadDeleter::operator()(archive* a) const noexcept {
    if (a) archive_read_free(a);
}

void ArchiveWriteDeleter::operator()(archive* a) const noexcept {
    if (a) archive_write_free(a);
}

void ArchiveEntryDeleter::operator()(archive_entry* e) const noexcept {
    if (e) archive_entry_free(e);
}

// --- ZipEntryWriter ---

ZipEntryWriter::ZipEntryWriter(std::ostream& out, const Compression compression)
    : out_(&out),
      archive_(archive_write_new()) {
    set_format(compression);
    check(archive_.get(), archive_write_open(archive_.get(), this, nullptr, &ZipEntryWriter::write_callback, nullptr),
          "archive_write_open");
}

ZipEntryWriter::ZipEntryWriter(FilePtr file, const Compression compression)
    : file_(std::move(file)),
      archive_(archive_write_new()) {
    if (!file_) {
        throw IOError("ZipEntryWriter: no output file");
    }
    set_format(compression);
    check(archive_.get(), archive_write_open_FILE(archive_.get(), file_.get()), "archive_write_open_FILE");
}

ZipEntryWriter::~ZipEntryWriter() {
    // keeps archive_write_free from finishing a half-written archive
    if (archive_ && !closed_) {
        archive_write_fail(archive_.get());
    }
}

void ZipEntryWriter::set_format(const Compression compression) {
    archive* a = archive_.get();
    if (!a) {
        throw IOError("archive_write_new failed");
    }

    check(a, archive_write_set_format_zip(a), "Setting format failed");
    const char* method = compression == Compression::Store ? "store" : "deflate";
    check(a, archive_write_set_format_option(a, "zip", "compression", method), "Setting compression failed");

    // no zero padding after the central directory
    check(a, archive_write_set_bytes_in_last_block(a, 1), "Setting block size failed");
}

la_ssize_t ZipEntryWriter::write_callback(archive* a, void* client_data, const void* buffer, const size_t length) {
    auto* self = static_cast<ZipEntryWriter*>(client_data);
    self->out_->write(static_cast<const char*>(buffer), static_cast<std::streamsize>(length));
    if (!*self->out_) {
        archive_set_error(a, EIO, "Output stream write failed");
        return -1;
    }
    return static_cast<la_ssize_t>(length);
}

void ZipEntryWriter::open_entry(const ArchiveEntry& entry) {
    archive* a = archive_.get();

    entry_.reset(archive_entry_new());
    if (!entry_) {
        Logger::log(LogLevel::Error, "archive_entry_new failed", codec_tag());
        throw IOError("archive_entry_new failed");
    }

    archive_entry* e = entry_.get();
    archive_entry_set_pathname(e, entry.name.c_str());
    if (entry.is_directory) {
        archive_entry_set_filetype(e, AE_IFDIR);
        archive_entry_set_perm(e, 0755);
        archive_entry_set_size(e, 0);
    } else {
        archive_entry_set_filetype(e, AE_IFREG);
        archive_entry_set_perm(e, 0644);
        if (entry.size) {
            archive_entry_set_size(e, static_cast<la_int64_t>(*entry.size));
        }
    }
    archive_entry_set_mtime(e, entry.mtime, 0);

    check(a, archive_write_header(a, e), "archive_write_header for " + entry.name);
}

void ZipEntryWriter::write(std::span<const char> bytes) {
    archive* a = archive_.get();
    while (!bytes.empty()) {
        const la_ssize_t wrote = archive_write_data(a, bytes.data(), bytes.size());
        if (wrote < 0) {
            Logger::log(LogLevel::Error, "archive_write_data: " + error_text(a), codec_tag());
            throw IOError("archive_write_data: " + error_text(a));
        }
        if (wrote == 0) {
            // libarchive stops accepting data past the size declared in the header
            Logger::log(LogLevel::Error, "Entry data exceeds its declared size", codec_tag());
            throw IOError("Entry data exceeds its declared size (file changed while packing?)");
        }
        bytes = bytes.subspan(static_cast<std::size_t>(wrote));
    }
}

void ZipEntryWriter::close_entry() {
    archive* a = archive_.get();
    check(a, archive_write_finish_entry(a), "archive_write_finish_entry");
    entry_.reset();
}

void ZipEntryWriter::close() {
    archive* a = archive_.get();
    check(a, archive_write_close(a), "archive_write_close");
    closed_ = true;

    if (file_) {
        if (std::fclose(file_.release()) != 0) {
            Logger::log(LogLevel::Error, "Error closing archive file", codec_tag());
            throw IOError("Error closing archive file");
        }
        return;
    }
    out_->flush();
    if (!*out_) {
        Logger::log(LogLevel::Error, "Output stream flush failed", codec_tag());
        throw IOError("Output stream flush failed");
    }
}

// --- ZipEntryReader ---

ZipEntryReader::ZipEntryReader(std::istream& in, const Mode mode, const std::size_t block_size)
    : in_(in),
      block_(block_size == 0 ? Options::kDefaultBufferSize : block_size),
      archive_(archive_read_new()) {
    archive* a = archive_.get();
    if (!a) {
        throw IOError("archive_read_new failed");
    }

    if (mode == Mode::RandomAccess) {
        check(a, archive_read_support_format_zip_seekable(a), "Enabling zip reader failed");
    } else {
        check(a, archive_read_support_format_zip_streamable(a), "Enabling zip reader failed");
    }
    archive_read_set_options(a, "hdrcharset=UTF-8");

    check(a, archive_read_set_callback_data(a, this), "archive_read_set_callback_data");
    check(a, archive_read_set_read_callback(a, &ZipEntryReader::read_callback), "archive_read_set_read_callback");
    if (mode == Mode::RandomAccess) {
        check(a, archive_read_set_seek_callback(a, &ZipEntryReader::seek_callback), "archive_read_set_seek_callback");
    }
    check(a, archive_read_open1(a), "archive_read_open");
}

la_ssize_t ZipEntryReader::read_callback(archive* a, void* client_data, const void** buffer) {
    auto* self = static_cast<ZipEntryReader*>(client_data);
    self->in_.read(self->block_.data(), static_cast<std::streamsize>(self->block_.size()));
    if (self->in_.bad()) {
        archive_set_error(a, EIO, "Input stream read failed");
        return -1;
    }
    *buffer = self->block_.data();
    return static_cast<la_ssize_t>(self->in_.gcount());
}

la_int64_t ZipEntryReader::seek_callback(archive* a, void* client_data, const la_int64_t offset, const int whence) {
    auto* self = static_cast<ZipEntryReader*>(client_data);
    std::ios_base::seekdir dir = std::ios_base::beg;
    if (whence == SEEK_CUR) dir = std::ios_base::cur;
    else if (whence == SEEK_END) dir = std::ios_base::end;

    // a previous read may have hit EOF
    self->in_.clear();
    self->in_.seekg(static_cast<std::streamoff>(offset), dir);
    const auto pos = self->in_.tellg();
    if (!self->in_ || pos == std::istream::pos_type(-1)) {
        archive_set_error(a, EIO, "Input stream seek failed");
        return ARCHIVE_FATAL;
    }
    return static_cast<la_int64_t>(pos);
}

std::optional<ArchiveEntry> ZipEntryReader::next_entry() {
    archive* a = archive_.get();
    entry_open_ = false;

    archive_entry* e = nullptr;
    const int r = archive_read_next_header(a, &e);
    if (r == ARCHIVE_EOF) {
        return std::nullopt;
    }
    check(a, r, "archive_read_next_header");

    const char* pathname = archive_entry_pathname(e);
    if (!pathname || !pathname[0]) {
        Logger::log(LogLevel::Error, "Archive entry without a name", codec_tag());
        throw IOError("Archive entry without a name");
    }

    ArchiveEntry entry;
    entry.name = pathname;
    entry.is_directory = archive_entry_filetype(e) == AE_IFDIR || entry.name.back() == '/';
    entry.is_symlink = archive_entry_filetype(e) == AE_IFLNK;
    if (!entry.is_directory && archive_entry_size_is_set(e)) {
        const la_int64_t size = archive_entry_size(e);
        entry.size = size > 0 ? static_cast<std::uintmax_t>(size) : 0;
    } else if (entry.is_directory) {
        entry.size = 0;
    }
    entry.mtime = archive_entry_mtime(e);

    entry_open_ = true;
    return entry;
}

std::size_t ZipEntryReader::read(std::span<char> buffer) {
    archive* a = archive_.get();
    const la_ssize_t got = archive_read_data(a, buffer.data(), buffer.size());
    if (got < 0) {
        Logger::log(LogLevel::Error, "Error reading data: " + error_text(a), codec_tag());
        throw IOError("Error reading data: " + error_text(a));
    }
    return static_cast<std::size_t>(got);
}

void ZipEntryReader::close_entry() {
    if (!entry_open_) return;
    archive* a = archive_.get();
    check(a, archive_read_data_skip(a), "archive_read_data_skip");
    entry_open_ = false;
}

void ZipEntryReader::close() {
    archive* a = archive_.get();
    check(a, archive_read_close(a), "archive_read_close");
}

} // namespace packrat
