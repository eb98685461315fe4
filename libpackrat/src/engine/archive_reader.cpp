//
// Created by the packrat authors on 18/10/26.
//

#include "../../include/archive_reader.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <utility>

namespace packrat {

namespace fs = std::filesystem;

static const char* reader_tag() {
    return "ArchiveReader";
}

ArchiveReader::ArchiveReader(IEntryReader& codec, const Options& options, ProgressTracker& progress,
                             fs::path destination)
    : codec_(codec),
      options_(options),
      progress_(progress),
      destination_(std::move(destination)),
      buffer_(options.buffer_size()) {}

fs::path ArchiveReader::resolve_destination(const fs::path& destination, const std::string& name) {
    std::string s = name;
    for (auto& c : s) { if (c == '\\') c = '/'; }
    while (!s.empty() && s.front() == '/') s.erase(s.begin());
    while (!s.empty() && s.back() == '/') s.pop_back();

    const fs::path base = destination.lexically_normal();
    const fs::path candidate = (base / fs::path(s).relative_path()).lexically_normal();
    const fs::path rel = candidate.lexically_relative(base);

    if (s.empty() || s.find('\0') != std::string::npos) {
        Logger::log(LogLevel::Error, "Archive entry with an empty name: '" + name + "'", reader_tag());
        throw IOError("Archive entry has no usable name: '" + name + "'");
    }
    // "./" names the destination itself
    if (rel == ".") {
        return base;
    }
    if (rel.empty() || *rel.begin() == "..") {
        Logger::log(LogLevel::Error, "Suspicious archive entry (path traversal): " + name, reader_tag());
        throw IOError("Archive entry points outside the destination: '" + name + "'");
    }
    return candidate;
}

void ArchiveReader::extract_all() {
    while (const auto entry = codec_.next_entry()) {
        const fs::path out_path = resolve_destination(destination_, entry->name);

        std::uintmax_t size = 0;
        if (entry->is_symlink) {
            Logger::log(LogLevel::Warning, "Skipping symbolic link: " + entry->name, reader_tag());
            size = entry->size.value_or(0);
        } else if (entry->is_directory) {
            Logger::log(LogLevel::Debug, "Creating folder: " + out_path.string(), reader_tag());
            ensure_directories(out_path, reader_tag());
        } else if (out_path == destination_.lexically_normal()) {
            Logger::log(LogLevel::Error, "File entry names the destination folder: " + entry->name, reader_tag());
            throw IOError("File entry names the destination folder: '" + entry->name + "'");
        } else {
            Logger::log(LogLevel::Debug, "Extracting: " + entry->name, reader_tag());
            const std::uintmax_t written = extract_file(out_path);
            // streamed entries may only learn their size after the data
            size = entry->size.value_or(written);
        }

        codec_.close_entry();
        progress_.advance(out_path.string(), size);
    }
}

std::uintmax_t ArchiveReader::extract_file(const fs::path& out_path) {
    ensure_directories(out_path.parent_path(), reader_tag());

    FilePtr file = create_output_file(out_path, options_.overwrite_existing(), reader_tag());

    std::uintmax_t written = 0;
    for (;;) {
        const std::size_t got = codec_.read(buffer_);
        if (got == 0) break;
        if (std::fwrite(buffer_.data(), 1, got, file.get()) != got) {
            Logger::log(LogLevel::Error, "Error writing: " + out_path.string(), reader_tag());
            throw IOError("Error writing file", out_path);
        }
        written += got;
    }

    if (std::fclose(file.release()) != 0) {
        Logger::log(LogLevel::Error, "Error closing: " + out_path.string(), reader_tag());
        throw IOError("Error closing file", out_path);
    }
    return written;
}

} // namespace packrat
