//
// Created by the packrat authors on 18/10/26.
//

#include "../../include/archive_writer.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/path_namer.hpp"
#include "../../include/size_estimator.hpp"
#include <chrono>
#include <fstream>
#include <set>
#include <string>
#include <system_error>

namespace packrat {

namespace fs = std::filesystem;

static const char* writer_tag() {
    return "ArchiveWriter";
}

static std::time_t mtime_of(const fs::path& path) {
    std::error_code ec;
    const auto ftime = fs::last_write_time(path, ec);
    if (ec) {
        return 0;
    }
    const auto stime = std::chrono::file_clock::to_sys(ftime);
    return std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::system_clock::duration>(stime));
}

ArchiveWriter::ArchiveWriter(IEntryWriter& codec, const Options& options, ProgressTracker& progress)
    : codec_(codec),
      progress_(progress),
      buffer_(options.buffer_size()) {}

void ArchiveWriter::validate_inputs(const std::vector<fs::path>& paths) {
    if (paths.empty()) {
        Logger::log(LogLevel::Error, "No input paths given", writer_tag());
        throw ValidationError("At least one input path is required");
    }

    std::set<fs::path> seen;
    for (const auto& path : paths) {
        if (!seen.insert(canonical_key(path)).second) {
            Logger::log(LogLevel::Error, "Duplicate input: " + path.string(), writer_tag());
            throw ValidationError("Duplicate path entry found for: '" + path.string() + "'");
        }
    }
}

void ArchiveWriter::add(const fs::path& input, const fs::path& root) {
    std::error_code ec;
    const bool is_dir = fs::is_directory(input, ec);
    if (ec) {
        Logger::log(LogLevel::Error, "Can't inspect: " + input.string() + " (" + ec.message() + ")", writer_tag());
        throw IOError("Can't inspect path", input, ec);
    }

    visit(input, root, is_dir);
    if (!is_dir) return;

    fs::recursive_directory_iterator it(input, ec);
    const fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        const bool child_is_dir = it->is_directory(type_ec);
        if (type_ec) {
            ec = type_ec;
            break;
        }
        visit(it->path(), root, child_is_dir);
    }
    if (ec) {
        Logger::log(LogLevel::Error, "Can't walk folder: " + input.string() + " (" + ec.message() + ")", writer_tag());
        throw IOError("Can't walk directory", input, ec);
    }
}

void ArchiveWriter::visit(const fs::path& node, const fs::path& root, const bool is_directory) {
    const auto name = PathNamer::entry_name(root, node, is_directory);
    if (!name) return;

    std::uintmax_t size = 0;
    if (is_directory) {
        add_directory(node, *name);
    } else {
        size = add_file(node, *name);
    }
    progress_.advance(node.string(), size);
}

void ArchiveWriter::add_directory(const fs::path& node, const std::string& name) {
    Logger::log(LogLevel::Debug, "Adding folder: " + name, writer_tag());

    ArchiveEntry entry;
    entry.name = name;
    entry.is_directory = true;
    entry.size = 0;
    entry.mtime = mtime_of(node);

    codec_.open_entry(entry);
    codec_.close_entry();
}

std::uintmax_t ArchiveWriter::add_file(const fs::path& node, const std::string& name) {
    std::error_code ec;
    const std::uintmax_t size = fs::file_size(node, ec);
    if (ec) {
        Logger::log(LogLevel::Error, "Can't read size of: " + node.string() + " (" + ec.message() + ")", writer_tag());
        throw IOError("Can't read file size", node, ec);
    }

    std::ifstream ifs(node, std::ios::binary);
    if (!ifs) {
        Logger::log(LogLevel::Error, "Can't open file for reading: " + node.string(), writer_tag());
        throw IOError("Can't open file for reading", node);
    }

    Logger::log(LogLevel::Debug, "Adding file: " + name + " (" + std::to_string(size) + " bytes)", writer_tag());

    ArchiveEntry entry;
    entry.name = name;
    entry.size = size;
    entry.mtime = mtime_of(node);
    codec_.open_entry(entry);

    while (ifs) {
        ifs.read(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
        const std::streamsize got = ifs.gcount();
        if (got > 0) {
            codec_.write({buffer_.data(), static_cast<std::size_t>(got)});
        }
    }
    if (ifs.bad()) {
        Logger::log(LogLevel::Error, "Error reading: " + node.string(), writer_tag());
        throw IOError("Error reading file", node);
    }

    codec_.close_entry();
    return size;
}

void ArchiveWriter::run(const Options& options,
                        const std::vector<fs::path>& paths,
                        const EntryWriterFactory& open_codec) {
    options.validate();
    validate_inputs(paths);

    const std::uintmax_t total = SizeEstimator::estimate_input_size(paths);
    const bool include_base = PathNamer::should_include_base_folder_name(options, paths);

    Logger::log(LogLevel::Info,
                "Packing " + std::to_string(paths.size()) + " path(s), " + std::to_string(total) + " bytes",
                writer_tag());

    ProgressTracker progress(total, options.progress_observer());
    const std::unique_ptr<IEntryWriter> codec = open_codec();
    ArchiveWriter writer(*codec, options, progress);

    for (const auto& path : paths) {
        writer.add(path, PathNamer::relativization_root(path, include_base));
    }
    codec->close();

    Logger::log(LogLevel::Info, "Packed " + std::to_string(progress.processed()) + " bytes", writer_tag());
}

} // namespace packrat
