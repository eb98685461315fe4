//
// Created by the packrat authors on 18/10/26.
//

#include "../../include/packrat.hpp"
#include "../../include/archive_reader.hpp"
#include "../../include/archive_writer.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/progress_tracker.hpp"
#include "../../include/size_estimator.hpp"
#include "../../include/zip_codec.hpp"
#include <fstream>
#include <memory>
#include <utility>

namespace packrat {

namespace fs = std::filesystem;

static const char* api_tag() {
    return "packrat";
}

static std::vector<fs::path> to_paths(const std::vector<std::string>& paths) {
    return std::vector<fs::path>(paths.begin(), paths.end());
}

// --- Packing ---

void pack(std::ostream& out, const Options& options, const std::vector<fs::path>& paths) {
    ArchiveWriter::run(options, paths, [&]() -> std::unique_ptr<IEntryWriter> {
        return std::make_unique<ZipEntryWriter>(out, options.compression());
    });
}

void pack(const fs::path& archive_path, const Options& options, const std::vector<fs::path>& paths) {
    // run() opens the codec only once inputs are validated and measured
    ArchiveWriter::run(options, paths, [&]() -> std::unique_ptr<IEntryWriter> {
        FilePtr file = create_output_file(archive_path, options.overwrite_existing(), api_tag());
        Logger::log(LogLevel::Debug, "Writing archive: " + archive_path.string(), api_tag());
        return std::make_unique<ZipEntryWriter>(std::move(file), options.compression());
    });
}

void pack(const fs::path& archive_path, const std::vector<fs::path>& paths) {
    pack(archive_path, Options{}, paths);
}

void pack(const std::string& archive_path, const Options& options, const std::vector<std::string>& paths) {
    pack(fs::path(archive_path), options, to_paths(paths));
}

void pack(const std::string& archive_path, const std::vector<std::string>& paths) {
    pack(archive_path, Options{}, paths);
}

// --- Unpacking ---

void unpack(std::istream& in, const fs::path& destination, const Options& options) {
    options.validate();
    ensure_directories(destination, api_tag());

    const std::uintmax_t total = SizeEstimator::estimate_archive_uncompressed_size(in);
    Logger::log(LogLevel::Info,
                "Unpacking " + std::to_string(total) + " bytes into " + destination.string(),
                api_tag());

    ProgressTracker progress(total, options.progress_observer());
    ZipEntryReader codec(in, ZipEntryReader::Mode::Streaming, options.buffer_size());
    ArchiveReader reader(codec, options, progress, destination);
    reader.extract_all();
    codec.close();

    Logger::log(LogLevel::Info, "Unpacked " + std::to_string(progress.processed()) + " bytes", api_tag());
}

void unpack(const fs::path& archive_path, const fs::path& destination, const Options& options) {
    std::ifstream in(archive_path, std::ios::binary);
    if (!in) {
        Logger::log(LogLevel::Error, "Can't open archive: " + archive_path.string(), api_tag());
        throw IOError("Can't open archive", archive_path);
    }
    unpack(in, destination, options);
}

void unpack(const fs::path& archive_path, const fs::path& destination) {
    unpack(archive_path, destination, Options{});
}

void unpack(const std::string& archive_path, const std::string& destination, const Options& options) {
    unpack(fs::path(archive_path), fs::path(destination), options);
}

void unpack(const std::string& archive_path, const std::string& destination) {
    unpack(archive_path, destination, Options{});
}

} // namespace packrat
