//
// Created by the packrat authors on 18/10/26.
//

#include "../../include/size_estimator.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/zip_codec.hpp"
#include <fstream>
#include <system_error>

namespace packrat {

namespace fs = std::filesystem;

static const char* estimator_tag() {
    return "SizeEstimator";
}

static std::uintmax_t file_size_or_throw(const fs::path& path) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        Logger::log(LogLevel::Error, "Can't read size of: " + path.string() + " (" + ec.message() + ")", estimator_tag());
        throw IOError("Can't read file size", path, ec);
    }
    return size;
}

std::uintmax_t SizeEstimator::recursive_size(const fs::path& path) {
    std::error_code ec;
    const bool is_dir = fs::is_directory(path, ec);
    if (ec) {
        Logger::log(LogLevel::Error, "Can't inspect: " + path.string() + " (" + ec.message() + ")", estimator_tag());
        throw IOError("Can't inspect path", path, ec);
    }
    if (!is_dir) {
        return file_size_or_throw(path);
    }

    std::uintmax_t total = 0;
    fs::recursive_directory_iterator it(path, ec);
    const fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_directory(type_ec)) continue;
        if (type_ec) {
            ec = type_ec;
            break;
        }
        total += file_size_or_throw(it->path());
    }
    if (ec) {
        Logger::log(LogLevel::Error, "Can't walk folder: " + path.string() + " (" + ec.message() + ")", estimator_tag());
        throw IOError("Can't walk directory", path, ec);
    }
    return total;
}

std::uintmax_t SizeEstimator::estimate_input_size(const std::vector<fs::path>& paths) {
    std::uintmax_t total = 0;
    for (const auto& path : paths) {
        total += recursive_size(path);
    }
    Logger::log(LogLevel::Debug, "Input size: " + std::to_string(total) + " bytes", estimator_tag());
    return total;
}

std::uintmax_t SizeEstimator::estimate_archive_uncompressed_size(const fs::path& archive_path) {
    std::ifstream in(archive_path, std::ios::binary);
    if (!in) {
        Logger::log(LogLevel::Error, "Can't open archive: " + archive_path.string(), estimator_tag());
        throw IOError("Can't open archive", archive_path);
    }
    return estimate_archive_uncompressed_size(in);
}

std::uintmax_t SizeEstimator::estimate_archive_uncompressed_size(std::istream& in) {
    const auto start = in.tellg();
    if (start == std::istream::pos_type(-1)) {
        Logger::log(LogLevel::Error, "Archive stream is not seekable", estimator_tag());
        throw IOError("Archive stream is not seekable; its size can't be estimated");
    }

    std::uintmax_t total = 0;
    {
        ZipEntryReader reader(in, ZipEntryReader::Mode::RandomAccess, Options::kDefaultBufferSize);
        while (auto entry = reader.next_entry()) {
            if (!entry->is_directory) {
                total += entry->size.value_or(0);
            }
        }
        reader.close();
    }

    in.clear();
    in.seekg(start);
    if (!in) {
        Logger::log(LogLevel::Error, "Can't rewind archive stream", estimator_tag());
        throw IOError("Can't rewind archive stream");
    }

    Logger::log(LogLevel::Debug, "Archive uncompressed size: " + std::to_string(total) + " bytes", estimator_tag());
    return total;
}

} // namespace packrat
