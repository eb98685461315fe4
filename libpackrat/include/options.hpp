//
// Created by the packrat authors on 18/10/26.
//

/**
 * @file options.hpp
 * @brief Configuration value shared by pack and unpack.
 */

#ifndef PACKRAT_OPTIONS_HPP
#define PACKRAT_OPTIONS_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <utility>

namespace packrat {

/**
 * @brief Receives the completed percentage and the path just processed.
 *
 * While packing the label is the source path of the file or folder that
 * was added; while unpacking it is the destination path written.
 */
using ProgressObserver = std::function<void(double percent, const std::string& label)>;

/**
 * @brief Compression method requested from the ZIP codec.
 */
enum class Compression {
    Deflate,
    Store
};

/**
 * @brief Parameters of a pack/unpack request.
 *
 * @details Built by the caller with the chained setters and handed to
 * the engine by const reference; the engine never modifies it.
 */
class Options {
public:
    static constexpr std::size_t kDefaultBufferSize = 4096;

    Options() = default;

    /**
     * @brief Size in bytes of the buffer used to copy file contents.
     * Default: 4096. Zero is rejected with ConfigurationError.
     */
    Options& bufferSize(std::size_t val) { buffer_size_ = val; return *this; }

    /**
     * @brief Keep the name of a single input folder as prefix of the
     * entry names. Only considered when packing exactly one path; with
     * more paths folder names are always kept. Default: true.
     */
    Options& includeBaseFolderName(bool val) { include_base_folder_name_ = val; return *this; }

    /**
     * @brief Progress callback. Default: none.
     */
    Options& progressObserver(ProgressObserver observer) { progress_observer_ = std::move(observer); return *this; }

    /**
     * @brief Compression of packed file entries. Default: Deflate.
     */
    Options& compression(Compression val) { compression_ = val; return *this; }

    /**
     * @brief Replace an existing archive file when packing, or existing
     * files when unpacking. Default: false (such a target is an IOError).
     */
    Options& overwriteExisting(bool val) { overwrite_existing_ = val; return *this; }

    [[nodiscard]] std::size_t buffer_size() const noexcept { return buffer_size_; }
    [[nodiscard]] bool include_base_folder_name() const noexcept { return include_base_folder_name_; }
    [[nodiscard]] const ProgressObserver& progress_observer() const noexcept { return progress_observer_; }
    [[nodiscard]] Compression compression() const noexcept { return compression_; }
    [[nodiscard]] bool overwrite_existing() const noexcept { return overwrite_existing_; }

    /**
     * @brief Fails fast on values the engine cannot work with.
     * @throws ConfigurationError if buffer_size() is zero.
     */
    void validate() const;

private:
    std::size_t buffer_size_ = kDefaultBufferSize;
    bool include_base_folder_name_ = true;
    ProgressObserver progress_observer_;
    Compression compression_ = Compression::Deflate;
    bool overwrite_existing_ = false;
};

} // namespace packrat

#endif // PACKRAT_OPTIONS_HPP
