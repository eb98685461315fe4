//
// Created by the packrat authors on 18/10/26.
//

/**
 * @file size_estimator.hpp
 * @brief Up-front estimate of the bytes a request will process.
 *
 * The estimate only normalizes progress to 0-100%, but it is a
 * precondition: if it fails, the request fails before anything is written.
 */

#ifndef PACKRAT_SIZE_ESTIMATOR_HPP
#define PACKRAT_SIZE_ESTIMATOR_HPP

#include <cstdint>
#include <filesystem>
#include <istream>
#include <vector>

namespace packrat {

class SizeEstimator {
public:
    /**
     * @brief Sum of the sizes of all files under @p paths.
     *
     * A file counts with its size, a directory with the sizes of all
     * non-directory descendants; directories themselves count zero.
     * @throws IOError if any path can't be inspected.
     */
    static std::uintmax_t estimate_input_size(const std::vector<std::filesystem::path>& paths);

    /**
     * @brief Size of one input path, as counted by estimate_input_size().
     */
    static std::uintmax_t recursive_size(const std::filesystem::path& path);

    /**
     * @brief Total uncompressed size of the file entries of a ZIP file.
     * @throws IOError if the archive can't be opened or read.
     */
    static std::uintmax_t estimate_archive_uncompressed_size(const std::filesystem::path& archive_path);

    /**
     * @brief Same as above, reading from a seekable stream.
     *
     * The stream is rewound to its starting position afterwards.
     * @throws IOError if the stream is not seekable or can't be read.
     */
    static std::uintmax_t estimate_archive_uncompressed_size(std::istream& in);
};

} // namespace packrat

#endif // PACKRAT_SIZE_ESTIMATOR_HPP
