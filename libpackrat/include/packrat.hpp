//
// Created by the packrat authors on 18/10/26.
//

/**
 * @file packrat.hpp
 * @brief Public API: pack paths into a ZIP archive and unpack it again.
 *
 * All calls block until done and report progress through
 * Options::progressObserver(). Errors are thrown as packrat::Error
 * subclasses (see errors.hpp); partial output is left in place.
 */

#ifndef PACKRAT_HPP
#define PACKRAT_HPP

#include "errors.hpp"
#include "options.hpp"
#include <filesystem>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace packrat {

// --- Packing ---

/**
 * @brief Writes a ZIP archive of @p paths to @p out.
 *
 * Folders are added recursively. With a single folder input and
 * includeBaseFolderName(false), entries are named relative to the
 * folder's content; otherwise every folder keeps its own name as prefix
 * and files are named after themselves.
 *
 * @throws ValidationError for an empty list or duplicate paths, before @p out is touched.
 * @throws ConfigurationError for invalid options.
 * @throws IOError on read/write failures.
 */
void pack(std::ostream& out, const Options& options, const std::vector<std::filesystem::path>& paths);

/**
 * @brief Creates @p archive_path and writes a ZIP archive of @p paths to it.
 *
 * The file must not exist unless Options::overwriteExisting(true) is set.
 */
void pack(const std::filesystem::path& archive_path, const Options& options,
          const std::vector<std::filesystem::path>& paths);

void pack(const std::filesystem::path& archive_path, const std::vector<std::filesystem::path>& paths);

void pack(const std::string& archive_path, const Options& options, const std::vector<std::string>& paths);

void pack(const std::string& archive_path, const std::vector<std::string>& paths);

// --- Unpacking ---

/**
 * @brief Extracts the ZIP archive read from @p in into @p destination.
 *
 * @p destination and any missing parents are created. The stream must be
 * seekable: it is scanned once for the total size, rewound, then
 * streamed.
 *
 * @throws ConfigurationError for invalid options.
 * @throws IOError on read/write failures or unsafe entry names.
 */
void unpack(std::istream& in, const std::filesystem::path& destination, const Options& options);

/**
 * @brief Extracts the ZIP file @p archive_path into @p destination.
 */
void unpack(const std::filesystem::path& archive_path, const std::filesystem::path& destination,
            const Options& options);

void unpack(const std::filesystem::path& archive_path, const std::filesystem::path& destination);

void unpack(const std::string& archive_path, const std::string& destination, const Options& options);

void unpack(const std::string& archive_path, const std::string& destination);

} // namespace packrat

#endif // PACKRAT_HPP
