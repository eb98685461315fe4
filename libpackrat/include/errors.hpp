//
// Created by the packrat authors on 18/10/26.
//

/**
 * @file errors.hpp
 * @brief Exception types thrown by pack and unpack.
 *
 * Every failure aborts the whole request. Nothing is retried and
 * nothing already written (archive bytes, extracted files) is removed.
 */

#ifndef PACKRAT_ERRORS_HPP
#define PACKRAT_ERRORS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace packrat {

/**
 * @brief Common base of all packrat errors.
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Bad input set: empty, or two paths resolving to the same file.
 * Raised before the output is created or touched.
 */
class ValidationError final : public Error {
public:
    using Error::Error;
};

/**
 * @brief Caller contract violation in Options (e.g. a zero buffer size).
 */
class ConfigurationError final : public Error {
public:
    using Error::Error;
};

/**
 * @brief Filesystem, stream or codec failure.
 */
class IOError final : public Error {
public:
    using Error::Error;

    IOError(const std::string& what, const std::filesystem::path& path)
        : Error(what + ": " + path.string()) {}

    IOError(const std::string& what, const std::filesystem::path& path, const std::error_code& ec)
        : Error(what + ": " + path.string() + " (" + ec.message() + ")") {}
};

} // namespace packrat

#endif // PACKRAT_ERRORS_HPP
