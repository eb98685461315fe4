//
// Created by the packrat authors on 18/10/26.
//

#include "../../include/file_utils.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <cerrno>
#include <string>
#include <system_error>

namespace packrat {

    namespace fs = std::filesystem;

    FILE* open_file(const fs::path& path, const char* mode) {
#ifdef _WIN32
        // _wfopen accepts wide-char (UTF-16) paths; the \\?\ prefix lifts MAX_PATH
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = fs::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }

        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    FilePtr create_output_file(const fs::path& path, const bool overwrite, const std::string_view tag) {
        // "x" (C11) makes fopen fail with EEXIST instead of truncating
        FilePtr file(open_file(path, overwrite ? "wb" : "wbx"));
        if (!file) {
            const std::error_code ec(errno, std::generic_category());
            Logger::log(LogLevel::Error, "Can't open file in write mode: " + path.string() + " (" + ec.message() + ")", tag);
            throw IOError("Can't create file", path, ec);
        }
        return file;
    }

    void ensure_directories(const fs::path& dir, const std::string_view tag) {
        if (dir.empty()) return;

        std::error_code ec;
        if (fs::is_directory(dir, ec)) return;

        fs::create_directories(dir, ec);
        if (!ec && !fs::is_directory(dir, ec) && !ec) {
            ec = std::make_error_code(std::errc::not_a_directory);
        }
        if (ec) {
            Logger::log(LogLevel::Error, "Can't create folder: " + dir.string() + " (" + ec.message() + ")", tag);
            throw IOError("Can't create directory", dir, ec);
        }
    }

    fs::path canonical_key(const fs::path& path) {
        std::error_code ec;
        const auto abs_path = fs::absolute(path, ec);
        if (ec) {
            throw IOError("Can't resolve path", path, ec);
        }
        auto key = fs::weakly_canonical(abs_path, ec);
        if (ec) {
            throw IOError("Can't resolve path", path, ec);
        }
        // "dir/" and "dir" must compare equal
        if (!key.has_filename() && key.has_relative_path()) {
            key = key.parent_path();
        }
        return key;
    }

} // namespace packrat
