//
// Created by the packrat authors on 18/10/26.
//

#include "../../include/path_namer.hpp"
#include <system_error>

namespace packrat {

namespace fs = std::filesystem;

// "a/b/" has an empty filename; drop the separator so parent_path() is "a"
static fs::path strip_trailing_separator(const fs::path& path) {
    if (!path.has_filename() && path.has_relative_path()) {
        return path.parent_path();
    }
    return path;
}

fs::path PathNamer::parent_of(const fs::path& path) {
    const fs::path p = strip_trailing_separator(path);
    if (p.empty() || p == p.root_path()) {
        return {};
    }
    const fs::path parent = p.parent_path();
    if (parent.empty()) {
        return ".";
    }
    return parent;
}

bool PathNamer::should_include_base_folder_name(const Options& options,
                                                const std::vector<fs::path>& paths) {
    if (paths.size() != 1) {
        return true;
    }
    // a root or a bare relative name has no parent folder to relativize against
    const fs::path p = strip_trailing_separator(paths.front());
    if (p.parent_path().empty() || p == p.root_path()) {
        return true;
    }
    return options.include_base_folder_name();
}

fs::path PathNamer::relativization_root(const fs::path& input, const bool include_base_folder_name) {
    std::error_code ec;
    const bool is_dir = fs::is_directory(input, ec);
    const fs::path parent = parent_of(input);
    // a filesystem root has no name to keep
    if (parent.empty() || (!include_base_folder_name && is_dir)) {
        return strip_trailing_separator(input);
    }
    return parent;
}

std::optional<std::string> PathNamer::entry_name(const fs::path& root,
                                                 const fs::path& node,
                                                 const bool is_directory) {
    const fs::path rel = strip_trailing_separator(node).lexically_relative(root);
    if (rel.empty() || rel == ".") {
        return std::nullopt;
    }

    std::string name = rel.generic_string();
    if (is_directory) {
        name += '/';
    }
    return name;
}

} // namespace packrat
