//
// Created by the packrat authors on 18/10/26.
//

/**
 * @file path_namer.hpp
 * @brief Maps filesystem paths to archive entry names.
 */

#ifndef PACKRAT_PATH_NAMER_HPP
#define PACKRAT_PATH_NAMER_HPP

#include "options.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace packrat {

/**
 * @brief Decides how input paths are named inside the archive.
 *
 * @details Each input is walked relative to a "relativization root":
 * its parent folder when the base folder name is kept (so entries look
 * like "photos/2024/a.jpg"), or the folder itself when it is elided
 * (entries look like "2024/a.jpg").
 */
class PathNamer {
public:
    /**
     * @brief Whether input folders keep their own name as entry prefix.
     *
     * With several inputs the name is always kept, otherwise the roots'
     * children would share one namespace. With a single input the option
     * decides, unless the path has no parent (a filesystem root or a bare
     * relative name such as "dir"), in which case the name is kept.
     */
    static bool should_include_base_folder_name(const Options& options,
                                                const std::vector<std::filesystem::path>& paths);

    /**
     * @brief Folder that entry names of @p input are made relative to.
     *
     * A plain file is always named after itself, so its root is its parent
     * regardless of @p include_base_folder_name.
     */
    static std::filesystem::path relativization_root(const std::filesystem::path& input,
                                                     bool include_base_folder_name);

    /**
     * @brief Entry name of @p node relative to @p root.
     *
     * Uses '/' separators and a trailing '/' for directories.
     * @return std::nullopt when @p node is @p root itself (no entry).
     */
    static std::optional<std::string> entry_name(const std::filesystem::path& root,
                                                 const std::filesystem::path& node,
                                                 bool is_directory);

    /**
     * @brief Parent of @p path ignoring a trailing separator ("a/b/" -> "a").
     * Relative single-component paths resolve to "." so that they have a parent.
     */
    static std::filesystem::path parent_of(const std::filesystem::path& path);
};

} // namespace packrat

#endif // PACKRAT_PATH_NAMER_HPP
