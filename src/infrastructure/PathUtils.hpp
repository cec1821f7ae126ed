/**
 * @file PathUtils.hpp
 * @brief XDG locations and file-name hygiene for collection folders.
 */

#pragma once
#include <string>
#include <filesystem>
#include "domain/CollectionPolicy.hpp"

namespace lancollect::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief $XDG_DATA_HOME/LanCollect (not created). */
    static std::filesystem::path GetAppDataDir();

    /** @brief $XDG_CONFIG_HOME/LanCollect/settings.json */
    static std::filesystem::path GetDefaultConfigPath();

    /**
     * @brief Makes a user-supplied value safe as a file-name segment.
     *
     * Characters invalid in file names (and a trailing run of dots) become
     * '_'; then only CJK ideographs, ASCII letters, digits, '-' and '_' are
     * kept. Blank input yields "Unknown".
     */
    static std::string Sanitize(const std::string& input);

    /**
     * @brief <root>/<title>/<slug>/{文件收集|在线填表} depending on the task type.
     */
    static std::filesystem::path BuildCollectionPath(const std::filesystem::path& root,
                                                     const std::string& title,
                                                     const std::string& slug,
                                                     domain::TaskType type);
};

} // namespace lancollect::infrastructure
