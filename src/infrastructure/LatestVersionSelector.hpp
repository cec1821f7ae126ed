/**
 * @file LatestVersionSelector.hpp
 * @brief Reconstructs the current state of a folder of versioned files.
 */

#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "domain/StoredArtifact.hpp"

namespace lancollect::infrastructure {

struct SelectionReport {
    int totalFiles = 0;
    int selectedFiles = 0;
    int excludedFiles = 0;   ///< totalFiles - selectedFiles
};

struct Selection {
    std::vector<std::filesystem::path> files;
    SelectionReport report;
};

/**
 * @class LatestVersionSelector
 * @brief Groups artifacts by identity and keeps the newest of each group.
 *
 * Winner: highest version, ties broken by the most recent timestamp.
 */
class LatestVersionSelector {
public:
    /**
     * @brief Scans folder for files with the extension and selects winners.
     * @param excludeFilename Skipped before grouping (e.g. a schema file).
     */
    Selection selectLatest(const std::filesystem::path& folder, const std::string& extension,
                           const std::string& excludeFilename = "") const;

    /** @brief Pure selection over an already scanned list, result sorted by filename. */
    static std::vector<domain::StoredArtifact> SelectWinners(const std::vector<domain::StoredArtifact>& artifacts);
};

} // namespace lancollect::infrastructure
