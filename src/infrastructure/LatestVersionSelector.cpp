/**
 * @file LatestVersionSelector.cpp
 * @brief Implementation of LatestVersionSelector.
 */

#include "infrastructure/LatestVersionSelector.hpp"
#include "infrastructure/FileSystemArtifactScanner.hpp"
#include "infrastructure/Log.hpp"
#include <algorithm>
#include <map>

namespace lancollect::infrastructure {

std::vector<domain::StoredArtifact> LatestVersionSelector::SelectWinners(
    const std::vector<domain::StoredArtifact>& artifacts) {
    std::map<std::string, const domain::StoredArtifact*> winners;

    for (const auto& artifact : artifacts) {
        auto [it, inserted] = winners.emplace(artifact.identityKey(), &artifact);
        if (inserted) continue;

        const domain::StoredArtifact* current = it->second;
        if (artifact.version > current->version ||
            (artifact.version == current->version && artifact.timestamp > current->timestamp)) {
            it->second = &artifact;
        }
    }

    std::vector<domain::StoredArtifact> selected;
    selected.reserve(winners.size());
    for (const auto& [key, artifact] : winners) {
        selected.push_back(*artifact);
    }
    std::sort(selected.begin(), selected.end(), [](const auto& a, const auto& b) {
        return a.filename < b.filename;
    });
    return selected;
}

Selection LatestVersionSelector::selectLatest(const std::filesystem::path& folder, const std::string& extension,
                                              const std::string& excludeFilename) const {
    FileSystemArtifactScanner scanner(folder.string());
    auto artifacts = scanner.scan(extension, excludeFilename);
    auto winners = SelectWinners(artifacts);

    Selection selection;
    selection.report.totalFiles = static_cast<int>(artifacts.size());
    selection.report.selectedFiles = static_cast<int>(winners.size());
    selection.report.excludedFiles = selection.report.totalFiles - selection.report.selectedFiles;
    for (const auto& winner : winners) {
        selection.files.emplace_back(winner.path);
    }

    Log::Info("LatestVersionSelector", "Folder " + folder.string() + ": " +
              std::to_string(selection.report.totalFiles) + " file(s), " +
              std::to_string(selection.report.selectedFiles) + " latest, " +
              std::to_string(selection.report.excludedFiles) + " superseded");
    return selection;
}

} // namespace lancollect::infrastructure
