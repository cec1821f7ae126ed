/**
 * @file FileSystemArtifactScanner.cpp
 * @brief Implementation of the FileSystemArtifactScanner.
 */

#include "infrastructure/FileSystemArtifactScanner.hpp"
#include "domain/DomainErrors.hpp"
#include "infrastructure/FilenameVersioner.hpp"
#include "infrastructure/Log.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace lancollect::infrastructure {

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::chrono::system_clock::time_point ToSystemTime(fs::file_time_type ftime) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
}

} // namespace

FileSystemArtifactScanner::FileSystemArtifactScanner(const std::string& folderPath)
    : m_folderPath(folderPath) {}

std::vector<domain::StoredArtifact> FileSystemArtifactScanner::scan(const std::string& extension,
                                                                    const std::string& excludeFilename) const {
    std::vector<domain::StoredArtifact> artifacts;

    std::error_code ec;
    if (!fs::is_directory(m_folderPath, ec)) {
        return artifacts;
    }

    const std::string wanted = ToLower(extension);
    const std::string excluded = ToLower(excludeFilename);

    fs::directory_iterator it(m_folderPath, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        std::error_code statEc;
        if (!entry.is_regular_file(statEc)) continue;

        std::string filename = entry.path().filename().string();
        if (ToLower(entry.path().extension().string()) != wanted) continue;
        if (!excluded.empty() && ToLower(filename) == excluded) continue;

        auto decoded = FilenameVersioner::ParseSubmissionName(entry.path());
        if (decoded) {
            artifacts.push_back(*decoded);
            continue;
        }

        domain::StoredArtifact artifact;
        artifact.path = entry.path().string();
        artifact.filename = filename;
        artifact.version = 1;
        artifact.parsed = false;
        auto ftime = fs::last_write_time(entry.path(), statEc);
        artifact.timestamp = statEc ? std::chrono::system_clock::now() : ToSystemTime(ftime);
        Log::Debug("ArtifactScanner", "Unversioned file kept as its own group: " + filename);
        artifacts.push_back(artifact);
    }
    if (ec) {
        throw domain::IoFailureError(m_folderPath, "cannot list folder: " + ec.message());
    }

    std::sort(artifacts.begin(), artifacts.end(), [](const auto& a, const auto& b) {
        return a.filename < b.filename;
    });
    return artifacts;
}

} // namespace lancollect::infrastructure
