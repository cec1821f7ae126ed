/**
 * @file FileSystemArtifactScanner.hpp
 * @brief Scanner for versioned files in a collection folder.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/StoredArtifact.hpp"

namespace lancollect::infrastructure {

/**
 * @class FileSystemArtifactScanner
 * @brief Infrastructure adapter listing a folder's files of one extension.
 *
 * Names following the submission grammar are decoded; the others come back
 * unparsed with version 1 and the file's write time.
 */
class FileSystemArtifactScanner {
public:
    explicit FileSystemArtifactScanner(const std::string& folderPath);

    /**
     * @brief Lists regular files whose extension matches (case-insensitive).
     * @param extension Extension including the dot, e.g. ".xlsx".
     * @param excludeFilename File name skipped entirely (e.g. the schema).
     * @throws IoFailureError if an existing folder cannot be listed.
     */
    std::vector<domain::StoredArtifact> scan(const std::string& extension,
                                             const std::string& excludeFilename = "") const;

private:
    std::string m_folderPath;
};

} // namespace lancollect::infrastructure
