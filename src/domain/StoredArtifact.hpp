/**
 * @file StoredArtifact.hpp
 * @brief Domain entity for a versioned file inside a collection folder.
 */

#pragma once
#include <chrono>
#include <string>

namespace lancollect::domain {

/**
 * @class StoredArtifact
 * @brief A file whose name encodes (identity, version, timestamp).
 *
 * Files that do not follow the submission grammar are still represented,
 * with parsed == false, so the selector can keep them as their own group.
 */
class StoredArtifact {
public:
    std::string path;              ///< Full path of the file.
    std::string filename;          ///< Basename of the file.
    std::string templateName;      ///< Leading name segment (template of the task).
    std::string submitterName;
    std::string contact;
    int version;
    std::chrono::system_clock::time_point timestamp;
    bool parsed;                   ///< True if the name matched the grammar.

    StoredArtifact() : version(1), parsed(false) {}

    /**
     * @brief Grouping key of the artifact: submitter and contact for parsed
     * names, the bare file stem otherwise.
     */
    std::string identityKey() const {
        if (parsed) return submitterName + "|" + contact;
        return "#" + filename;
    }
};

} // namespace lancollect::domain
