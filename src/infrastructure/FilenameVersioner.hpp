/**
 * @file FilenameVersioner.hpp
 * @brief Encodes and decodes (identity, version, timestamp) in file names.
 *
 * Two grammars are used inside a collection folder:
 *  - artifacts:   <prefix>_v<N><ext>
 *  - submissions: <prefix>_v<N>-<yyyyMMdd>-<HHmmss><ext>
 *
 * The listing helpers must be called while holding the IoSerializer guard
 * when the result is used to pick the name of a new file.
 */

#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "domain/StoredArtifact.hpp"

namespace lancollect::infrastructure {

class FilenameVersioner {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    static std::string BuildArtifactName(const std::string& prefix, int version, const std::string& ext);

    static std::string BuildSubmissionName(const std::string& prefix, int version,
                                           TimePoint timestamp, const std::string& ext);

    /**
     * @brief Strict version parse of a name without its extension.
     * @return The version if stem is "<prefix>_v<N>" or
     * "<prefix>_v<N>-<8 digits>-<6 digits>"; nullopt otherwise.
     */
    static std::optional<int> ParseVersion(const std::string& stem, const std::string& prefix);

    /**
     * @brief Lists "<prefix>_v*<ext>" in folder and returns max parsed version + 1.
     * Files that fail the strict parse are ignored. Missing folder -> 1.
     */
    static int NextVersion(const std::filesystem::path& folder, const std::string& prefix,
                           const std::string& ext);

    /**
     * @brief Overwrite mode: deletes every "<prefix>*<ext>" in folder except keep.
     * Wider than the AutoVersion listing: files sharing the prefix are
     * removed even when they fail the strict parse.
     * @return Number of removed files.
     * @throws IoFailureError if the folder cannot be listed or a matching
     * file cannot be removed.
     */
    static int DeleteForOverwrite(const std::filesystem::path& folder, const std::string& prefix,
                                  const std::string& ext, const std::filesystem::path& keep = {});

    /** @brief Local time as "yyyyMMdd-HHmmss". */
    static std::string FormatTimestamp(TimePoint timestamp);

    /** @brief Inverse of FormatTimestamp for the two digit groups. */
    static std::optional<TimePoint> ParseTimestamp(const std::string& date, const std::string& time);

    /**
     * @brief Decodes "<template>-<name>-<contact>_v<N>-<date>-<time><ext>".
     * @return nullopt for names outside the submission grammar.
     */
    static std::optional<domain::StoredArtifact> ParseSubmissionName(const std::filesystem::path& path);

    static std::string EscapeRegex(const std::string& text);

private:
    /** @brief Regular files directly inside folder. @throws IoFailureError */
    static std::vector<std::filesystem::path> ListFiles(const std::filesystem::path& folder);
    static bool HasExtension(const std::string& filename, const std::string& ext);
};

} // namespace lancollect::infrastructure
