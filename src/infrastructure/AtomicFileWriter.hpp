/**
 * @file AtomicFileWriter.hpp
 * @brief Temp-then-rename file output.
 */

#pragma once
#include <filesystem>
#include <string>

namespace lancollect::infrastructure {

/**
 * @class AtomicFileWriter
 * @brief Writes into a unique temp file beside the target, then moves it into
 * place. Readers see either the old file or the complete new one.
 *
 * Every failure removes the temp file and throws IoFailureError naming the
 * offending path; the previous target is left as it was.
 */
class AtomicFileWriter {
public:
    /** @brief Writes content to target atomically. */
    static void WriteText(const std::filesystem::path& target, const std::string& content);

    /** @brief Copies source to target atomically. */
    static void CopyFile(const std::filesystem::path& source, const std::filesystem::path& target);

    /**
     * @brief Unique temp path in target's directory: "<target>.<ticks>.tmp".
     * Creates the directory if needed.
     */
    static std::filesystem::path MakeTempPath(const std::filesystem::path& target);

    /**
     * @brief Removes the previous target (if any) and renames temp onto it.
     * On failure the temp file is deleted.
     */
    static void ReplaceWith(const std::filesystem::path& temp, const std::filesystem::path& target);

    /** @brief Best-effort removal used on error paths; logs instead of throwing. */
    static void DiscardTemp(const std::filesystem::path& temp);
};

} // namespace lancollect::infrastructure
