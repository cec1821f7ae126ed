/**
 * @file MergeResult.hpp
 * @brief Summary value returned by every merge run.
 */

#pragma once

#include <sstream>
#include <string>

namespace lancollect::domain {

/**
 * @enum MergeErrorKind
 * @brief Why a merge run did not produce output.
 */
enum class MergeErrorKind {
    None,
    SourceMissing,  ///< Source folder, template or schema file absent.
    SchemaInvalid,  ///< Schema present but without columns.
    NoData,         ///< Nothing readable to merge.
    IoFailure       ///< Reading or writing failed mid-run.
};

inline std::string MergeErrorKindToString(MergeErrorKind kind) {
    switch (kind) {
        case MergeErrorKind::None: return "None";
        case MergeErrorKind::SourceMissing: return "SourceMissing";
        case MergeErrorKind::SchemaInvalid: return "SchemaInvalid";
        case MergeErrorKind::NoData: return "NoData";
        case MergeErrorKind::IoFailure: return "IoFailure";
        default: return "Unknown";
    }
}

/**
 * @struct MergeResult
 * @brief Ephemeral statistics of one merge. Not persisted.
 *
 * For statistics merges mergedFiles holds the number of report rows.
 */
struct MergeResult {
    int totalFiles = 0;          ///< Files found in the source folder.
    int filteredFiles = 0;       ///< Superseded versions left out.
    int mergedFiles = 0;         ///< Files actually merged.
    int totalRecords = 0;        ///< Rows read before deduplication.
    int deduplicatedRecords = 0; ///< Rows kept.
    int duplicatedCount = 0;     ///< Rows dropped as duplicates.
    std::string outputPath;
    bool isSuccess = false;
    std::string errorMessage;
    MergeErrorKind errorKind = MergeErrorKind::None;

    std::string summary() const {
        std::ostringstream ss;
        if (!isSuccess) {
            ss << "合并失败: " << errorMessage;
            return ss.str();
        }
        ss << "合并成功！总文件: " << totalFiles
           << ", 过滤旧版本: " << filteredFiles
           << ", 实际合并: " << mergedFiles;
        if (duplicatedCount > 0) {
            ss << ", 总记录: " << totalRecords
               << ", 去重保留: " << deduplicatedRecords
               << ", 移除重复: " << duplicatedCount;
        } else {
            ss << ", 总记录: " << deduplicatedRecords;
        }
        return ss.str();
    }
};

} // namespace lancollect::domain
