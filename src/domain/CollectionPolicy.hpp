/**
 * @file CollectionPolicy.hpp
 * @brief Value objects describing how a task stores and aggregates submissions.
 */

#pragma once

#include <optional>
#include <string>

namespace lancollect::domain {

/**
 * @enum VersioningMode
 * @brief Per-task policy for name collisions in the collection folder.
 */
enum class VersioningMode {
    Overwrite = 0,   ///< Keep only the latest artifact, always written as version 1.
    AutoVersion = 1  ///< Keep every artifact, each write gets the next version.
};

/**
 * @enum TaskType
 * @brief What contributors hand in for a task.
 */
enum class TaskType {
    FileCollection = 0, ///< Spreadsheet uploads.
    DataCollection = 1  ///< Online form records stored as JSON.
};

/**
 * @enum MergeMode
 * @brief Per-column aggregation policy for the statistics merge.
 */
enum class MergeMode {
    Accumulate = 0, ///< One summary across all records.
    GroupBy = 1     ///< One summary per distinct value of the grouping field.
};

/**
 * @enum ColumnType
 * @brief Declared value type of a schema column.
 */
enum class ColumnType {
    Text,
    Number,
    Boolean
};

inline std::string VersioningModeToString(VersioningMode mode) {
    switch (mode) {
        case VersioningMode::Overwrite: return "Overwrite";
        case VersioningMode::AutoVersion: return "AutoVersion";
        default: return "Unknown";
    }
}

inline std::optional<VersioningMode> ParseVersioningMode(const std::string& text) {
    if (text == "Overwrite" || text == "overwrite" || text == "0") return VersioningMode::Overwrite;
    if (text == "AutoVersion" || text == "auto" || text == "autoversion" || text == "1") return VersioningMode::AutoVersion;
    return std::nullopt;
}

inline std::string TaskTypeToString(TaskType type) {
    switch (type) {
        case TaskType::FileCollection: return "FileCollection";
        case TaskType::DataCollection: return "DataCollection";
        default: return "Unknown";
    }
}

inline std::optional<TaskType> ParseTaskType(const std::string& text) {
    if (text == "FileCollection" || text == "file" || text == "0") return TaskType::FileCollection;
    if (text == "DataCollection" || text == "data" || text == "1") return TaskType::DataCollection;
    return std::nullopt;
}

inline std::string MergeModeToString(MergeMode mode) {
    switch (mode) {
        case MergeMode::Accumulate: return "Accumulate";
        case MergeMode::GroupBy: return "GroupBy";
        default: return "Unknown";
    }
}

inline std::optional<MergeMode> ParseMergeMode(const std::string& text) {
    if (text == "Accumulate" || text == "accumulate" || text == "0") return MergeMode::Accumulate;
    if (text == "GroupBy" || text == "groupby" || text == "1") return MergeMode::GroupBy;
    return std::nullopt;
}

/**
 * @brief Display name of a column type, as written into statistics reports.
 */
inline std::string ColumnTypeToString(ColumnType type) {
    switch (type) {
        case ColumnType::Text: return "文本";
        case ColumnType::Number: return "数字";
        case ColumnType::Boolean: return "双选框(是/否)";
        default: return "文本";
    }
}

/**
 * @brief Accepts both the English names and the form designer's labels.
 * Anything unknown is treated as Text.
 */
inline ColumnType ParseColumnType(const std::string& text) {
    if (text == "Number" || text == "number" || text == "数字") return ColumnType::Number;
    if (text == "Boolean" || text == "boolean" || text == "双选框(是/否)" || text == "双选框") return ColumnType::Boolean;
    return ColumnType::Text;
}

} // namespace lancollect::domain
