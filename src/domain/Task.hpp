/**
 * @file Task.hpp
 * @brief Domain entity for a collection task.
 */

#pragma once

#include <chrono>
#include <string>
#include "domain/CollectionPolicy.hpp"

namespace lancollect::domain {

/**
 * @class Task
 * @brief A collection campaign: where submissions land and how many are accepted.
 *
 * currentCount is owned by the ingestion gate; it is never written directly
 * except by explicit operator corrections.
 */
class Task {
public:
    std::string id;                ///< Stable identifier (UUID text).
    std::string slug;              ///< Short public identifier, unique.
    std::string title;             ///< Display title, also used for folder naming.
    std::string description;
    TaskType taskType = TaskType::FileCollection;
    VersioningMode versioningMode = VersioningMode::AutoVersion;
    int maxLimit = 0;              ///< Submission capacity, 0 means unlimited.
    int currentCount = 0;          ///< Accepted submissions so far.
    std::string collectionPath;    ///< Folder receiving the submitted artifacts.
    std::string templatePath;      ///< Spreadsheet template or JSON schema.
    bool isActive = true;
    std::chrono::system_clock::time_point createdAt;

    Task() = default;

    bool hasCapacityLimit() const { return maxLimit > 0; }
    bool isFull() const { return maxLimit > 0 && currentCount >= maxLimit; }
};

} // namespace lancollect::domain
