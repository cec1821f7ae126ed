/**
 * @file Submission.hpp
 * @brief Domain record of one accepted ingestion.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace lancollect::domain {

/**
 * @struct SubmissionData
 * @brief What a contributor hands in, before the gate accepts it.
 */
struct SubmissionData {
    std::string submitterName;
    std::string contact;
    std::string department;
    std::string originalFilename;
    std::string storedFilename;
    std::string clientAddress;
    std::vector<std::string> attachments; ///< Stored attachment paths, if any.
};

/**
 * @class Submission
 * @brief Immutable record created once per accepted ingestion.
 */
class Submission {
public:
    long long id = 0;              ///< Row id assigned by the store.
    std::string taskId;
    std::string submitterName;
    std::string contact;
    std::string department;
    std::string originalFilename;
    std::string storedFilename;    ///< Versioned name inside the collection folder.
    std::string clientAddress;
    std::vector<std::string> attachments;
    std::chrono::system_clock::time_point timestamp;

    Submission() = default;
};

} // namespace lancollect::domain
