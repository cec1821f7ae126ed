/**
 * @file IngestionGate.hpp
 * @brief Quota enforcement and counter bookkeeping for submissions.
 */

#pragma once
#include <memory>
#include <string>
#include "domain/Submission.hpp"
#include "domain/TaskRepository.hpp"

namespace lancollect::application {

/**
 * @class IngestionGate
 * @brief The only path through which a task's counter changes.
 *
 * The check-and-increment is a single guarded UPDATE inside the store's
 * transaction, so no in-process lock is involved; concurrent callers in
 * other processes are serialized the same way.
 */
class IngestionGate {
public:
    explicit IngestionGate(std::shared_ptr<domain::TaskRepository> repository);

    /**
     * @brief Stores the submission and counts it, or refuses without a trace.
     * @throws CapacityExceededError when the task is full.
     * @throws TaskNotFoundError when the task does not exist.
     */
    domain::Submission recordSubmission(const std::string& taskId, const domain::SubmissionData& data);

    /** @brief Operator removal; decrements the owning task's counter (never below 0). */
    bool deleteSubmission(long long submissionId);

    /** @brief Removes every submission of the task and zeroes its counter. */
    int clearSubmissions(const std::string& taskId);

    /**
     * @brief Operator correction of the counter.
     * @throws InvalidArgumentError if count is negative.
     */
    bool resetCount(const std::string& taskId, int count);

private:
    std::shared_ptr<domain::TaskRepository> m_repository;
};

} // namespace lancollect::application
