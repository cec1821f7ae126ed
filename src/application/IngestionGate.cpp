/**
 * @file IngestionGate.cpp
 * @brief Implementation of IngestionGate.
 */

#include "application/IngestionGate.hpp"
#include "domain/DomainErrors.hpp"
#include "infrastructure/Log.hpp"

using lancollect::infrastructure::Log;

namespace lancollect::application {

IngestionGate::IngestionGate(std::shared_ptr<domain::TaskRepository> repository)
    : m_repository(std::move(repository)) {}

domain::Submission IngestionGate::recordSubmission(const std::string& taskId, const domain::SubmissionData& data) {
    domain::Submission submission = m_repository->recordSubmission(taskId, data);
    Log::Debug("IngestionGate", "Accepted submission #" + std::to_string(submission.id) + " for task " + taskId);
    return submission;
}

bool IngestionGate::deleteSubmission(long long submissionId) {
    bool removed = m_repository->deleteSubmission(submissionId);
    if (removed) {
        Log::Info("IngestionGate", "Deleted submission #" + std::to_string(submissionId));
    } else {
        Log::Warn("IngestionGate", "No submission #" + std::to_string(submissionId));
    }
    return removed;
}

int IngestionGate::clearSubmissions(const std::string& taskId) {
    int removed = m_repository->clearSubmissions(taskId);
    Log::Info("IngestionGate", "Cleared " + std::to_string(removed) + " submission(s) of task " + taskId);
    return removed;
}

bool IngestionGate::resetCount(const std::string& taskId, int count) {
    if (count < 0) {
        throw domain::InvalidArgumentError("Submission count cannot be negative");
    }
    return m_repository->updateCurrentCount(taskId, count);
}

} // namespace lancollect::application
