/**
 * @file TaskRepository.hpp
 * @brief Interface for persistence of tasks and their submission records.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/Submission.hpp"
#include "domain/Task.hpp"

namespace lancollect::domain {

/**
 * @class TaskRepository
 * @brief Abstract store of tasks, submissions and the per-task counter.
 */
class TaskRepository {
public:
    virtual ~TaskRepository() = default;

    /** @brief Fetches all tasks, newest first. */
    virtual std::vector<Task> getAllTasks() = 0;

    /** @brief Looks a task up by its public slug. */
    virtual std::optional<Task> getTaskBySlug(const std::string& slug) = 0;

    /** @brief Looks a task up by its id. */
    virtual std::optional<Task> getTaskById(const std::string& taskId) = 0;

    /**
     * @brief Inserts a new task.
     * @return False if the slug is already taken; the caller decides whether
     * to retry with a fresh slug.
     */
    virtual bool tryCreateTask(const Task& task) = 0;

    /** @brief Updates the mutable configuration of a task (never its counter). */
    virtual bool updateTask(const Task& task) = 0;

    /** @brief Removes a task together with its submissions. */
    virtual bool deleteTask(const std::string& taskId) = 0;

    /**
     * @brief Inserts the submission and increments the task counter as one
     * transaction. The increment is conditional on remaining capacity.
     * @return The stored submission with its assigned id.
     * @throws CapacityExceededError when the task is full; nothing is written.
     */
    virtual Submission recordSubmission(const std::string& taskId, const SubmissionData& data) = 0;

    /** @brief Lists the submissions of a task, newest first. */
    virtual std::vector<Submission> getSubmissionsByTaskId(const std::string& taskId) = 0;

    /**
     * @brief Deletes one submission and decrements its task's counter together.
     * @return False if no such submission exists.
     */
    virtual bool deleteSubmission(long long submissionId) = 0;

    /**
     * @brief Deletes every submission of a task and resets its counter to 0.
     * @return Number of removed submissions.
     */
    virtual int clearSubmissions(const std::string& taskId) = 0;

    /** @brief Decrements the counter, never below zero. */
    virtual bool decrementCurrentCount(const std::string& taskId) = 0;

    /** @brief Overwrites the counter (operator correction). */
    virtual bool updateCurrentCount(const std::string& taskId, int count) = 0;
};

} // namespace lancollect::domain
