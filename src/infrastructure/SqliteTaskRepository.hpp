/**
 * @file SqliteTaskRepository.hpp
 * @brief SQLite implementation of the task and submission store.
 */

#pragma once
#include <string>
#include "domain/TaskRepository.hpp"

namespace lancollect::infrastructure {

/**
 * @class SqliteTaskRepository
 * @brief TaskRepository over a single SQLite file.
 *
 * Every operation opens its own connection (WAL journal, synchronous=NORMAL,
 * foreign keys on, busy timeout) so the repository can be shared by any
 * number of threads. Multi-statement operations run inside BEGIN IMMEDIATE
 * transactions; the write lock is taken up front, which serializes the
 * capacity check-and-increment across threads and processes alike.
 */
class SqliteTaskRepository : public domain::TaskRepository {
public:
    /**
     * @param databasePath File path of the database; created with its schema if missing.
     * @param busyTimeoutMs How long a connection waits for a competing writer.
     * @throws StorageError if the database cannot be opened or initialized.
     */
    explicit SqliteTaskRepository(const std::string& databasePath, int busyTimeoutMs = 5000);

    std::vector<domain::Task> getAllTasks() override;
    std::optional<domain::Task> getTaskBySlug(const std::string& slug) override;
    std::optional<domain::Task> getTaskById(const std::string& taskId) override;
    bool tryCreateTask(const domain::Task& task) override;
    bool updateTask(const domain::Task& task) override;
    bool deleteTask(const std::string& taskId) override;

    domain::Submission recordSubmission(const std::string& taskId, const domain::SubmissionData& data) override;
    std::vector<domain::Submission> getSubmissionsByTaskId(const std::string& taskId) override;
    bool deleteSubmission(long long submissionId) override;
    int clearSubmissions(const std::string& taskId) override;
    bool decrementCurrentCount(const std::string& taskId) override;
    bool updateCurrentCount(const std::string& taskId, int count) override;

    const std::string& databasePath() const { return m_databasePath; }

private:
    void initializeSchema();

    std::string m_databasePath;
    int m_busyTimeoutMs;
};

} // namespace lancollect::infrastructure
