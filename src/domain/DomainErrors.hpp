/**
 * @file DomainErrors.hpp
 * @brief Exceptions raised by the ingestion side of the system.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace lancollect::domain {

/**
 * @class DomainError
 * @brief Base of all business-rule failures; carries a stable error code.
 */
class DomainError : public std::runtime_error {
public:
    DomainError(std::string code, const std::string& message)
        : std::runtime_error(message), m_code(std::move(code)) {}

    const std::string& code() const noexcept { return m_code; }

private:
    std::string m_code;
};

/** @brief The task accepted its last allowed submission already. */
class CapacityExceededError : public DomainError {
public:
    explicit CapacityExceededError(const std::string& taskId)
        : DomainError("CAPACITY_EXCEEDED", "提交数量已达到上限 (task " + taskId + ")"),
          m_taskId(taskId) {}

    const std::string& taskId() const noexcept { return m_taskId; }

private:
    std::string m_taskId;
};

/** @brief Slug uniqueness kept colliding until the retry budget ran out. */
class SlugConflictError : public DomainError {
public:
    explicit SlugConflictError(int attempts)
        : DomainError("SLUG_CONFLICT",
                      "Failed to create task after " + std::to_string(attempts) + " attempts due to slug conflicts") {}
};

/** @brief Referenced task does not exist. */
class TaskNotFoundError : public DomainError {
public:
    explicit TaskNotFoundError(const std::string& key)
        : DomainError("TASK_NOT_FOUND", "Task not found: " + key) {}
};

/** @brief Caller supplied an empty or malformed field. */
class InvalidArgumentError : public DomainError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : DomainError("INVALID_ARGUMENT", message) {}
};

/**
 * @class IoFailureError
 * @brief Write or read failure during versioning or storage, with the path involved.
 */
class IoFailureError : public DomainError {
public:
    IoFailureError(const std::string& path, const std::string& detail)
        : DomainError("IO_FAILURE", "IO failure on '" + path + "': " + detail), m_path(path) {}

    const std::string& path() const noexcept { return m_path; }

private:
    std::string m_path;
};

/** @brief Database layer reported an error it could not recover from. */
class StorageError : public DomainError {
public:
    explicit StorageError(const std::string& message)
        : DomainError("STORAGE_ERROR", message) {}
};

} // namespace lancollect::domain
