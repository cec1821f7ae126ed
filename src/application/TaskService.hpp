/**
 * @file TaskService.hpp
 * @brief Creation and housekeeping of collection tasks.
 */

#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/Task.hpp"
#include "domain/TaskRepository.hpp"
#include "infrastructure/SlugGenerator.hpp"

namespace lancollect::application {

/**
 * @class TaskService
 * @brief Creates tasks with collision-free public slugs and lays out their
 * collection folders.
 */
class TaskService {
public:
    static constexpr int kMaxSlugAttempts = 5;

    /**
     * @struct TaskRequest
     * @brief Operator input for a new task.
     */
    struct TaskRequest {
        std::string title;
        std::string description;
        domain::TaskType taskType = domain::TaskType::FileCollection;
        domain::VersioningMode versioningMode = domain::VersioningMode::AutoVersion;
        int maxLimit = 0;
        std::string templatePath;
    };

    TaskService(std::shared_ptr<domain::TaskRepository> repository,
                std::shared_ptr<infrastructure::SlugGenerator> slugGenerator,
                const std::string& collectionRoot);

    /**
     * @brief Inserts a task, retrying with a fresh slug on collisions.
     * @throws InvalidArgumentError for a blank title or negative capacity.
     * @throws SlugConflictError after kMaxSlugAttempts collisions.
     */
    domain::Task createTask(const TaskRequest& request);

    /**
     * @brief New task with the source's configuration and a zeroed counter.
     * @param newTitle Defaults to "<source title> (副本)".
     * @throws TaskNotFoundError if the source does not exist.
     */
    domain::Task copyTask(const std::string& sourceTaskId, const std::optional<std::string>& newTitle = std::nullopt);

    std::vector<domain::Task> listTasks();

    /**
     * @brief Resolves a slug first, then an id.
     * @throws TaskNotFoundError
     */
    domain::Task findTask(const std::string& slugOrId);

    /** @brief Enables or disables intake for a task. */
    void setActive(const std::string& taskId, bool active);

    bool deleteTask(const std::string& taskId);

private:
    domain::Task insertWithFreshSlug(domain::Task task);

    std::shared_ptr<domain::TaskRepository> m_repository;
    std::shared_ptr<infrastructure::SlugGenerator> m_slugGenerator;
    std::filesystem::path m_collectionRoot;
};

} // namespace lancollect::application
