/**
 * @file TaskService.cpp
 * @brief Implementation of TaskService.
 */

#include "application/TaskService.hpp"
#include "domain/DomainErrors.hpp"
#include "infrastructure/Log.hpp"
#include "infrastructure/PathUtils.hpp"
#include <chrono>

namespace fs = std::filesystem;
using lancollect::infrastructure::Log;

namespace lancollect::application {

TaskService::TaskService(std::shared_ptr<domain::TaskRepository> repository,
                         std::shared_ptr<infrastructure::SlugGenerator> slugGenerator,
                         const std::string& collectionRoot)
    : m_repository(std::move(repository)),
      m_slugGenerator(std::move(slugGenerator)),
      m_collectionRoot(collectionRoot) {}

domain::Task TaskService::createTask(const TaskRequest& request) {
    if (request.title.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw domain::InvalidArgumentError("Task title must not be empty");
    }
    if (request.maxLimit < 0) {
        throw domain::InvalidArgumentError("Capacity cannot be negative");
    }

    domain::Task task;
    task.title = request.title;
    task.description = request.description;
    task.taskType = request.taskType;
    task.versioningMode = request.versioningMode;
    task.maxLimit = request.maxLimit;
    task.templatePath = request.templatePath;
    return insertWithFreshSlug(task);
}

domain::Task TaskService::copyTask(const std::string& sourceTaskId, const std::optional<std::string>& newTitle) {
    auto source = m_repository->getTaskById(sourceTaskId);
    if (!source) {
        throw domain::TaskNotFoundError(sourceTaskId);
    }

    domain::Task task = *source;
    task.title = newTitle && !newTitle->empty() ? *newTitle : source->title + " (副本)";
    task.currentCount = 0;
    Log::Info("TaskService", "Copying task '" + source->title + "' as '" + task.title + "'");
    return insertWithFreshSlug(task);
}

domain::Task TaskService::insertWithFreshSlug(domain::Task task) {
    task.currentCount = 0;
    task.isActive = true;
    task.createdAt = std::chrono::system_clock::now();

    for (int attempt = 1; attempt <= kMaxSlugAttempts; ++attempt) {
        task.id = m_slugGenerator->generateTaskId();
        task.slug = m_slugGenerator->generateSlug();
        task.collectionPath = infrastructure::PathUtils::BuildCollectionPath(
            m_collectionRoot, task.title, task.slug, task.taskType).string();

        if (!m_repository->tryCreateTask(task)) {
            Log::Warn("TaskService", "Slug collision on attempt " + std::to_string(attempt) + " (" + task.slug + ")");
            continue;
        }

        std::error_code ec;
        fs::create_directories(task.collectionPath, ec);
        if (ec) {
            // The folder is created again on first write; the task itself is valid.
            Log::Warn("TaskService", "Could not create " + task.collectionPath + ": " + ec.message());
        }
        Log::Info("TaskService", "Created task '" + task.title + "' slug=" + task.slug);
        return task;
    }

    throw domain::SlugConflictError(kMaxSlugAttempts);
}

std::vector<domain::Task> TaskService::listTasks() {
    return m_repository->getAllTasks();
}

domain::Task TaskService::findTask(const std::string& slugOrId) {
    if (auto task = m_repository->getTaskBySlug(slugOrId)) return *task;
    if (auto task = m_repository->getTaskById(slugOrId)) return *task;
    throw domain::TaskNotFoundError(slugOrId);
}

void TaskService::setActive(const std::string& taskId, bool active) {
    auto task = m_repository->getTaskById(taskId);
    if (!task) {
        throw domain::TaskNotFoundError(taskId);
    }
    task->isActive = active;
    m_repository->updateTask(*task);
    Log::Info("TaskService", std::string(active ? "Activated" : "Deactivated") + " task " + task->slug);
}

bool TaskService::deleteTask(const std::string& taskId) {
    bool removed = m_repository->deleteTask(taskId);
    if (removed) {
        Log::Info("TaskService", "Deleted task " + taskId + " (collected files are left on disk)");
    }
    return removed;
}

} // namespace lancollect::application
