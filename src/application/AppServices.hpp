/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/IngestionGate.hpp"
#include "application/MergeEngine.hpp"
#include "application/SubmissionService.hpp"
#include "application/TaskService.hpp"
#include "domain/TableStore.hpp"
#include "domain/TaskRepository.hpp"
#include "infrastructure/IoSerializer.hpp"
#include "infrastructure/SlugGenerator.hpp"

namespace lancollect::application {

/**
 * @struct AppServices
 * @brief Owns one instance of every service; the IoSerializer in particular
 * exists exactly once per process and is shared by all writers.
 */
struct AppServices {
    std::shared_ptr<infrastructure::IoSerializer> ioSerializer;
    std::shared_ptr<domain::TaskRepository> taskRepository;
    std::shared_ptr<domain::TableStore> tableStore;
    std::shared_ptr<infrastructure::SlugGenerator> slugGenerator;
    std::shared_ptr<IngestionGate> ingestionGate;
    std::unique_ptr<TaskService> taskService;
    std::unique_ptr<SubmissionService> submissionService;
    std::unique_ptr<MergeEngine> mergeEngine;
};

} // namespace lancollect::application
