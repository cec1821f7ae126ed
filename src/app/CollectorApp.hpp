/**
 * @file CollectorApp.hpp
 * @brief Command line front end of LanCollect.
 */

#pragma once

#include <string>
#include <vector>
#include "app/ArgOptions.hpp"
#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace lancollect::app {

/**
 * @class CollectorApp
 * @brief Loads settings, wires the services and runs one command.
 */
class CollectorApp {
public:
    /**
     * @brief Parses argv and executes the requested command.
     * @return Exit code (0 for success).
     */
    int Run(int argc, char* argv[]);

private:
    /**
     * @brief Loads settings and builds the service graph.
     * @return True if the store could be opened.
     */
    bool Init(const CommandLineOptions& options);

    int dispatch(const std::string& command, const std::vector<std::string>& args);

    int cmdInitConfig(const std::vector<std::string>& args);
    int cmdCreateTask(const std::vector<std::string>& args);
    int cmdCopyTask(const std::vector<std::string>& args);
    int cmdListTasks(const std::vector<std::string>& args);
    int cmdSetActive(const std::vector<std::string>& args);
    int cmdDeleteTask(const std::vector<std::string>& args);
    int cmdSubmit(const std::vector<std::string>& args);
    int cmdSubmissions(const std::vector<std::string>& args);
    int cmdDeleteSubmission(const std::vector<std::string>& args);
    int cmdClearSubmissions(const std::vector<std::string>& args);
    int cmdResetCount(const std::vector<std::string>& args);
    int cmdSelectLatest(const std::vector<std::string>& args);
    int cmdMerge(const std::vector<std::string>& args);
    int cmdMergeStats(const std::vector<std::string>& args);

    std::string m_configPath;
    infrastructure::AppConfig m_config;
    application::AppServices m_services;
};

} // namespace lancollect::app
