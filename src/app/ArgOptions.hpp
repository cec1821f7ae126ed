/**
 * @file ArgOptions.hpp
 * @brief Command line parsing for the lancollect tool.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <boost/program_options.hpp>

namespace lancollect::app {

/**
 * @struct CommandLineOptions
 * @brief Global options plus the raw arguments of the chosen command.
 */
struct CommandLineOptions {
    std::string command;
    std::vector<std::string> commandArgs;   ///< Everything after the command name.
    std::optional<std::string> configPath;
    std::optional<std::string> logLevel;

    bool showHelp = false;
    bool valid = true;
    std::string errorMessage;
    std::string helpText;
};

/**
 * @brief Parses "lancollect [global options] <command> [command options]".
 */
CommandLineOptions ParseArgv(int argc, char* argv[]);

/**
 * @brief Parses the arguments of one command against its description.
 * @throws boost::program_options::error on unknown or malformed options.
 */
boost::program_options::variables_map ParseCommandArgs(
    const boost::program_options::options_description& desc,
    const std::vector<std::string>& args);

} // namespace lancollect::app
