/**
 * @file ArgOptions.cpp
 * @brief Implementation of the command line parser.
 */

#include "app/ArgOptions.hpp"

#include <sstream>

namespace po = boost::program_options;

namespace lancollect::app {

CommandLineOptions ParseArgv(int argc, char* argv[]) {
    CommandLineOptions options;

    po::options_description desc("Global options");
    desc.add_options()
        ("help,h", "Display this help message")
        ("config", po::value<std::string>(), "Path to settings.json")
        ("log-level", po::value<std::string>(), "error | warn | info | debug")
        ("command", po::value<std::string>(), "Command to run")
        ("args", po::value<std::vector<std::string>>(), "Command arguments");

    po::positional_options_description positional;
    positional.add("command", 1);
    positional.add("args", -1);

    std::ostringstream help;
    help << "LanCollect - collection and consolidation of submitted spreadsheets" << std::endl
         << std::endl
         << "Usage: " << (argc > 0 ? argv[0] : "lancollect")
         << " [--config FILE] [--log-level LEVEL] <command> [options]" << std::endl
         << std::endl
         << "Commands:" << std::endl
         << "  create-task        Create a collection task" << std::endl
         << "  copy-task          Create a task from another task's settings" << std::endl
         << "  list-tasks         List tasks and their counters" << std::endl
         << "  submit             Store a submission for a task" << std::endl
         << "  submissions        List the submissions of a task" << std::endl
         << "  delete-submission  Remove one submission record" << std::endl
         << "  clear-submissions  Remove all submission records of a task" << std::endl
         << "  reset-count        Correct a task's submission counter" << std::endl
         << "  select-latest      Show the latest version per submitter in a folder" << std::endl
         << "  merge              Merge the latest tabular submissions" << std::endl
         << "  merge-stats        Build the statistics report of a form task" << std::endl
         << std::endl
         << "Run '<command> --help' for the options of a command." << std::endl;
    options.helpText = help.str();

    try {
        po::parsed_options parsed = po::command_line_parser(argc, argv)
            .options(desc)
            .positional(positional)
            .allow_unregistered()
            .run();

        po::variables_map vm;
        po::store(parsed, vm);
        po::notify(vm);

        if (vm.count("config")) options.configPath = vm["config"].as<std::string>();
        if (vm.count("log-level")) options.logLevel = vm["log-level"].as<std::string>();

        if (!vm.count("command")) {
            options.showHelp = true;
            if (!vm.count("help")) {
                options.valid = false;
                options.errorMessage = "No command specified";
            }
            return options;
        }
        options.command = vm["command"].as<std::string>();

        // Everything after the command belongs to it, options included.
        std::vector<std::string> rest = po::collect_unrecognized(parsed.options, po::include_positional);
        if (!rest.empty() && rest.front() == options.command) rest.erase(rest.begin());
        options.commandArgs = rest;

        if (vm.count("help")) options.commandArgs.push_back("--help");
    } catch (const po::error& e) {
        options.valid = false;
        options.errorMessage = e.what();
    }

    return options;
}

po::variables_map ParseCommandArgs(const po::options_description& desc, const std::vector<std::string>& args) {
    po::variables_map vm;
    po::store(po::command_line_parser(args).options(desc).run(), vm);
    po::notify(vm);
    return vm;
}

} // namespace lancollect::app
