/**
 * @file CollectorApp.cpp
 * @brief Implementation of CollectorApp.
 */

#include "app/CollectorApp.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

#include "domain/DomainErrors.hpp"
#include "infrastructure/CsvTableStore.hpp"
#include "infrastructure/FilenameVersioner.hpp"
#include "infrastructure/IoSerializer.hpp"
#include "infrastructure/JsonRecordReader.hpp"
#include "infrastructure/LatestVersionSelector.hpp"
#include "infrastructure/Log.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/SlugGenerator.hpp"
#include "infrastructure/SqliteTaskRepository.hpp"

namespace fs = std::filesystem;
namespace po = boost::program_options;

namespace lancollect::app {

using infrastructure::Log;

namespace {

bool PrintHelpIfAsked(const po::variables_map& vm, const po::options_description& desc) {
    if (!vm.count("help")) return false;
    std::cout << desc << std::endl;
    return true;
}

void PrintTask(const domain::Task& task) {
    std::cout << task.slug << "  " << task.title << std::endl
              << "    id:         " << task.id << std::endl
              << "    type:       " << domain::TaskTypeToString(task.taskType)
              << " / " << domain::VersioningModeToString(task.versioningMode) << std::endl
              << "    count:      " << task.currentCount
              << (task.hasCapacityLimit() ? " / " + std::to_string(task.maxLimit) : std::string(" (unlimited)"))
              << (task.isActive ? "" : "  [inactive]") << std::endl
              << "    collection: " << task.collectionPath << std::endl;
    if (!task.templatePath.empty()) {
        std::cout << "    template:   " << task.templatePath << std::endl;
    }
}

void PrintResult(const domain::MergeResult& result) {
    if (result.isSuccess) {
        std::cout << result.summary() << std::endl;
        std::cout << "输出: " << result.outputPath << std::endl;
    } else {
        std::cerr << result.summary()
                  << " (" << domain::MergeErrorKindToString(result.errorKind) << ")" << std::endl;
    }
}

// Beside the collection folder, never inside it.
std::string DefaultReportPath(const domain::Task& task, const std::string& suffix) {
    fs::path collection(task.collectionPath);
    return (collection.parent_path() / (infrastructure::PathUtils::Sanitize(task.title) + suffix)).string();
}

// "字段=GroupBy,Boolean,所属部门"; type and group field are optional.
std::pair<std::string, domain::ColumnDefinition> ParseOverride(const std::string& text) {
    auto eq = text.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw domain::InvalidArgumentError("Override must look like name=Mode[,Type[,GroupField]]: " + text);
    }

    domain::ColumnDefinition column;
    column.name = text.substr(0, eq);

    std::vector<std::string> parts;
    std::stringstream ss(text.substr(eq + 1));
    std::string part;
    while (std::getline(ss, part, ',')) parts.push_back(part);

    if (parts.empty()) throw domain::InvalidArgumentError("Missing merge mode in override: " + text);
    auto mode = domain::ParseMergeMode(parts[0]);
    if (!mode) throw domain::InvalidArgumentError("Unknown merge mode: " + parts[0]);
    column.mergeMode = *mode;
    if (parts.size() > 1 && !parts[1].empty()) column.type = domain::ParseColumnType(parts[1]);
    if (parts.size() > 2 && !parts[2].empty()) column.groupByField = parts[2];
    return {column.name, column};
}

} // namespace

int CollectorApp::Run(int argc, char* argv[]) {
    CommandLineOptions options = ParseArgv(argc, argv);
    if (!options.valid) {
        std::cerr << "Error: " << options.errorMessage << std::endl << std::endl << options.helpText;
        return 2;
    }
    if (options.showHelp) {
        std::cout << options.helpText;
        return 0;
    }

    if (!Init(options)) return 1;
    return dispatch(options.command, options.commandArgs);
}

bool CollectorApp::Init(const CommandLineOptions& options) {
    m_configPath = options.configPath ? *options.configPath
                                      : infrastructure::PathUtils::GetDefaultConfigPath().string();
    m_config = infrastructure::ConfigLoader::Load(m_configPath);

    infrastructure::LogLevel level = m_config.logLevel;
    if (options.logLevel) {
        auto parsed = Log::ParseLevel(*options.logLevel);
        if (!parsed) {
            std::cerr << "Error: unknown log level '" << *options.logLevel << "'" << std::endl;
            return false;
        }
        level = *parsed;
    }
    Log::SetLevel(level);

    // init-config must work even where the configured store cannot be opened.
    if (options.command == "init-config") return true;

    try {
        std::error_code ec;
        fs::create_directories(fs::path(m_config.databasePath).parent_path(), ec);
        fs::create_directories(m_config.collectionRoot, ec);
        if (ec) {
            Log::Warn("CollectorApp", "Could not create " + m_config.collectionRoot + ": " + ec.message());
        }

        application::AppServices services;
        services.ioSerializer = std::make_shared<infrastructure::IoSerializer>();
        services.taskRepository = std::make_shared<infrastructure::SqliteTaskRepository>(
            m_config.databasePath, m_config.busyTimeoutMs);
        services.tableStore = std::make_shared<infrastructure::CsvTableStore>();
        services.slugGenerator = std::make_shared<infrastructure::SlugGenerator>();
        services.ingestionGate = std::make_shared<application::IngestionGate>(services.taskRepository);
        services.taskService = std::make_unique<application::TaskService>(
            services.taskRepository, services.slugGenerator, m_config.collectionRoot);
        services.submissionService = std::make_unique<application::SubmissionService>(
            services.ioSerializer, services.ingestionGate, services.tableStore->extension());
        services.mergeEngine = std::make_unique<application::MergeEngine>(services.tableStore);
        m_services = std::move(services);
    } catch (const std::exception& e) {
        Log::Error("CollectorApp", std::string("Initialization failed: ") + e.what());
        return false;
    }

    Log::Debug("CollectorApp", "Store: " + m_config.databasePath + ", collections: " + m_config.collectionRoot);
    return true;
}

int CollectorApp::dispatch(const std::string& command, const std::vector<std::string>& args) {
    using Handler = int (CollectorApp::*)(const std::vector<std::string>&);
    static const std::map<std::string, Handler> kCommands = {
        {"init-config", &CollectorApp::cmdInitConfig},
        {"create-task", &CollectorApp::cmdCreateTask},
        {"copy-task", &CollectorApp::cmdCopyTask},
        {"list-tasks", &CollectorApp::cmdListTasks},
        {"set-active", &CollectorApp::cmdSetActive},
        {"delete-task", &CollectorApp::cmdDeleteTask},
        {"submit", &CollectorApp::cmdSubmit},
        {"submissions", &CollectorApp::cmdSubmissions},
        {"delete-submission", &CollectorApp::cmdDeleteSubmission},
        {"clear-submissions", &CollectorApp::cmdClearSubmissions},
        {"reset-count", &CollectorApp::cmdResetCount},
        {"select-latest", &CollectorApp::cmdSelectLatest},
        {"merge", &CollectorApp::cmdMerge},
        {"merge-stats", &CollectorApp::cmdMergeStats},
    };

    auto it = kCommands.find(command);
    if (it == kCommands.end()) {
        std::cerr << "Unknown command: " << command << " (try --help)" << std::endl;
        return 2;
    }

    try {
        return (this->*(it->second))(args);
    } catch (const po::error& e) {
        std::cerr << command << ": " << e.what() << std::endl;
        return 2;
    } catch (const domain::DomainError& e) {
        Log::Error("CollectorApp", e.code() + ": " + e.what());
        return 1;
    } catch (const std::exception& e) {
        Log::Error("CollectorApp", std::string("Unexpected error: ") + e.what());
        return 1;
    }
}

int CollectorApp::cmdInitConfig(const std::vector<std::string>& args) {
    po::options_description desc("init-config options");
    desc.add_options()
        ("help,h", "Show options")
        ("data-root", po::value<std::string>(), "Base directory for the store and collections");
    auto vm = ParseCommandArgs(desc, args);
    if (PrintHelpIfAsked(vm, desc)) return 0;

    infrastructure::AppConfig config = m_config;
    if (vm.count("data-root")) {
        fs::path root = fs::absolute(vm["data-root"].as<std::string>());
        config.dataRoot = root.string();
        config.databasePath = (root / "lancollect.db").string();
        config.collectionRoot = (root / "collections").string();
    }
    config.logLevel = Log::GetLevel();
    infrastructure::ConfigLoader::Save(m_configPath, config);
    std::cout << m_configPath << std::endl;
    return 0;
}

int CollectorApp::cmdCreateTask(const std::vector<std::string>& args) {
    po::options_description desc("create-task options");
    desc.add_options()
        ("help,h", "Show options")
        ("title", po::value<std::string>()->required(), "Task title")
        ("description", po::value<std::string>()->default_value(""), "Free text shown to contributors")
        ("type", po::value<std::string>()->default_value("file"), "file | data")
        ("mode", po::value<std::string>()->default_value("auto"), "auto | overwrite")
        ("max", po::value<int>()->default_value(0), "Submission capacity, 0 = unlimited")
        ("template", po::value<std::string>()->default_value(""), "Spreadsheet template or JSON schema");
    auto vm = ParseCommandArgs(desc, args);
    if (PrintHelpIfAsked(vm, desc)) return 0;

    application::TaskService::TaskRequest request;
    request.title = vm["title"].as<std::string>();
    request.description = vm["description"].as<std::string>();
    request.maxLimit = vm["max"].as<int>();
    request.templatePath = vm["template"].as<std::string>();

    auto type = domain::ParseTaskType(vm["type"].as<std::string>());
    if (!type) throw domain::InvalidArgumentError("Unknown task type: " + vm["type"].as<std::string>());
    request.taskType = *type;

    auto mode = domain::ParseVersioningMode(vm["mode"].as<std::string>());
    if (!mode) throw domain::InvalidArgumentError("Unknown versioning mode: " + vm["mode"].as<std::string>());
    request.versioningMode = *mode;

    if (!request.templatePath.empty()) {
        request.templatePath = fs::absolute(request.templatePath).string();
    }

    domain::Task task = m_services.taskService->createTask(request);
    PrintTask(task);
    return 0;
}

int CollectorApp::cmdCopyTask(const std::vector<std::string>& args) {
    po::options_description desc("copy-task options");
    desc.add_options()
        ("help,h", "Show options")
        ("task", po::value<std::string>()->required(), "Slug or id of the source task")
        ("title", po::value<std::string>(), "Title of the copy");
    auto vm = ParseCommandArgs(desc, args);
    if (PrintHelpIfAsked(vm, desc)) return 0;

    domain::Task source = m_services.taskService->findTask(vm["task"].as<std::string>());
    std::optional<std::string> title;
    if (vm.count("title")) title = vm["title"].as<std::string>();

    PrintTask(m_services.taskService->copyTask(source.id, title));
    return 0;
}

int CollectorApp::cmdListTasks(const std::vector<std::string>& args) {
    po::options_description desc("list-tasks options");
    desc.add_options()("help,h", "Show options");
    auto vm = ParseCommandArgs(desc, args);
    if (PrintHelpIfAsked(vm, desc)) return 0;

    auto tasks = m_services.taskService->listTasks();
    if (tasks.empty()) {
        std::cout << "No tasks." << std::endl;
        return 0;
    }
    for (const auto& task : tasks) PrintTask(task);
    return 0;
}

int CollectorApp::cmdSetActive(const std::vector<std::string>& args) {
    po::options_description desc("set-active options");
    desc.add_options()
        ("help,h", "Show options")
        ("task", po::value<std::string>()->required(), "Slug or id")
        ("active", po::value<bool>()->required(), "1 to accept submissions, 0 to stop");
    auto vm = ParseCommandArgs(desc, args);
    if (PrintHelpIfAsked(vm, desc)) return 0;

    domain::Task task = m_services.taskService->findTask(vm["task"].as<std::string>());
    m_services.taskService->setActive(task.id, vm["active"].as<bool>());
    std::cout << task.slug << (vm["active"].as<bool>() ? " active" : " inactive") << std::endl;
    return 0;
}

int CollectorApp::cmdDeleteTask(const std::vector<std::string>& args) {
    po::options_description desc("delete-task options");
    desc.add_options()
        ("help,h", "Show options")
        ("task", po::value<std::string>()->required(), "Slug or id");
    auto vm = ParseCommandArgs(desc, args);
    if (PrintHelpIfAsked(vm, desc)) return 0;

    domain::Task task = m_services.taskService->findTask(vm["task"].as<std::string>());
    if (!m_services.taskService->deleteTask(task.id)) {
        std::cerr << "Task " << task.slug << " was not deleted" << std::endl;
        return 1;
    }
    std::cout << "Deleted " << task.slug << " (files under " << task.collectionPath << " are kept)" << std::endl;
    return 0;
}

int CollectorApp::cmdSubmit(const std::vector<std::string>& args) {
    po::options_description desc("submit options");
    desc.add_options()
        ("help,h", "Show options")
        ("task", po::value<std::string>()->required(), "Slug or id")
        ("name", po::value<std::string>()->required(), "Submitter name")
        ("contact", po::value<std::string>()->required(), "Submitter contact")
        ("department", po::value<std::string>()->required(), "Submitter department")
        ("file", po::value<std::string>()->required(), "Spreadsheet, or JSON record for form tasks")
        ("original-name", po::value<std::string>(), "Filename on the submitter's side")
        ("attachment", po::value<std::vector<std::string>>()->composing(), "Extra file (repeatable)")
        ("client", po::value<std::string>()->default_value("local"), "Client address recorded with the submission");
    auto vm = ParseCommandArgs(desc, args);
    if (PrintHelpIfAsked(vm, desc)) return 0;

    domain::Task task = m_services.taskService->findTask(vm["task"].as<std::string>());
    std::string file = vm["file"].as<std::string>();

    domain::Submission submission;
    if (task.taskType == domain::TaskType::DataCollection) {
        application::SubmissionService::DataSubmission request;
        request.submitterName = vm["name"].as<std::string>();
        request.contact = vm["contact"].as<std::string>();
        request.department = vm["department"].as<std::string>();
        request.clientAddress = vm["client"].as<std::string>();
        request.record = infrastructure::JsonRecordReader::LoadRecord(file);
        submission = m_services.submissionService->submitData(task, request);
    } else {
        application::SubmissionService::FileSubmission request;
        request.submitterName = vm["name"].as<std::string>();
        request.contact = vm["contact"].as<std::string>();
        request.department = vm["department"].as<std::string>();
        request.sourcePath = file;
        request.originalFilename = vm.count("original-name") ? vm["original-name"].as<std::string>()
                                                             : fs::path(file).filename().string();
        request.clientAddress = vm["client"].as<std::string>();
        if (vm.count("attachment")) request.attachmentPaths = vm["attachment"].as<std::vector<std::string>>();
        submission = m_services.submissionService->submitFile(task, request);
    }

    std::cout << "#" << submission.id << " " << submission.storedFilename << std::endl;
    for (const auto& attachment : submission.attachments) {
        std::cout << "    + " << attachment << std::endl;
    }
    return 0;
}

int CollectorApp::cmdSubmissions(const std::vector<std::string>& args) {
    po::options_description desc("submissions options");
    desc.add_options()
        ("help,h", "Show options")
        ("task", po::value<std::string>()->required(), "Slug or id");
    auto vm = ParseCommandArgs(desc, args);
    if (PrintHelpIfAsked(vm, desc)) return 0;

    domain::Task task = m_services.taskService->findTask(vm["task"].as<std::string>());
    auto submissions = m_services.taskRepository->getSubmissionsByTaskId(task.id);
    std::cout << task.title << ": " << submissions.size() << " submission(s)" << std::endl;
    for (const auto& s : submissions) {
        std::cout << std::setw(6) << s.id << "  "
                  << infrastructure::FilenameVersioner::FormatTimestamp(s.timestamp) << "  "
                  << s.submitterName << " / " << s.contact << " / " << s.department << "  "
                  << s.storedFilename;
        if (!s.attachments.empty()) std::cout << "  (+" << s.attachments.size() << ")";
        std::cout << std::endl;
    }
    return 0;
}

int CollectorApp::cmdDeleteSubmission(const std::vector<std::string>& args) {
    po::options_description desc("delete-submission options");
    desc.add_options()
        ("help,h", "Show options")
        ("id", po::value<long long>()->required(), "Submission id");
    auto vm = ParseCommandArgs(desc, args);
    if (PrintHelpIfAsked(vm, desc)) return 0;

    long long id = vm["id"].as<long long>();
    if (!m_services.ingestionGate->deleteSubmission(id)) {
        std::cerr << "Submission #" << id << " not found" << std::endl;
        return 1;
    }
    std::cout << "Deleted submission #" << id << std::endl;
    return 0;
}

int CollectorApp::cmdClearSubmissions(const std::vector<std::string>& args) {
    po::options_description desc("clear-submissions options");
    desc.add_options()
        ("help,h", "Show options")
        ("task", po::value<std::string>()->required(), "Slug or id");
    auto vm = ParseCommandArgs(desc, args);
    if (PrintHelpIfAsked(vm, desc)) return 0;

    domain::Task task = m_services.taskService->findTask(vm["task"].as<std::string>());
    int removed = m_services.ingestionGate->clearSubmissions(task.id);
    std::cout << "Removed " << removed << " submission record(s) of " << task.slug << std::endl;
    return 0;
}

int CollectorApp::cmdResetCount(const std::vector<std::string>& args) {
    po::options_description desc("reset-count options");
    desc.add_options()
        ("help,h", "Show options")
        ("task", po::value<std::string>()->required(), "Slug or id")
        ("count", po::value<int>()->required(), "New counter value");
    auto vm = ParseCommandArgs(desc, args);
    if (PrintHelpIfAsked(vm, desc)) return 0;

    domain::Task task = m_services.taskService->findTask(vm["task"].as<std::string>());
    if (!m_services.ingestionGate->resetCount(task.id, vm["count"].as<int>())) {
        std::cerr << "Counter of " << task.slug << " was not updated" << std::endl;
        return 1;
    }
    std::cout << task.slug << " count = " << vm["count"].as<int>() << std::endl;
    return 0;
}

int CollectorApp::cmdSelectLatest(const std::vector<std::string>& args) {
    po::options_description desc("select-latest options");
    desc.add_options()
        ("help,h", "Show options")
        ("task", po::value<std::string>(), "Slug or id; uses the task's collection folder")
        ("folder", po::value<std::string>(), "Folder to scan")
        ("ext", po::value<std::string>()->default_value(".csv"), "Extension of the candidate files");
    auto vm = ParseCommandArgs(desc, args);
    if (PrintHelpIfAsked(vm, desc)) return 0;

    std::string folder;
    if (vm.count("folder")) {
        folder = vm["folder"].as<std::string>();
    } else if (vm.count("task")) {
        folder = m_services.taskService->findTask(vm["task"].as<std::string>()).collectionPath;
    } else {
        throw domain::InvalidArgumentError("select-latest needs --task or --folder");
    }

    infrastructure::LatestVersionSelector selector;
    infrastructure::Selection selection = selector.selectLatest(folder, vm["ext"].as<std::string>());
    for (const auto& file : selection.files) {
        std::cout << file.filename().string() << std::endl;
    }
    std::cout << "总文件: " << selection.report.totalFiles
              << ", 最新版本: " << selection.report.selectedFiles
              << ", 旧版本: " << selection.report.excludedFiles << std::endl;
    return 0;
}

int CollectorApp::cmdMerge(const std::vector<std::string>& args) {
    po::options_description desc("merge options");
    desc.add_options()
        ("help,h", "Show options")
        ("task", po::value<std::string>(), "Slug or id; supplies folder, template and default output")
        ("folder", po::value<std::string>(), "Source folder (overrides the task's)")
        ("output", po::value<std::string>(), "Output file")
        ("template", po::value<std::string>(), "Template giving the canonical headers")
        ("dedup", po::value<std::vector<std::string>>()->composing(), "Dedup key column (repeatable)")
        ("separator", po::value<std::string>()->default_value(m_config.defaultSeparator), "Dedup key separator")
        ("header-row", po::value<int>()->default_value(m_config.defaultHeaderRowIndex), "Header row index");
    auto vm = ParseCommandArgs(desc, args);
    if (PrintHelpIfAsked(vm, desc)) return 0;

    std::string folder;
    std::string output;
    std::optional<std::string> templatePath;

    if (vm.count("task")) {
        domain::Task task = m_services.taskService->findTask(vm["task"].as<std::string>());
        folder = task.collectionPath;
        output = DefaultReportPath(task, "-汇总" + m_services.tableStore->extension());
        if (!task.templatePath.empty()) templatePath = task.templatePath;
    }
    if (vm.count("folder")) folder = vm["folder"].as<std::string>();
    if (vm.count("output")) output = vm["output"].as<std::string>();
    if (vm.count("template")) templatePath = vm["template"].as<std::string>();

    if (folder.empty() || output.empty()) {
        throw domain::InvalidArgumentError("merge needs --task, or --folder together with --output");
    }

    std::vector<std::string> dedupColumns;
    if (vm.count("dedup")) dedupColumns = vm["dedup"].as<std::vector<std::string>>();

    domain::MergeResult result = m_services.mergeEngine->mergeLatest(
        folder, output, !dedupColumns.empty(), dedupColumns,
        vm["separator"].as<std::string>(), templatePath, vm["header-row"].as<int>());
    PrintResult(result);
    return result.isSuccess ? 0 : 1;
}

int CollectorApp::cmdMergeStats(const std::vector<std::string>& args) {
    po::options_description desc("merge-stats options");
    desc.add_options()
        ("help,h", "Show options")
        ("task", po::value<std::string>(), "Slug or id; supplies schema, folder and default output")
        ("schema", po::value<std::string>(), "JSON schema file")
        ("folder", po::value<std::string>(), "Folder holding the JSON submissions")
        ("output", po::value<std::string>(), "Output file")
        ("override", po::value<std::vector<std::string>>()->composing(),
         "name=Mode[,Type[,GroupField]] (repeatable)");
    auto vm = ParseCommandArgs(desc, args);
    if (PrintHelpIfAsked(vm, desc)) return 0;

    std::string schema;
    std::string folder;
    std::string output;

    if (vm.count("task")) {
        domain::Task task = m_services.taskService->findTask(vm["task"].as<std::string>());
        schema = task.templatePath;
        folder = task.collectionPath;
        output = DefaultReportPath(task, "-统计" + m_services.tableStore->extension());
    }
    if (vm.count("schema")) schema = vm["schema"].as<std::string>();
    if (vm.count("folder")) folder = vm["folder"].as<std::string>();
    if (vm.count("output")) output = vm["output"].as<std::string>();

    if (schema.empty() || folder.empty() || output.empty()) {
        throw domain::InvalidArgumentError("merge-stats needs --task, or --schema, --folder and --output");
    }

    std::map<std::string, domain::ColumnDefinition> overrides;
    if (vm.count("override")) {
        for (const auto& text : vm["override"].as<std::vector<std::string>>()) {
            overrides.insert(ParseOverride(text));
        }
    }

    domain::MergeResult result = m_services.mergeEngine->mergeStatistics(schema, folder, output, overrides);
    PrintResult(result);
    return result.isSuccess ? 0 : 1;
}

} // namespace lancollect::app
