#include <cassert>
#include <deque>
#include <filesystem>
#include <iostream>
#include <memory>
#include <set>
#include "application/TaskService.hpp"
#include "domain/DomainErrors.hpp"
#include "infrastructure/SlugGenerator.hpp"
#include "infrastructure/SqliteTaskRepository.hpp"

namespace fs = std::filesystem;
using namespace lancollect;

namespace {

// Hands out scripted slugs, then falls back to random ones.
class ScriptedSlugGenerator : public infrastructure::SlugGenerator {
public:
    std::string generateSlug() override {
        ++calls;
        if (script.empty()) return infrastructure::SlugGenerator::generateSlug();
        std::string slug = script.front();
        script.pop_front();
        return slug;
    }

    std::deque<std::string> script;
    int calls = 0;
};

void TestSlugShape() {
    std::cout << "[Test] Random slugs use the unambiguous alphabet..." << std::endl;
    infrastructure::SlugGenerator generator;
    const std::string alphabet = infrastructure::SlugGenerator::kAlphabet;
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        std::string slug = generator.generateSlug();
        assert(slug.size() == static_cast<size_t>(infrastructure::SlugGenerator::kSlugLength));
        for (char c : slug) assert(alphabet.find(c) != std::string::npos);
        seen.insert(slug);
    }
    assert(seen.size() == 200);

    std::string id = generator.generateTaskId();
    assert(id.size() == 36);
    assert(id[8] == '-' && id[13] == '-' && id[14] == '4' && id[18] == '-' && id[23] == '-');
    assert(id != generator.generateTaskId());
    std::cout << "[PASS] Slug shape" << std::endl;
}

void TestRetryOnCollision(const fs::path& root) {
    std::cout << "[Test] Slug collisions are retried with fresh slugs..." << std::endl;
    auto repo = std::make_shared<infrastructure::SqliteTaskRepository>((root / "tasks.db").string(), 10000);
    auto slugs = std::make_shared<ScriptedSlugGenerator>();
    application::TaskService service(repo, slugs, (root / "collections").string());

    application::TaskService::TaskRequest request;
    request.title = "年度报名";
    request.maxLimit = 10;

    slugs->script = {"TAKENSLUG23456"};
    domain::Task first = service.createTask(request);
    assert(first.slug == "TAKENSLUG23456");
    assert(fs::is_directory(first.collectionPath));
    assert(fs::path(first.collectionPath).filename() == "文件收集");

    slugs->calls = 0;
    slugs->script = {"TAKENSLUG23456", "TAKENSLUG23456", "FRESHSLUG23456"};
    domain::Task second = service.createTask(request);
    assert(slugs->calls == 3);
    assert(second.slug == "FRESHSLUG23456");
    assert(second.id != first.id);
    assert(second.currentCount == 0);
    assert(repo->getAllTasks().size() == 2);

    slugs->calls = 0;
    slugs->script = std::deque<std::string>(application::TaskService::kMaxSlugAttempts, "TAKENSLUG23456");
    bool conflicted = false;
    try {
        service.createTask(request);
    } catch (const domain::SlugConflictError&) {
        conflicted = true;
    }
    assert(conflicted);
    assert(slugs->calls == application::TaskService::kMaxSlugAttempts);
    assert(repo->getAllTasks().size() == 2);

    // The store is still usable after the failed statements.
    domain::Task third = service.createTask(request);
    assert(repo->getTaskBySlug(third.slug).has_value());
    std::cout << "[PASS] Slug retry" << std::endl;
}

void TestCopyAndLookup(const fs::path& root) {
    std::cout << "[Test] Copying a task resets its counter..." << std::endl;
    auto repo = std::make_shared<infrastructure::SqliteTaskRepository>((root / "copy.db").string(), 10000);
    application::TaskService service(repo, std::make_shared<infrastructure::SlugGenerator>(),
                                     (root / "collections").string());

    application::TaskService::TaskRequest request;
    request.title = "问卷/第一期";
    request.taskType = domain::TaskType::DataCollection;
    request.versioningMode = domain::VersioningMode::Overwrite;
    request.maxLimit = 3;
    request.templatePath = "/templates/问卷.json";
    domain::Task source = service.createTask(request);
    assert(fs::path(source.collectionPath).filename() == "在线填表");
    assert(source.collectionPath.find("问卷_第一期") != std::string::npos);

    assert(repo->updateCurrentCount(source.id, 2));
    domain::Task copy = service.copyTask(source.id);
    assert(copy.title == "问卷/第一期 (副本)");
    assert(copy.id != source.id && copy.slug != source.slug);
    assert(copy.currentCount == 0);
    assert(copy.maxLimit == 3);
    assert(copy.taskType == domain::TaskType::DataCollection);
    assert(copy.versioningMode == domain::VersioningMode::Overwrite);
    assert(copy.templatePath == source.templatePath);

    domain::Task named = service.copyTask(source.id, std::string("第二期"));
    assert(named.title == "第二期");

    assert(service.findTask(source.slug).id == source.id);
    assert(service.findTask(source.id).slug == source.slug);
    bool missing = false;
    try {
        service.findTask("NOPE");
    } catch (const domain::TaskNotFoundError&) {
        missing = true;
    }
    assert(missing);

    service.setActive(source.id, false);
    assert(!repo->getTaskById(source.id)->isActive);
    assert(repo->getTaskById(source.id)->currentCount == 2);

    assert(service.deleteTask(named.id));
    assert(!repo->getTaskById(named.id).has_value());

    bool rejected = false;
    try {
        request.title = "   ";
        service.createTask(request);
    } catch (const domain::InvalidArgumentError&) {
        rejected = true;
    }
    assert(rejected);
    std::cout << "[PASS] Copy and lookup" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting TaskService tests..." << std::endl;
    fs::path root = fs::temp_directory_path() / "lancollect_task_service";
    fs::remove_all(root);
    TestSlugShape();
    TestRetryOnCollision(root);
    TestCopyAndLookup(root);
    fs::remove_all(root);
    std::cout << "[Test] All TaskService tests passed." << std::endl;
    return 0;
}
