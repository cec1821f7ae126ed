#include <atomic>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>
#include "application/IngestionGate.hpp"
#include "domain/DomainErrors.hpp"
#include "infrastructure/SqliteTaskRepository.hpp"

namespace fs = std::filesystem;
using namespace lancollect;

namespace {

domain::Task MakeTask(const std::string& id, const std::string& slug, int maxLimit) {
    domain::Task task;
    task.id = id;
    task.slug = slug;
    task.title = "Quota " + slug;
    task.maxLimit = maxLimit;
    task.collectionPath = (fs::temp_directory_path() / slug).string();
    task.createdAt = std::chrono::system_clock::now();
    return task;
}

domain::SubmissionData Data(int i) {
    domain::SubmissionData data;
    data.submitterName = "user" + std::to_string(i);
    data.contact = std::to_string(13800000000LL + i);
    data.department = "研发部";
    data.originalFilename = "form.xlsx";
    data.storedFilename = "form-user" + std::to_string(i) + ".xlsx";
    data.clientAddress = "127.0.0.1";
    return data;
}

void TestCapacityUnderContention(const std::shared_ptr<domain::TaskRepository>& repo) {
    std::cout << "[Test] 20 concurrent submitters against capacity 5..." << std::endl;
    const int capacity = 5;
    const int attempts = 20;
    assert(repo->tryCreateTask(MakeTask("task-limited", "LIMITEDTASK234", capacity)));

    application::IngestionGate gate(repo);
    std::atomic<int> accepted{0};
    std::atomic<int> refused{0};
    std::atomic<int> other{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < attempts; ++i) {
        threads.emplace_back([&gate, &accepted, &refused, &other, i]() {
            try {
                gate.recordSubmission("task-limited", Data(i));
                accepted++;
            } catch (const domain::CapacityExceededError&) {
                refused++;
            } catch (const std::exception& e) {
                std::cerr << "[Test] Unexpected: " << e.what() << std::endl;
                other++;
            }
        });
    }
    for (auto& t : threads) t.join();

    std::cout << "[Test] accepted=" << accepted << " refused=" << refused << std::endl;
    assert(other == 0);
    assert(accepted == capacity);
    assert(refused == attempts - capacity);

    auto task = repo->getTaskById("task-limited");
    assert(task.has_value());
    assert(task->currentCount == capacity);
    assert(task->isFull());
    assert(repo->getSubmissionsByTaskId("task-limited").size() == static_cast<size_t>(capacity));
    std::cout << "[PASS] Exactly K accepted" << std::endl;
}

void TestBookkeeping(const std::shared_ptr<domain::TaskRepository>& repo) {
    std::cout << "[Test] Delete, clear and reset keep the counter honest..." << std::endl;
    application::IngestionGate gate(repo);

    auto submissions = repo->getSubmissionsByTaskId("task-limited");
    assert(!submissions.empty());
    assert(gate.deleteSubmission(submissions.front().id));
    assert(!gate.deleteSubmission(submissions.front().id));
    assert(repo->getTaskById("task-limited")->currentCount == 4);

    // The freed slot can be taken again, but only once.
    gate.recordSubmission("task-limited", Data(100));
    bool refused = false;
    try {
        gate.recordSubmission("task-limited", Data(101));
    } catch (const domain::CapacityExceededError&) {
        refused = true;
    }
    assert(refused);
    assert(repo->getTaskById("task-limited")->currentCount == 5);

    int cleared = gate.clearSubmissions("task-limited");
    assert(cleared == 5);
    assert(repo->getTaskById("task-limited")->currentCount == 0);
    assert(repo->getSubmissionsByTaskId("task-limited").empty());

    assert(gate.resetCount("task-limited", 3));
    assert(repo->getTaskById("task-limited")->currentCount == 3);
    bool rejected = false;
    try {
        gate.resetCount("task-limited", -1);
    } catch (const domain::InvalidArgumentError&) {
        rejected = true;
    }
    assert(rejected);
    assert(repo->getTaskById("task-limited")->currentCount == 3);

    bool missing = false;
    try {
        gate.recordSubmission("no-such-task", Data(1));
    } catch (const domain::TaskNotFoundError&) {
        missing = true;
    }
    assert(missing);
    std::cout << "[PASS] Bookkeeping" << std::endl;
}

void TestUnlimited(const std::shared_ptr<domain::TaskRepository>& repo) {
    std::cout << "[Test] Capacity 0 accepts everyone..." << std::endl;
    assert(repo->tryCreateTask(MakeTask("task-open", "OPENTASK234567", 0)));
    application::IngestionGate gate(repo);

    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&gate, i]() { gate.recordSubmission("task-open", Data(i)); });
    }
    for (auto& t : threads) t.join();

    assert(repo->getTaskById("task-open")->currentCount == 12);
    assert(!repo->getTaskById("task-open")->isFull());
    std::cout << "[PASS] Unlimited" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting IngestionGate concurrency tests..." << std::endl;
    fs::path dir = fs::temp_directory_path() / "lancollect_gate_test";
    fs::remove_all(dir);

    auto repo = std::make_shared<infrastructure::SqliteTaskRepository>((dir / "gate.db").string(), 10000);
    TestCapacityUnderContention(repo);
    TestBookkeeping(repo);
    TestUnlimited(repo);

    fs::remove_all(dir);
    std::cout << "[Test] All IngestionGate tests passed." << std::endl;
    return 0;
}
