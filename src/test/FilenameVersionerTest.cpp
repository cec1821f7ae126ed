#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include "domain/DomainErrors.hpp"
#include "infrastructure/FileSystemArtifactScanner.hpp"
#include "infrastructure/FilenameVersioner.hpp"

namespace fs = std::filesystem;
using lancollect::infrastructure::FilenameVersioner;

namespace {

void Touch(const fs::path& path) {
    std::ofstream out(path);
    out << "x";
}

fs::path FreshDir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void TestNextVersionAfterFive() {
    std::cout << "[Test] Next version after v1..v5..." << std::endl;
    fs::path dir = FreshDir("lancollect_versioner_next");
    for (int v = 1; v <= 5; ++v) {
        Touch(dir / ("报名表-张三-13800000000_v" + std::to_string(v) + "-20240101-12000" + std::to_string(v) + ".csv"));
    }
    Touch(dir / "报名表-张三-13800000000_vX.csv");      // not a version
    Touch(dir / "报名表-李四-13900000000_v9.csv");      // other submitter

    assert(FilenameVersioner::NextVersion(dir, "报名表-张三-13800000000", ".csv") == 6);
    assert(FilenameVersioner::NextVersion(dir, "报名表-张三-13800000000", ".CSV") == 6);
    assert(FilenameVersioner::NextVersion(dir, "报名表-王五-1", ".csv") == 1);
    assert(FilenameVersioner::NextVersion(dir / "missing", "a", ".csv") == 1);
    fs::remove_all(dir);
    std::cout << "[PASS] NextVersion" << std::endl;
}

void TestParseVersion() {
    std::cout << "[Test] ParseVersion grammar..." << std::endl;
    assert(FilenameVersioner::ParseVersion("a-b-c_v3", "a-b-c") == 3);
    assert(FilenameVersioner::ParseVersion("a-b-c_v12-20240102-030405", "a-b-c") == 12);
    assert(!FilenameVersioner::ParseVersion("a-b-c_v0", "a-b-c"));
    assert(!FilenameVersioner::ParseVersion("a-b-c_v3x", "a-b-c"));
    assert(!FilenameVersioner::ParseVersion("a-b-cd_v3", "a-b-c"));
    // Regex metacharacters in the prefix are literal.
    assert(FilenameVersioner::ParseVersion("a.(b)_v2", "a.(b)") == 2);
    assert(!FilenameVersioner::ParseVersion("aX(b)_v2", "a.(b)"));
    std::cout << "[PASS] ParseVersion" << std::endl;
}

void TestOverwriteDeletesWiderMatch() {
    std::cout << "[Test] Overwrite removes every file starting with the prefix..." << std::endl;
    fs::path dir = FreshDir("lancollect_versioner_overwrite");
    Touch(dir / "t-张三-1_v1-20240101-120000.csv");
    Touch(dir / "t-张三-1_v2-20240101-120001.csv");
    Touch(dir / "t-张三-1 copy.csv");                // no _v but same prefix
    Touch(dir / "t-张三-1_v1-20240101-120000.json"); // other extension
    Touch(dir / "t-李四-2_v1-20240101-120000.csv");

    // The AutoVersion listing only considers "<prefix>_v" names.
    assert(FilenameVersioner::NextVersion(dir, "t-张三-1", ".csv") == 3);

    int removed = FilenameVersioner::DeleteForOverwrite(dir, "t-张三-1", ".csv");
    assert(removed == 3);
    assert(fs::exists(dir / "t-张三-1_v1-20240101-120000.json"));
    assert(fs::exists(dir / "t-李四-2_v1-20240101-120000.csv"));
    assert(FilenameVersioner::NextVersion(dir, "t-张三-1", ".csv") == 1);
    fs::remove_all(dir);
    std::cout << "[PASS] DeleteForOverwrite" << std::endl;
}

void TestOverwriteKeepsNamedFile() {
    std::cout << "[Test] Overwrite spares the file being committed..." << std::endl;
    fs::path dir = FreshDir("lancollect_versioner_keep");
    Touch(dir / "t-张三-1_v1-20240101-120000.csv");
    Touch(dir / "t-张三-1_v1-20240102-090000.csv");

    int removed = FilenameVersioner::DeleteForOverwrite(dir, "t-张三-1", ".csv",
                                                       dir / "t-张三-1_v1-20240102-090000.csv");
    assert(removed == 1);
    assert(!fs::exists(dir / "t-张三-1_v1-20240101-120000.csv"));
    assert(fs::exists(dir / "t-张三-1_v1-20240102-090000.csv"));
    fs::remove_all(dir);
    std::cout << "[PASS] Overwrite keep" << std::endl;
}

void TestUnlistableFolder() {
    std::cout << "[Test] A folder that cannot be listed raises IoFailureError..." << std::endl;
    fs::path dir = FreshDir("lancollect_versioner_locked");
    Touch(dir / "t-张三-1_v1-20240101-120000.csv");
    fs::permissions(dir, fs::perms::none);

    std::error_code ec;
    fs::directory_iterator listing(dir, ec);
    if (!ec) {
        // Running with privileges that bypass directory permissions.
        fs::permissions(dir, fs::perms::owner_all);
        fs::remove_all(dir);
        std::cout << "[SKIP] Permissions not enforced for this user" << std::endl;
        return;
    }

    int raised = 0;
    try {
        FilenameVersioner::NextVersion(dir, "t-张三-1", ".csv");
    } catch (const lancollect::domain::IoFailureError& e) {
        assert(std::string(e.what()).find(dir.string()) != std::string::npos);
        ++raised;
    }
    try {
        FilenameVersioner::DeleteForOverwrite(dir, "t-张三-1", ".csv");
    } catch (const lancollect::domain::IoFailureError&) {
        ++raised;
    }
    try {
        lancollect::infrastructure::FileSystemArtifactScanner(dir.string()).scan(".csv");
    } catch (const lancollect::domain::IoFailureError&) {
        ++raised;
    }
    assert(raised == 3);

    fs::permissions(dir, fs::perms::owner_all);
    fs::remove_all(dir);
    std::cout << "[PASS] Unlistable folder" << std::endl;
}

void TestSubmissionNameRoundTrip() {
    std::cout << "[Test] Submission names decode back into identity and version..." << std::endl;
    auto when = FilenameVersioner::ParseTimestamp("20240315", "081530");
    assert(when.has_value());

    std::string name = FilenameVersioner::BuildSubmissionName("报名表-张三-13800000000", 4, *when, ".xlsx");
    assert(name == "报名表-张三-13800000000_v4-20240315-081530.xlsx");

    auto artifact = FilenameVersioner::ParseSubmissionName(fs::path("/data") / name);
    assert(artifact.has_value());
    assert(artifact->parsed);
    assert(artifact->templateName == "报名表");
    assert(artifact->submitterName == "张三");
    assert(artifact->contact == "13800000000");
    assert(artifact->version == 4);
    assert(artifact->timestamp == *when);
    assert(artifact->identityKey() == "张三|13800000000");

    assert(!FilenameVersioner::ParseSubmissionName("张三_v4-20240315-081530.xlsx"));
    assert(!FilenameVersioner::ParseSubmissionName("a-b-c_v4.xlsx"));
    assert(FilenameVersioner::BuildArtifactName("证明", 2, ".pdf") == "证明_v2.pdf");
    std::cout << "[PASS] Submission names" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting FilenameVersioner tests..." << std::endl;
    TestNextVersionAfterFive();
    TestParseVersion();
    TestOverwriteDeletesWiderMatch();
    TestOverwriteKeepsNamedFile();
    TestUnlistableFolder();
    TestSubmissionNameRoundTrip();
    std::cout << "[Test] All FilenameVersioner tests passed." << std::endl;
    return 0;
}
