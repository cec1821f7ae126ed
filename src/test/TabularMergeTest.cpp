#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include "application/MergeEngine.hpp"
#include "domain/DomainErrors.hpp"
#include "infrastructure/CsvTableStore.hpp"

namespace fs = std::filesystem;
using namespace lancollect;
using domain::MergeErrorKind;

namespace {

// Reads like the CSV store but cannot write.
class ReadOnlyTableStore : public infrastructure::CsvTableStore {
public:
    void writeRows(const std::string& path, const domain::Table&) override {
        throw domain::IoFailureError(path, "disk full");
    }
};

void Write(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string Slurp(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

fs::path SetupFolder(const fs::path& root) {
    fs::remove_all(root);
    fs::path source = root / "submissions";
    fs::create_directories(source);

    // Submitter A: v2 supersedes v1
    Write(source / "报名表-A-1_v1-20240101-100000.csv", "姓名,电话,部门\n张三,138,研发\n李四,139,市场\n");
    Write(source / "报名表-A-1_v2-20240101-110000.csv", "姓名,电话,部门\r\n张三,138,研发\r\n王五,137,研发\r\n");
    // Submitter B: other column order, one nameless row, one blank row
    Write(source / "报名表-B-2_v1-20240101-100000.csv", "\xEF\xBB\xBF电话,姓名\n138,张三\n136,赵六\n135,\n,\n");
    return source;
}

void TestDedupSingleColumn(const fs::path& root) {
    std::cout << "[Test] Dedup on one column counts collisions and blank keys..." << std::endl;
    fs::path source = SetupFolder(root);
    application::MergeEngine engine(std::make_shared<infrastructure::CsvTableStore>());

    auto result = engine.mergeLatest(source.string(), (root / "merged.csv").string(), true, {"姓名"});
    std::cout << "[Test] " << result.summary() << std::endl;
    assert(result.isSuccess);
    assert(result.errorKind == MergeErrorKind::None);
    assert(result.totalFiles == 3);
    assert(result.filteredFiles == 1);
    assert(result.mergedFiles == 2);
    assert(result.totalRecords == 5);
    assert(result.deduplicatedRecords == 3);
    assert(result.duplicatedCount == 2);

    infrastructure::CsvTableStore store;
    auto merged = store.readRows((root / "merged.csv").string(), 0);
    assert((merged.headers == std::vector<std::string>{"姓名", "电话", "部门"}));
    assert(merged.rows.size() == 3);
    assert(domain::FieldToString(merged.rows[0][0]) == "张三");
    assert(domain::FieldToString(merged.rows[1][0]) == "王五");
    assert(domain::FieldToString(merged.rows[2][0]) == "赵六");
    assert(domain::FieldToString(merged.rows[2][1]) == "136");
    assert(domain::IsNull(merged.rows[2][2]));
    std::cout << "[PASS] Single-column dedup" << std::endl;
}

void TestDedupCompositeKey(const fs::path& root) {
    std::cout << "[Test] Composite keys match columns case-insensitively..." << std::endl;
    fs::path source = SetupFolder(root);
    application::MergeEngine engine(std::make_shared<infrastructure::CsvTableStore>());

    // "|135" is not blank, so the nameless row survives.
    auto result = engine.mergeLatest(source.string(), (root / "merged.csv").string(), true, {"姓名", "电话"}, "|");
    assert(result.isSuccess);
    assert(result.totalRecords == 5);
    assert(result.deduplicatedRecords == 4);
    assert(result.duplicatedCount == 1);
    std::cout << "[PASS] Composite dedup" << std::endl;
}

void TestKeyWidthIgnoresMissingColumns(const fs::path& root) {
    std::cout << "[Test] A dedup column absent from one file still matches blank cells..." << std::endl;
    fs::remove_all(root);
    fs::path source = root / "submissions";
    fs::create_directories(source);
    Write(source / "报名表-A-1_v1-20240101-100000.csv", "Name,Phone\nAlice,\n");
    Write(source / "报名表-B-2_v1-20240101-100000.csv", "Name\nAlice\n");
    application::MergeEngine engine(std::make_shared<infrastructure::CsvTableStore>());

    auto result = engine.mergeLatest(source.string(), (root / "merged.csv").string(), true, {"Name", "Phone"}, "|");
    assert(result.isSuccess);
    assert(result.totalRecords == 2);
    assert(result.deduplicatedRecords == 1);
    assert(result.duplicatedCount == 1);

    // Requested order, not header order.
    Write(source / "报名表-C-3_v1-20240101-100000.csv", "Phone,Name\n,Bob\n");
    Write(source / "报名表-D-4_v1-20240101-100000.csv", "Name,Phone\nBob,\n");
    result = engine.mergeLatest(source.string(), (root / "merged.csv").string(), true, {"phone", "name"}, "|");
    assert(result.isSuccess);
    assert(result.totalRecords == 4);
    assert(result.deduplicatedRecords == 2);
    std::cout << "[PASS] Fixed key width" << std::endl;
}

void TestFallbackWithoutDedupColumns(const fs::path& root) {
    std::cout << "[Test] Unknown dedup columns fall back to plain concatenation..." << std::endl;
    fs::path source = SetupFolder(root);
    application::MergeEngine engine(std::make_shared<infrastructure::CsvTableStore>());

    auto result = engine.mergeLatest(source.string(), (root / "merged.csv").string(), true, {"工号"});
    assert(result.isSuccess);
    assert(result.totalRecords == 5);
    assert(result.deduplicatedRecords == 5);
    assert(result.duplicatedCount == 0);

    result = engine.mergeLatest(source.string(), (root / "merged.csv").string(), false, {"姓名"});
    assert(result.isSuccess);
    assert(result.deduplicatedRecords == 5);
    std::cout << "[PASS] Fallback" << std::endl;
}

void TestTemplateHeaders(const fs::path& root) {
    std::cout << "[Test] Template headers define the output columns..." << std::endl;
    fs::path source = SetupFolder(root);
    Write(root / "模板.csv", "部门,姓名\n");
    application::MergeEngine engine(std::make_shared<infrastructure::CsvTableStore>());

    auto result = engine.mergeLatest(source.string(), (root / "merged.csv").string(), false, {}, "|",
                                     (root / "模板.csv").string());
    assert(result.isSuccess);

    infrastructure::CsvTableStore store;
    auto merged = store.readRows((root / "merged.csv").string(), 0);
    assert((merged.headers == std::vector<std::string>{"部门", "姓名"}));
    assert(merged.rows.size() == 5);
    assert(domain::FieldToString(merged.rows[0][0]) == "研发");
    assert(domain::IsNull(merged.rows[2][0]));

    result = engine.mergeLatest(source.string(), (root / "merged.csv").string(), false, {}, "|",
                                (root / "missing.csv").string());
    assert(!result.isSuccess);
    assert(result.errorKind == MergeErrorKind::SourceMissing);
    std::cout << "[PASS] Template headers" << std::endl;
}

void TestFailedWriteKeepsOldOutput(const fs::path& root) {
    std::cout << "[Test] A failed write leaves the previous output untouched..." << std::endl;
    fs::path source = SetupFolder(root);
    fs::path output = root / "merged.csv";
    Write(output, "previous report");

    application::MergeEngine engine(std::make_shared<ReadOnlyTableStore>());
    auto result = engine.mergeLatest(source.string(), output.string(), true, {"姓名"});
    assert(!result.isSuccess);
    assert(result.errorKind == MergeErrorKind::IoFailure);
    assert(Slurp(output) == "previous report");

    for (const auto& entry : fs::directory_iterator(root)) {
        assert(entry.path().extension() != ".tmp");
    }
    std::cout << "[PASS] Failure atomicity" << std::endl;
}

void TestMissingSource(const fs::path& root) {
    std::cout << "[Test] Missing source folder..." << std::endl;
    fs::remove_all(root);
    fs::create_directories(root);
    application::MergeEngine engine(std::make_shared<infrastructure::CsvTableStore>());

    auto result = engine.mergeLatest((root / "nowhere").string(), (root / "merged.csv").string(), false, {});
    assert(!result.isSuccess);
    assert(result.errorKind == MergeErrorKind::SourceMissing);
    assert(!fs::exists(root / "merged.csv"));
    assert(result.summary().find("合并失败") == 0);
    std::cout << "[PASS] Missing source" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting tabular merge tests..." << std::endl;
    fs::path root = fs::temp_directory_path() / "lancollect_tabular_merge";
    TestDedupSingleColumn(root);
    TestDedupCompositeKey(root);
    TestKeyWidthIgnoresMissingColumns(root);
    TestFallbackWithoutDedupColumns(root);
    TestTemplateHeaders(root);
    TestFailedWriteKeepsOldOutput(root);
    TestMissingSource(root);
    fs::remove_all(root);
    std::cout << "[Test] All tabular merge tests passed." << std::endl;
    return 0;
}
