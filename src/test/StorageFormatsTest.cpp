#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/CsvTableStore.hpp"
#include "infrastructure/PathUtils.hpp"

namespace fs = std::filesystem;
using namespace lancollect::infrastructure;

namespace {

void TestCsvParsing() {
    std::cout << "[Test] CSV quoting, BOM and line endings..." << std::endl;
    auto records = CsvTableStore::ParseRecords("\xEF\xBB\xBF" "a,\"b,c\",\"say \"\"hi\"\"\"\r\n1,\"two\nlines\",3\n", ',');
    assert(records.size() == 2);
    assert(records[0][0] == "a");
    assert(records[0][1] == "b,c");
    assert(records[0][2] == "say \"hi\"");
    assert(records[1][1] == "two\nlines");

    assert(CsvTableStore::EscapeField("plain", ',') == "plain");
    assert(CsvTableStore::EscapeField("a,b", ',') == "\"a,b\"");
    assert(CsvTableStore::EscapeField("q\"", ',') == "\"q\"\"\"");
    std::cout << "[PASS] CSV parsing" << std::endl;
}

void TestCsvHeaderRow(const fs::path& root) {
    std::cout << "[Test] Header row index and blank header cells..." << std::endl;
    fs::path file = root / "report.csv";
    std::ofstream(file) << "活动报名表\n 姓名 ,,电话\n张三,x,138\n\n李四,,\n";

    CsvTableStore store;
    auto headers = store.readHeaders(file.string(), 1);
    assert((headers == std::vector<std::string>{"姓名", "电话"}));
    assert(store.readHeaders(file.string(), 9).empty());

    auto table = store.readRows(file.string(), 1);
    assert(table.rows.size() == 2);
    assert(std::get<std::string>(table.rows[0][1]) == "138");
    assert(lancollect::domain::IsNull(table.rows[1][1]));

    lancollect::domain::Table out;
    out.headers = {"名称", "数量"};
    out.rows.push_back({std::string("a,b"), 2.0});
    store.writeRows((root / "out.csv").string(), out);
    auto back = store.readRows((root / "out.csv").string(), 0);
    assert(back.headers == out.headers);
    assert(std::get<std::string>(back.rows[0][0]) == "a,b");
    assert(std::get<std::string>(back.rows[0][1]) == "2");
    std::cout << "[PASS] Header row" << std::endl;
}

void TestSanitize() {
    std::cout << "[Test] Filename sanitizing..." << std::endl;
    assert(PathUtils::Sanitize("张三") == "张三");
    assert(PathUtils::Sanitize("John Doe") == "JohnDoe");
    assert(PathUtils::Sanitize("a/b") == "a_b");
    assert(PathUtils::Sanitize("a-b_c") == "a-b_c");
    assert(PathUtils::Sanitize("   ") == "Unknown");
    assert(PathUtils::Sanitize("!!!") == "Unknown");
    assert(PathUtils::Sanitize("报名表...") == "报名表_");

    fs::path path = PathUtils::BuildCollectionPath("/srv", "年度 报名", "ABC234", lancollect::domain::TaskType::FileCollection);
    assert(path == fs::path("/srv/年度报名/ABC234/文件收集"));
    std::cout << "[PASS] Sanitize" << std::endl;
}

void TestConfig(const fs::path& root) {
    std::cout << "[Test] Settings load, defaults and save..." << std::endl;
    fs::path config = root / "settings.json";

    AppConfig missing = ConfigLoader::Load((root / "absent.json").string());
    AppConfig defaults = ConfigLoader::Defaults();
    assert(missing.dataRoot == defaults.dataRoot);
    assert(missing.defaultSeparator == "|");

    std::ofstream(config) << R"({"dataRoot": "data", "defaultSeparator": ";", "logLevel": "debug", "busyTimeoutMs": 250})";
    AppConfig loaded = ConfigLoader::Load(config.string());
    assert(fs::path(loaded.dataRoot) == (root / "data").lexically_normal());
    assert(fs::path(loaded.databasePath) == (root / "data" / "lancollect.db").lexically_normal());
    assert(fs::path(loaded.collectionRoot) == (root / "data" / "collections").lexically_normal());
    assert(loaded.defaultSeparator == ";");
    assert(loaded.logLevel == LogLevel::Debug);
    assert(loaded.busyTimeoutMs == 250);

    std::ofstream(config) << "{ not json";
    AppConfig broken = ConfigLoader::Load(config.string());
    assert(broken.defaultSeparator == "|");

    loaded.defaultHeaderRowIndex = 2;
    ConfigLoader::Save(config.string(), loaded);
    AppConfig saved = ConfigLoader::Load(config.string());
    assert(saved.defaultHeaderRowIndex == 2);
    assert(saved.databasePath == loaded.databasePath);
    assert(saved.logLevel == LogLevel::Debug);
    std::cout << "[PASS] Config" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting storage format tests..." << std::endl;
    fs::path root = fs::temp_directory_path() / "lancollect_storage_formats";
    fs::remove_all(root);
    fs::create_directories(root);
    TestCsvParsing();
    TestCsvHeaderRow(root);
    TestSanitize();
    TestConfig(root);
    fs::remove_all(root);
    std::cout << "[Test] All storage format tests passed." << std::endl;
    return 0;
}
