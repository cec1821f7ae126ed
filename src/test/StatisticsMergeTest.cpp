#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include "application/MergeEngine.hpp"
#include "application/StatisticsAggregator.hpp"
#include "infrastructure/CsvTableStore.hpp"
#include "infrastructure/JsonRecordReader.hpp"

namespace fs = std::filesystem;
using namespace lancollect;
using application::StatisticsAggregator;
using domain::MergeErrorKind;

namespace {

void Write(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

const char* kSchema = R"({
  "title": "活动报名",
  "columns": [
    {"name": "所属部门", "type": "Text"},
    {"name": "人数", "type": "Number", "mergeMode": "Accumulate"},
    {"name": "是否参加", "type": "Boolean", "mergeMode": 0},
    {"name": "参加晚宴", "type": "Boolean", "mergeMode": "GroupBy", "groupByField": "所属部门"},
    {"name": "备注", "type": "Text", "mergeMode": 1, "groupByField": "备注"}
  ]
})";

fs::path SetupFolder(const fs::path& root) {
    fs::remove_all(root);
    fs::path folder = root / "在线填表";
    fs::create_directories(folder);
    Write(folder / "schema.json", kSchema);
    Write(folder / "活动报名-A-1_v1-20240101-100000.json",
          R"({"所属部门": "X", "人数": 100, "是否参加": false, "参加晚宴": false, "备注": "old"})");
    Write(folder / "活动报名-A-1_v2-20240101-110000.json",
          R"({"所属部门": "X", "人数": 1, "是否参加": true, "参加晚宴": true, "备注": "a", "额外": "e1", "title": "ignored"})");
    Write(folder / "活动报名-B-2_v1-20240101-100000.json",
          R"({"所属部门": "X", "人数": 2, "是否参加": false, "参加晚宴": false, "备注": "b"})");
    Write(folder / "活动报名-C-3_v1-20240101-100000.json",
          R"({"所属部门": "Y", "人数": "3", "是否参加": "true", "参加晚宴": true, "备注": "a"})");
    Write(folder / "活动报名-D-4_v1-20240101-100000.json", "{broken");
    return folder;
}

std::string Cell(const domain::TableRow& row, size_t index) {
    return domain::FieldToString(row[index]);
}

void TestReport(const fs::path& root) {
    std::cout << "[Test] Statistics report over the latest entries..." << std::endl;
    fs::path folder = SetupFolder(root);
    application::MergeEngine engine(std::make_shared<infrastructure::CsvTableStore>());

    fs::path output = root / "统计.csv";
    auto result = engine.mergeStatistics((folder / "schema.json").string(), folder.string(), output.string());
    assert(result.isSuccess);
    assert(result.totalFiles == 5);     // schema file excluded
    assert(result.filteredFiles == 1);
    assert(result.totalRecords == 3);   // broken record skipped
    assert(result.mergedFiles == 7);

    infrastructure::CsvTableStore store;
    auto report = store.readRows(output.string(), 0);
    assert(report.headers == StatisticsAggregator::ReportHeaders());
    assert(report.rows.size() == 7);

    const auto& dept = report.rows[0];
    assert(Cell(dept, 0) == "所属部门");
    assert(Cell(dept, 2) == "3");
    assert(Cell(dept, 3) == "共 2 个不同的值");
    assert(Cell(dept, 4) == "X、Y");

    assert(Cell(report.rows[1], 0) == "人数");
    assert(Cell(report.rows[1], 3) == "6");

    assert(Cell(report.rows[2], 0) == "是否参加");
    assert(Cell(report.rows[2], 3) == "是(2) 否(1)");

    assert(Cell(report.rows[3], 0) == "参加晚宴");
    assert(Cell(report.rows[3], 3) == "是(1) 否(1)");
    assert(Cell(report.rows[3], 4) == "X：是(1人)，否(1人)");
    assert(Cell(report.rows[4], 0) == "参加晚宴");
    assert(Cell(report.rows[4], 3) == "是(1) 否(0)");
    assert(Cell(report.rows[4], 4) == "Y：是(1人)，否(0人)");

    // Grouped by itself: accumulated over all records.
    assert(Cell(report.rows[5], 0) == "备注");
    assert(Cell(report.rows[5], 3) == "共 2 个不同的值");
    assert(Cell(report.rows[5], 4) == "a、b");

    assert(Cell(report.rows[6], 0) == "额外");
    assert(Cell(report.rows[6], 3) == "e1");
    std::cout << "[PASS] Report" << std::endl;
}

void TestOverrides(const fs::path& root) {
    std::cout << "[Test] Overrides win over the schema..." << std::endl;
    fs::path folder = SetupFolder(root);
    application::MergeEngine engine(std::make_shared<infrastructure::CsvTableStore>());

    domain::ColumnDefinition perDepartment;
    perDepartment.type = domain::ColumnType::Number;
    perDepartment.mergeMode = domain::MergeMode::GroupBy;
    perDepartment.groupByField = "所属部门";

    fs::path output = root / "统计.csv";
    auto result = engine.mergeStatistics((folder / "schema.json").string(), folder.string(), output.string(),
                                         {{"人数", perDepartment}});
    assert(result.isSuccess);
    assert(result.mergedFiles == 8);

    infrastructure::CsvTableStore store;
    auto report = store.readRows(output.string(), 0);
    assert(Cell(report.rows[1], 0) == "人数");
    assert(Cell(report.rows[1], 3) == "3");
    assert(Cell(report.rows[1], 4) == "X：3");
    assert(Cell(report.rows[2], 0) == "人数");
    assert(Cell(report.rows[2], 4) == "Y：3");
    std::cout << "[PASS] Overrides" << std::endl;
}

void TestAggregatorDirectly() {
    std::cout << "[Test] Handler table on in-memory records..." << std::endl;
    StatisticsAggregator aggregator;

    std::vector<domain::Record> records(3);
    records[0]["n"] = 1.0;
    records[1]["n"] = 2.0;
    records[2]["n"] = 3.0;
    records[0]["b"] = true;
    records[1]["b"] = false;
    records[2]["b"] = true;
    records[0]["dept"] = std::string("X");
    records[1]["dept"] = std::string("Y");

    domain::ColumnDefinition number;
    number.name = "n";
    number.type = domain::ColumnType::Number;
    auto rows = aggregator.aggregate(number, records);
    assert(rows.size() == 1 && rows[0].result == "6");

    domain::ColumnDefinition flag;
    flag.name = "b";
    flag.type = domain::ColumnType::Boolean;
    rows = aggregator.aggregate(flag, records);
    assert(rows.size() == 1 && rows[0].result == "是(2) 否(1)");

    flag.mergeMode = domain::MergeMode::GroupBy;
    flag.groupByField = "dept";
    rows = aggregator.aggregate(flag, records);
    assert(rows.size() == 3);
    assert(rows[0].detail == "X：是(1人)，否(0人)");
    assert(rows[1].detail == "Y：是(0人)，否(1人)");
    assert(rows[2].detail == std::string(StatisticsAggregator::kUnfilledGroup) + "：是(1人)，否(0人)");

    // A field grouped by itself behaves exactly like Accumulate.
    number.mergeMode = domain::MergeMode::GroupBy;
    number.groupByField = "n";
    rows = aggregator.aggregate(number, records);
    assert(rows.size() == 1 && rows[0].result == "6");
    assert(rows[0].totalSubmissions == 3);

    domain::TableSchema schema;
    auto unknown = StatisticsAggregator::ResolveColumn("自由填写", schema, {});
    assert(unknown.type == domain::ColumnType::Text);
    assert(unknown.mergeMode == domain::MergeMode::Accumulate);
    assert(unknown.groupByField.value() == StatisticsAggregator::kDefaultGroupField);
    std::cout << "[PASS] Handler table" << std::endl;
}

void TestGroupedTallies() {
    std::cout << "[Test] Per-group tallies and value lists..." << std::endl;
    StatisticsAggregator aggregator;

    std::vector<domain::Record> records(4);
    const char* depts[] = {"X", "X", "X", "Y"};
    const bool joined[] = {true, true, false, false};
    const char* notes[] = {"a", "a", "b", "c"};
    for (size_t i = 0; i < records.size(); ++i) {
        records[i]["dept"] = std::string(depts[i]);
        records[i]["joined"] = joined[i];
        records[i]["note"] = std::string(notes[i]);
    }

    domain::ColumnDefinition flag;
    flag.name = "joined";
    flag.type = domain::ColumnType::Boolean;
    flag.mergeMode = domain::MergeMode::GroupBy;
    flag.groupByField = "dept";
    auto rows = aggregator.aggregate(flag, records);
    assert(rows.size() == 2);
    assert(rows[0].result == "是(2) 否(1)");
    assert(rows[0].detail == "X：是(2人)，否(1人)");
    assert(rows[1].result == "是(0) 否(1)");
    assert(rows[1].detail == "Y：是(0人)，否(1人)");

    domain::ColumnDefinition note;
    note.name = "note";
    note.type = domain::ColumnType::Text;
    note.mergeMode = domain::MergeMode::GroupBy;
    note.groupByField = "dept";
    rows = aggregator.aggregate(note, records);
    assert(rows.size() == 2);
    assert(rows[0].detail == "X：a、a、b");
    assert(rows[0].result == "a、b");
    assert(rows[1].detail == "Y：c");
    assert(rows[1].result == "c");
    assert(rows[0].totalSubmissions == 4);
    std::cout << "[PASS] Grouped tallies" << std::endl;
}

void TestExtraFieldsKeepDocumentOrder() {
    std::cout << "[Test] Undeclared fields follow their first appearance..." << std::endl;
    domain::TableSchema schema;
    domain::ColumnDefinition declared;
    declared.name = "所属部门";
    schema.columns.push_back(declared);

    std::vector<domain::Record> records;
    records.push_back(infrastructure::JsonRecordReader::ParseRecord(
        R"({"zeta": 1, "所属部门": "X", "alpha": "a", "Title": "skip"})"));
    records.push_back(infrastructure::JsonRecordReader::ParseRecord(R"({"mid": true, "alpha": "b"})"));

    auto names = StatisticsAggregator::CollectFieldNames(schema, records);
    assert((names == std::vector<std::string>{"所属部门", "zeta", "alpha", "mid"}));

    auto dumped = infrastructure::JsonRecordReader::ToJson(records[0]).dump();
    assert(dumped.find("zeta") < dumped.find("alpha"));
    std::cout << "[PASS] Document order" << std::endl;
}

void TestFailures(const fs::path& root) {
    std::cout << "[Test] Missing schema, empty schema and empty folder..." << std::endl;
    fs::remove_all(root);
    fs::create_directories(root / "empty");
    application::MergeEngine engine(std::make_shared<infrastructure::CsvTableStore>());
    fs::path output = root / "out.csv";

    auto result = engine.mergeStatistics((root / "none.json").string(), (root / "empty").string(), output.string());
    assert(result.errorKind == MergeErrorKind::SourceMissing);

    Write(root / "blank.json", R"({"title": "x", "columns": []})");
    result = engine.mergeStatistics((root / "blank.json").string(), (root / "empty").string(), output.string());
    assert(result.errorKind == MergeErrorKind::SchemaInvalid);

    Write(root / "garbage.json", "not json");
    result = engine.mergeStatistics((root / "garbage.json").string(), (root / "empty").string(), output.string());
    assert(result.errorKind == MergeErrorKind::SchemaInvalid);

    Write(root / "schema.json", kSchema);
    result = engine.mergeStatistics((root / "schema.json").string(), (root / "empty").string(), output.string());
    assert(result.errorKind == MergeErrorKind::NoData);
    assert(!result.isSuccess);
    assert(!fs::exists(output));
    std::cout << "[PASS] Failures" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting statistics merge tests..." << std::endl;
    fs::path root = fs::temp_directory_path() / "lancollect_statistics_merge";
    TestReport(root);
    TestOverrides(root);
    TestAggregatorDirectly();
    TestGroupedTallies();
    TestExtraFieldsKeepDocumentOrder();
    TestFailures(root);
    fs::remove_all(root);
    std::cout << "[Test] All statistics merge tests passed." << std::endl;
    return 0;
}
