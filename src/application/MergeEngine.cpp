/**
 * @file MergeEngine.cpp
 * @brief Implementation of MergeEngine.
 */

#include "application/MergeEngine.hpp"
#include "domain/DomainErrors.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/JsonRecordReader.hpp"
#include "infrastructure/Log.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_set>

namespace fs = std::filesystem;
using lancollect::domain::MergeErrorKind;
using lancollect::domain::MergeResult;
using lancollect::infrastructure::AtomicFileWriter;
using lancollect::infrastructure::Log;

namespace lancollect::application {

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
    return ToLower(a) == ToLower(b);
}

bool IsBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

/** For each canonical header, the matching source column or -1. */
std::vector<int> MapColumns(const std::vector<std::string>& canonical, const std::vector<std::string>& source) {
    std::vector<int> mapping;
    mapping.reserve(canonical.size());
    for (const auto& header : canonical) {
        int match = -1;
        for (size_t i = 0; i < source.size(); ++i) {
            if (EqualsIgnoreCase(source[i], header)) {
                match = static_cast<int>(i);
                break;
            }
        }
        mapping.push_back(match);
    }
    return mapping;
}

domain::TableRow Remap(const domain::TableRow& row, const std::vector<int>& mapping) {
    domain::TableRow out;
    out.reserve(mapping.size());
    for (int index : mapping) {
        if (index >= 0 && index < static_cast<int>(row.size())) {
            out.push_back(row[index]);
        } else {
            out.emplace_back(std::monostate{});
        }
    }
    return out;
}

MergeResult FailWith(MergeResult result, MergeErrorKind kind, const std::string& message) {
    result.isSuccess = false;
    result.errorKind = kind;
    result.errorMessage = message;
    Log::Error("MergeEngine", message);
    return result;
}

} // namespace

MergeEngine::MergeEngine(std::shared_ptr<domain::TableStore> tableStore)
    : m_tableStore(std::move(tableStore)) {}

void MergeEngine::writeOutput(const std::string& outputPath, const domain::Table& table) {
    fs::path temp = AtomicFileWriter::MakeTempPath(outputPath);
    try {
        m_tableStore->writeRows(temp.string(), table);
    } catch (const std::exception&) {
        AtomicFileWriter::DiscardTemp(temp);
        throw;
    }
    AtomicFileWriter::ReplaceWith(temp, outputPath);
}

MergeResult MergeEngine::mergeLatest(const std::string& sourceFolder,
                                     const std::string& outputPath,
                                     bool removeDuplicates,
                                     const std::vector<std::string>& dedupColumns,
                                     const std::string& separator,
                                     const std::optional<std::string>& templatePath,
                                     int headerRowIndex) {
    MergeResult result;

    std::error_code ec;
    if (!fs::is_directory(sourceFolder, ec)) {
        return FailWith(result, MergeErrorKind::SourceMissing, "源文件夹不存在: " + sourceFolder);
    }

    try {
        // 1. Latest version of every submitter
        auto selection = m_selector.selectLatest(sourceFolder, m_tableStore->extension());
        result.totalFiles = selection.report.totalFiles;
        result.filteredFiles = selection.report.excludedFiles;
        result.mergedFiles = selection.report.selectedFiles;

        // 2. Canonical headers
        std::vector<std::string> canonical;
        if (templatePath && !templatePath->empty()) {
            if (!fs::exists(*templatePath, ec)) {
                return FailWith(result, MergeErrorKind::SourceMissing, "模板文件不存在: " + *templatePath);
            }
            if (ToLower(fs::path(*templatePath).extension().string()) == ".json") {
                Log::Warn("MergeEngine", "JSON template ignored for tabular merge: " + *templatePath);
            } else {
                canonical = m_tableStore->readHeaders(*templatePath, headerRowIndex);
                if (canonical.empty()) {
                    Log::Warn("MergeEngine", "Template has no headers at row " + std::to_string(headerRowIndex) +
                              ", falling back to the first file's headers");
                }
            }
        }

        const bool dedup = removeDuplicates && !dedupColumns.empty();
        std::unordered_set<std::string> seenKeys;
        domain::Table output;

        // 3. Rows of every file, remapped onto the canonical headers
        for (const auto& file : selection.files) {
            domain::Table source;
            try {
                source = m_tableStore->readRows(file.string(), headerRowIndex);
            } catch (const std::exception& e) {
                Log::Warn("MergeEngine", "Skipping " + file.filename().string() + ": " + e.what());
                continue;
            }
            if (source.headers.empty()) {
                Log::Warn("MergeEngine", "Skipping " + file.filename().string() + ": no headers");
                continue;
            }
            if (canonical.empty()) {
                canonical = source.headers;
            }

            const std::vector<int> mapping = MapColumns(canonical, source.headers);
            result.totalRecords += static_cast<int>(source.rows.size());

            // Key width is fixed by the canonical headers; a column this file
            // lacks contributes an empty part.
            std::vector<size_t> keyColumns;
            bool keyResolves = false;
            if (dedup) {
                for (const auto& requested : dedupColumns) {
                    for (size_t i = 0; i < canonical.size(); ++i) {
                        if (!EqualsIgnoreCase(canonical[i], requested)) continue;
                        if (std::find(keyColumns.begin(), keyColumns.end(), i) == keyColumns.end()) {
                            keyColumns.push_back(i);
                            keyResolves = keyResolves || mapping[i] >= 0;
                        }
                        break;
                    }
                }
            }

            if (!dedup || !keyResolves) {
                if (dedup) {
                    Log::Warn("MergeEngine", "File " + file.filename().string() +
                              " has no matching dedup columns, adding all rows without deduplication");
                }
                for (const auto& row : source.rows) {
                    output.rows.push_back(Remap(row, mapping));
                }
                continue;
            }

            int kept = 0;
            int skipped = 0;
            for (const auto& row : source.rows) {
                domain::TableRow mapped = Remap(row, mapping);

                std::string key;
                for (size_t k = 0; k < keyColumns.size(); ++k) {
                    if (k > 0) key += separator;
                    key += domain::FieldToString(mapped[keyColumns[k]]);
                }

                if (IsBlank(key) || !seenKeys.insert(key).second) {
                    ++skipped;
                    continue;
                }
                output.rows.push_back(std::move(mapped));
                ++kept;
            }
            Log::Debug("MergeEngine", "File " + file.filename().string() + ": kept " + std::to_string(kept) +
                       ", skipped " + std::to_string(skipped));
        }

        output.headers = canonical;
        result.deduplicatedRecords = static_cast<int>(output.rows.size());
        result.duplicatedCount = result.totalRecords - result.deduplicatedRecords;

        // 4. Temp then replace
        writeOutput(outputPath, output);
    } catch (const domain::IoFailureError& e) {
        return FailWith(result, MergeErrorKind::IoFailure, e.what());
    } catch (const std::exception& e) {
        return FailWith(result, MergeErrorKind::IoFailure, std::string("合并失败: ") + e.what());
    }

    result.outputPath = outputPath;
    result.isSuccess = true;
    Log::Info("MergeEngine", result.summary());
    return result;
}

MergeResult MergeEngine::mergeStatistics(const std::string& schemaPath,
                                         const std::string& sourceFolder,
                                         const std::string& outputPath,
                                         const std::map<std::string, domain::ColumnDefinition>& overrides) {
    MergeResult result;

    std::error_code ec;
    if (!fs::is_directory(sourceFolder, ec)) {
        return FailWith(result, MergeErrorKind::SourceMissing, "源文件夹不存在: " + sourceFolder);
    }
    if (!fs::is_regular_file(schemaPath, ec)) {
        return FailWith(result, MergeErrorKind::SourceMissing, "表格结构文件不存在: " + schemaPath);
    }

    domain::TableSchema schema;
    try {
        schema = infrastructure::JsonRecordReader::LoadSchema(schemaPath);
    } catch (const domain::IoFailureError& e) {
        return FailWith(result, MergeErrorKind::SchemaInvalid, e.what());
    }
    if (schema.columns.empty()) {
        return FailWith(result, MergeErrorKind::SchemaInvalid, "表格结构定义无效");
    }

    try {
        // The schema may live inside the folder it describes.
        std::string excluded;
        fs::path schemaFile(schemaPath);
        if (fs::equivalent(schemaFile.parent_path().empty() ? fs::path(".") : schemaFile.parent_path(),
                           sourceFolder, ec)) {
            excluded = schemaFile.filename().string();
        }

        auto selection = m_selector.selectLatest(sourceFolder, ".json", excluded);
        result.totalFiles = selection.report.totalFiles;
        result.filteredFiles = selection.report.excludedFiles;
        if (selection.files.empty()) {
            return FailWith(result, MergeErrorKind::NoData, "没有找到提交的数据文件");
        }

        std::vector<domain::Record> records;
        for (const auto& file : selection.files) {
            try {
                records.push_back(infrastructure::JsonRecordReader::LoadRecord(file.string()));
            } catch (const domain::IoFailureError& e) {
                Log::Warn("MergeEngine", std::string("Skipping record: ") + e.what());
            }
        }
        result.totalRecords = static_cast<int>(records.size());
        result.deduplicatedRecords = result.totalRecords;
        if (records.empty()) {
            return FailWith(result, MergeErrorKind::NoData, "没有有效的数据可以合并");
        }

        std::vector<StatisticsRow> rows;
        for (const auto& field : StatisticsAggregator::CollectFieldNames(schema, records)) {
            auto column = StatisticsAggregator::ResolveColumn(field, schema, overrides);
            auto fieldRows = m_aggregator.aggregate(column, records);
            rows.insert(rows.end(), fieldRows.begin(), fieldRows.end());
        }
        result.mergedFiles = static_cast<int>(rows.size());

        writeOutput(outputPath, StatisticsAggregator::ToTable(rows));
    } catch (const domain::IoFailureError& e) {
        return FailWith(result, MergeErrorKind::IoFailure, e.what());
    } catch (const std::exception& e) {
        return FailWith(result, MergeErrorKind::IoFailure, std::string("合并失败: ") + e.what());
    }

    result.outputPath = outputPath;
    result.isSuccess = true;
    Log::Info("MergeEngine", "成功生成统计报表，共 " + std::to_string(result.mergedFiles) + " 条记录");
    return result;
}

} // namespace lancollect::application
