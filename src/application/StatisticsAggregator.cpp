/**
 * @file StatisticsAggregator.cpp
 * @brief Implementation of StatisticsAggregator.
 */

#include "application/StatisticsAggregator.hpp"
#include "infrastructure/Log.hpp"
#include <algorithm>
#include <cctype>

using lancollect::domain::ColumnDefinition;
using lancollect::domain::ColumnType;
using lancollect::domain::MergeMode;
using lancollect::domain::Record;
using lancollect::infrastructure::Log;

namespace lancollect::application {

namespace {

const std::string kListSeparator = "、";
const std::string kGroupSeparator = "：";

const domain::FieldValue* Lookup(const Record& record, const std::string& name) {
    auto it = record.find(name);
    return it == record.end() ? nullptr : &it->second;
}

std::string TextOf(const Record& record, const std::string& name) {
    const domain::FieldValue* value = Lookup(record, name);
    return value ? domain::FieldToString(*value) : "";
}

std::string GroupFieldOf(const ColumnDefinition& column) {
    if (column.groupByField && !column.groupByField->empty()) return *column.groupByField;
    return StatisticsAggregator::kDefaultGroupField;
}

std::string GroupOf(const Record& record, const std::string& groupField) {
    std::string group = TextOf(record, groupField);
    return group.empty() ? StatisticsAggregator::kUnfilledGroup : group;
}

std::string Join(const std::vector<std::string>& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += kListSeparator;
        out += values[i];
    }
    return out;
}

std::vector<std::string> Distinct(const std::vector<std::string>& values) {
    std::vector<std::string> unique;
    for (const auto& v : values) {
        if (std::find(unique.begin(), unique.end(), v) == unique.end()) unique.push_back(v);
    }
    return unique;
}

std::string YesNo(int yes, int no) {
    return "是(" + std::to_string(yes) + ") 否(" + std::to_string(no) + ")";
}

/** Insertion-ordered group table. */
template <typename T>
T& GroupSlot(std::vector<std::pair<std::string, T>>& groups, const std::string& key) {
    for (auto& [name, value] : groups) {
        if (name == key) return value;
    }
    groups.emplace_back(key, T{});
    return groups.back().second;
}

StatisticsRow BaseRow(const ColumnDefinition& column, const std::vector<Record>& records) {
    StatisticsRow row;
    row.fieldName = column.name;
    row.fieldType = domain::ColumnTypeToString(column.type);
    row.totalSubmissions = static_cast<int>(records.size());
    return row;
}

// --- Accumulate -----------------------------------------------------------

std::vector<StatisticsRow> AccumulateNumber(const ColumnDefinition& column, const std::vector<Record>& records) {
    double sum = 0;
    for (const auto& record : records) {
        const domain::FieldValue* value = Lookup(record, column.name);
        if (!value) continue;
        if (auto number = domain::AsNumber(*value)) sum += *number;
    }
    StatisticsRow row = BaseRow(column, records);
    row.result = domain::FormatNumber(sum);
    return {row};
}

std::vector<StatisticsRow> AccumulateBoolean(const ColumnDefinition& column, const std::vector<Record>& records) {
    int yes = 0;
    int no = 0;
    for (const auto& record : records) {
        const domain::FieldValue* value = Lookup(record, column.name);
        if (!value) continue;
        if (auto flag = domain::AsBoolean(*value)) {
            if (*flag) ++yes; else ++no;
        }
    }
    StatisticsRow row = BaseRow(column, records);
    row.result = YesNo(yes, no);
    return {row};
}

std::vector<StatisticsRow> AccumulateText(const ColumnDefinition& column, const std::vector<Record>& records) {
    std::vector<std::string> values;
    for (const auto& record : records) {
        std::string text = TextOf(record, column.name);
        if (!text.empty()) values.push_back(text);
    }
    auto unique = Distinct(values);

    StatisticsRow row = BaseRow(column, records);
    if (column.name == GroupFieldOf(column)) {
        // The grouping field itself: count the groups, list them in the detail.
        row.result = "共 " + std::to_string(unique.size()) + " 个不同的值";
        row.detail = Join(unique);
    } else {
        row.result = Join(unique);
    }
    return {row};
}

// --- GroupBy --------------------------------------------------------------

std::vector<StatisticsRow> GroupByNumber(const ColumnDefinition& column, const std::vector<Record>& records) {
    const std::string groupField = GroupFieldOf(column);
    std::vector<std::pair<std::string, double>> sums;
    for (const auto& record : records) {
        const domain::FieldValue* value = Lookup(record, column.name);
        if (!value) continue;
        auto number = domain::AsNumber(*value);
        if (!number) continue;
        GroupSlot(sums, GroupOf(record, groupField)) += *number;
    }

    std::vector<StatisticsRow> rows;
    for (const auto& [group, sum] : sums) {
        StatisticsRow row = BaseRow(column, records);
        row.result = domain::FormatNumber(sum);
        row.detail = group + kGroupSeparator + row.result;
        rows.push_back(row);
    }
    return rows;
}

std::vector<StatisticsRow> GroupByBoolean(const ColumnDefinition& column, const std::vector<Record>& records) {
    const std::string groupField = GroupFieldOf(column);
    std::vector<std::pair<std::string, std::pair<int, int>>> counts;
    for (const auto& record : records) {
        const domain::FieldValue* value = Lookup(record, column.name);
        if (!value) continue;
        auto flag = domain::AsBoolean(*value);
        if (!flag) continue;
        auto& slot = GroupSlot(counts, GroupOf(record, groupField));
        if (*flag) ++slot.first; else ++slot.second;
    }

    std::vector<StatisticsRow> rows;
    for (const auto& [group, tally] : counts) {
        StatisticsRow row = BaseRow(column, records);
        row.result = YesNo(tally.first, tally.second);
        row.detail = group + kGroupSeparator + "是(" + std::to_string(tally.first) + "人)，否(" +
                     std::to_string(tally.second) + "人)";
        rows.push_back(row);
    }
    return rows;
}

std::vector<StatisticsRow> GroupByText(const ColumnDefinition& column, const std::vector<Record>& records) {
    const std::string groupField = GroupFieldOf(column);
    std::vector<std::pair<std::string, std::vector<std::string>>> groups;
    for (const auto& record : records) {
        std::string text = TextOf(record, column.name);
        if (text.empty()) continue;
        GroupSlot(groups, GroupOf(record, groupField)).push_back(text);
    }

    std::vector<StatisticsRow> rows;
    for (const auto& [group, values] : groups) {
        StatisticsRow row = BaseRow(column, records);
        row.result = Join(Distinct(values));
        row.detail = group + kGroupSeparator + Join(values);
        rows.push_back(row);
    }
    return rows;
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

} // namespace

StatisticsAggregator::StatisticsAggregator() {
    m_handlers[{MergeMode::Accumulate, ColumnType::Number}] = AccumulateNumber;
    m_handlers[{MergeMode::Accumulate, ColumnType::Boolean}] = AccumulateBoolean;
    m_handlers[{MergeMode::Accumulate, ColumnType::Text}] = AccumulateText;
    m_handlers[{MergeMode::GroupBy, ColumnType::Number}] = GroupByNumber;
    m_handlers[{MergeMode::GroupBy, ColumnType::Boolean}] = GroupByBoolean;
    m_handlers[{MergeMode::GroupBy, ColumnType::Text}] = GroupByText;
}

std::vector<StatisticsRow> StatisticsAggregator::aggregate(const ColumnDefinition& column,
                                                           const std::vector<Record>& records) const {
    ColumnDefinition effective = column;
    if (effective.mergeMode == MergeMode::GroupBy && effective.groupByField &&
        *effective.groupByField == effective.name) {
        Log::Debug("StatisticsAggregator", "Field '" + column.name + "' groups by itself, accumulating instead");
        effective.mergeMode = MergeMode::Accumulate;
    }

    auto it = m_handlers.find({effective.mergeMode, effective.type});
    if (it == m_handlers.end()) {
        Log::Warn("StatisticsAggregator", "No handler for field '" + column.name + "', treating it as text");
        it = m_handlers.find({effective.mergeMode, ColumnType::Text});
    }
    return it->second(effective, records);
}

ColumnDefinition StatisticsAggregator::ResolveColumn(const std::string& fieldName,
                                                     const domain::TableSchema& schema,
                                                     const std::map<std::string, ColumnDefinition>& overrides) {
    auto overridden = overrides.find(fieldName);
    if (overridden != overrides.end()) {
        ColumnDefinition column = overridden->second;
        column.name = fieldName;
        return column;
    }
    if (const ColumnDefinition* declared = schema.findColumn(fieldName)) {
        return *declared;
    }

    ColumnDefinition fallback;
    fallback.name = fieldName;
    fallback.type = ColumnType::Text;
    fallback.mergeMode = MergeMode::Accumulate;
    fallback.groupByField = kDefaultGroupField;
    return fallback;
}

std::vector<std::string> StatisticsAggregator::CollectFieldNames(const domain::TableSchema& schema,
                                                                 const std::vector<Record>& records) {
    std::vector<std::string> names;
    auto add = [&names](const std::string& name) {
        if (std::find(names.begin(), names.end(), name) == names.end()) names.push_back(name);
    };

    for (const auto& column : schema.columns) add(column.name);
    for (const auto& record : records) {
        for (const auto& [key, value] : record) {
            if (key.empty()) continue;
            std::string lower = ToLower(key);
            if (lower == "title" || lower == "columns") continue;
            add(key);
        }
    }
    return names;
}

std::vector<std::string> StatisticsAggregator::ReportHeaders() {
    return {"字段名称", "字段类型", "总提交数", "统计结果", "详细信息"};
}

domain::Table StatisticsAggregator::ToTable(const std::vector<StatisticsRow>& rows) {
    domain::Table table;
    table.headers = ReportHeaders();
    for (const auto& row : rows) {
        table.rows.push_back({row.fieldName, row.fieldType, static_cast<double>(row.totalSubmissions),
                              row.result, row.detail});
    }
    return table;
}

} // namespace lancollect::application
