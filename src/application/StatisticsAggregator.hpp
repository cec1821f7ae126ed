/**
 * @file StatisticsAggregator.hpp
 * @brief Per-column statistics of structured submissions.
 */

#pragma once
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "domain/FieldValue.hpp"
#include "domain/TableSchema.hpp"

namespace lancollect::application {

/**
 * @struct StatisticsRow
 * @brief One line of the statistics report.
 */
struct StatisticsRow {
    std::string fieldName;
    std::string fieldType;
    int totalSubmissions = 0;
    std::string result;
    std::string detail;
};

/**
 * @class StatisticsAggregator
 * @brief Turns a set of records into report rows, one handler per
 * (MergeMode, ColumnType) pair.
 */
class StatisticsAggregator {
public:
    /** Group used when neither the column nor the record names one. */
    static constexpr const char* kDefaultGroupField = "所属部门";
    /** Group label for records without a value in the grouping field. */
    static constexpr const char* kUnfilledGroup = "未填写";

    using Handler = std::function<std::vector<StatisticsRow>(const domain::ColumnDefinition&,
                                                             const std::vector<domain::Record>&)>;

    StatisticsAggregator();

    /**
     * @brief Rows for one column. A GroupBy column grouped by itself is
     * treated as Accumulate.
     */
    std::vector<StatisticsRow> aggregate(const domain::ColumnDefinition& column,
                                         const std::vector<domain::Record>& records) const;

    /**
     * @brief Effective settings of a field: override, then schema column,
     * then {Text, Accumulate, groupBy 所属部门}.
     */
    static domain::ColumnDefinition ResolveColumn(const std::string& fieldName,
                                                  const domain::TableSchema& schema,
                                                  const std::map<std::string, domain::ColumnDefinition>& overrides);

    /**
     * @brief Schema columns in order, then extra record keys in first-seen
     * order. Metadata keys "title" and "columns" are left out.
     */
    static std::vector<std::string> CollectFieldNames(const domain::TableSchema& schema,
                                                      const std::vector<domain::Record>& records);

    /** @brief Report headers: 字段名称, 字段类型, 总提交数, 统计结果, 详细信息 */
    static std::vector<std::string> ReportHeaders();

    static domain::Table ToTable(const std::vector<StatisticsRow>& rows);

private:
    std::map<std::pair<domain::MergeMode, domain::ColumnType>, Handler> m_handlers;
};

} // namespace lancollect::application
