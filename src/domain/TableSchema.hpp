/**
 * @file TableSchema.hpp
 * @brief Column schema of a structured (online form) task.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "domain/CollectionPolicy.hpp"

namespace lancollect::domain {

/**
 * @struct ColumnDefinition
 * @brief One declared form field and how it is aggregated.
 */
struct ColumnDefinition {
    std::string name;                       ///< Display name and JSON key.
    ColumnType type = ColumnType::Text;
    bool required = false;
    std::optional<std::string> description;
    MergeMode mergeMode = MergeMode::Accumulate;
    std::optional<std::string> groupByField; ///< Only meaningful for GroupBy.
};

/**
 * @struct TableSchema
 * @brief Ordered columns of a form, as stored in schema.json.
 */
struct TableSchema {
    std::string title;
    std::vector<ColumnDefinition> columns;

    const ColumnDefinition* findColumn(const std::string& name) const {
        for (const auto& column : columns) {
            if (column.name == name) return &column;
        }
        return nullptr;
    }
};

} // namespace lancollect::domain
