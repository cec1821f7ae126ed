/**
 * @file JsonRecordReader.hpp
 * @brief nlohmann::json bridge for form schemas and structured submissions.
 */

#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "domain/FieldValue.hpp"
#include "domain/TableSchema.hpp"

namespace lancollect::infrastructure {

class JsonRecordReader {
public:
    /**
     * @brief Reads schema.json ({"title": ..., "columns": [...]}).
     * mergeMode accepts the enum name or its ordinal.
     * @throws IoFailureError if the file cannot be read or parsed.
     */
    static domain::TableSchema LoadSchema(const std::string& path);

    /**
     * @brief Reads one submission: a flat JSON object of field -> value.
     * @throws IoFailureError if the file is unreadable or not an object.
     */
    static domain::Record LoadRecord(const std::string& path);

    /** @brief Parses a JSON object held in memory. */
    static domain::Record ParseRecord(const std::string& text);

    static domain::FieldValue ToFieldValue(const nlohmann::ordered_json& value);
    static nlohmann::ordered_json ToJson(const domain::FieldValue& value);
    static nlohmann::ordered_json ToJson(const domain::Record& record);
    static nlohmann::ordered_json ToJson(const domain::TableSchema& schema);
};

} // namespace lancollect::infrastructure
