/**
 * @file JsonRecordReader.cpp
 * @brief Implementation of JsonRecordReader.
 */

#include "infrastructure/JsonRecordReader.hpp"
#include "domain/DomainErrors.hpp"
#include <fstream>

// Object keys keep their document order.
using json = nlohmann::ordered_json;

namespace lancollect::infrastructure {

namespace {

json ReadJsonFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw domain::IoFailureError(path, "cannot open for reading");
    }
    try {
        json j;
        f >> j;
        return j;
    } catch (const json::exception& e) {
        throw domain::IoFailureError(path, std::string("invalid JSON: ") + e.what());
    }
}

domain::MergeMode ReadMergeMode(const json& value) {
    if (value.is_number_integer()) {
        return value.get<int>() == 1 ? domain::MergeMode::GroupBy : domain::MergeMode::Accumulate;
    }
    if (value.is_string()) {
        return domain::ParseMergeMode(value.get<std::string>()).value_or(domain::MergeMode::Accumulate);
    }
    return domain::MergeMode::Accumulate;
}

} // namespace

domain::FieldValue JsonRecordReader::ToFieldValue(const json& value) {
    switch (value.type()) {
        case json::value_t::null:
            return std::monostate{};
        case json::value_t::boolean:
            return value.get<bool>();
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float:
            return value.get<double>();
        case json::value_t::string:
            return value.get<std::string>();
        default:
            // Arrays and nested objects are kept as their compact text.
            return value.dump();
    }
}

json JsonRecordReader::ToJson(const domain::FieldValue& value) {
    if (std::holds_alternative<double>(value)) return std::get<double>(value);
    if (std::holds_alternative<bool>(value)) return std::get<bool>(value);
    if (std::holds_alternative<std::string>(value)) return std::get<std::string>(value);
    return nullptr;
}

json JsonRecordReader::ToJson(const domain::Record& record) {
    json j = json::object();
    for (const auto& [key, value] : record) {
        j[key] = ToJson(value);
    }
    return j;
}

json JsonRecordReader::ToJson(const domain::TableSchema& schema) {
    json columns = json::array();
    for (const auto& column : schema.columns) {
        json c;
        c["name"] = column.name;
        c["type"] = column.type == domain::ColumnType::Number    ? "Number"
                  : column.type == domain::ColumnType::Boolean ? "Boolean"
                                                               : "Text";
        c["required"] = column.required;
        if (column.description) c["description"] = *column.description;
        c["mergeMode"] = domain::MergeModeToString(column.mergeMode);
        if (column.groupByField) c["groupByField"] = *column.groupByField;
        columns.push_back(c);
    }
    return json{{"title", schema.title}, {"columns", columns}};
}

domain::TableSchema JsonRecordReader::LoadSchema(const std::string& path) {
    json j = ReadJsonFile(path);
    if (!j.is_object()) {
        throw domain::IoFailureError(path, "schema must be a JSON object");
    }

    domain::TableSchema schema;
    try {
        schema.title = j.value("title", "");

        if (j.contains("columns") && j["columns"].is_array()) {
            for (const auto& c : j["columns"]) {
                if (!c.is_object()) continue;

                domain::ColumnDefinition column;
                column.name = c.value("name", "");
                if (column.name.empty()) continue;
                column.type = domain::ParseColumnType(c.value("type", "Text"));
                column.required = c.value("required", false);
                if (c.contains("description") && c["description"].is_string()) {
                    column.description = c["description"].get<std::string>();
                }
                if (c.contains("mergeMode")) {
                    column.mergeMode = ReadMergeMode(c["mergeMode"]);
                }
                if (c.contains("groupByField") && c["groupByField"].is_string()) {
                    std::string field = c["groupByField"].get<std::string>();
                    if (!field.empty()) column.groupByField = field;
                }
                schema.columns.push_back(column);
            }
        }
    } catch (const json::exception& e) {
        throw domain::IoFailureError(path, std::string("malformed schema: ") + e.what());
    }
    return schema;
}

domain::Record JsonRecordReader::ParseRecord(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw domain::InvalidArgumentError("Submitted data must be a JSON object");
    }
    domain::Record record;
    for (auto it = j.begin(); it != j.end(); ++it) {
        record[it.key()] = ToFieldValue(it.value());
    }
    return record;
}

domain::Record JsonRecordReader::LoadRecord(const std::string& path) {
    json j = ReadJsonFile(path);
    if (!j.is_object()) {
        throw domain::IoFailureError(path, "record must be a JSON object");
    }
    domain::Record record;
    for (auto it = j.begin(); it != j.end(); ++it) {
        record[it.key()] = ToFieldValue(it.value());
    }
    return record;
}

} // namespace lancollect::infrastructure
