/**
 * @file FieldValue.hpp
 * @brief Typed cell/field value shared by tabular rows and JSON records.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace lancollect::domain {

/**
 * @brief Null | Number | Text | Boolean.
 */
using FieldValue = std::variant<std::monostate, double, std::string, bool>;

/** @brief One structured submission: field name to value, in first-seen order. */
using Record = nlohmann::ordered_map<std::string, FieldValue>;

/** @brief One tabular row, positionally aligned with its table's headers. */
using TableRow = std::vector<FieldValue>;

/**
 * @struct Table
 * @brief Row/column data exchanged with the spreadsheet boundary.
 */
struct Table {
    std::vector<std::string> headers;
    std::vector<TableRow> rows;
};

inline bool IsNull(const FieldValue& value) {
    return std::holds_alternative<std::monostate>(value);
}

/**
 * @brief Formats a number the way reports show it: integers without a
 * fractional part, otherwise at most two decimals.
 */
inline std::string FormatNumber(double value) {
    if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 1e15) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.0f", value);
        return buf;
    }
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    std::string text(buf);
    // Trim trailing zeros of the fractional part ("1.50" -> "1.5").
    while (!text.empty() && text.back() == '0') text.pop_back();
    if (!text.empty() && text.back() == '.') text.pop_back();
    return text;
}

/**
 * @brief Textual form of a value; Null becomes the empty string.
 */
inline std::string FieldToString(const FieldValue& value) {
    if (std::holds_alternative<std::string>(value)) return std::get<std::string>(value);
    if (std::holds_alternative<double>(value)) return FormatNumber(std::get<double>(value));
    if (std::holds_alternative<bool>(value)) return std::get<bool>(value) ? "true" : "false";
    return "";
}

/**
 * @brief Numeric reading of a value. Text is accepted when the whole
 * (trimmed) string parses as a number.
 */
inline std::optional<double> AsNumber(const FieldValue& value) {
    if (std::holds_alternative<double>(value)) return std::get<double>(value);
    if (!std::holds_alternative<std::string>(value)) return std::nullopt;

    const std::string& text = std::get<std::string>(value);
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::nullopt;
    auto last = text.find_last_not_of(" \t\r\n");
    std::string trimmed = text.substr(first, last - first + 1);
    try {
        size_t consumed = 0;
        double parsed = std::stod(trimmed, &consumed);
        if (consumed != trimmed.size()) return std::nullopt;
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

/**
 * @brief Boolean reading of a value. Text "true"/"false" in any case counts.
 */
inline std::optional<bool> AsBoolean(const FieldValue& value) {
    if (std::holds_alternative<bool>(value)) return std::get<bool>(value);
    if (!std::holds_alternative<std::string>(value)) return std::nullopt;

    std::string lower = std::get<std::string>(value);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return std::tolower(c); });
    if (lower == "true") return true;
    if (lower == "false") return false;
    return std::nullopt;
}

} // namespace lancollect::domain
