/**
 * @file CsvTableStore.cpp
 * @brief Implementation of CsvTableStore.
 */

#include "infrastructure/CsvTableStore.hpp"
#include "domain/DomainErrors.hpp"
#include <fstream>
#include <sstream>

namespace lancollect::infrastructure {

namespace {

const std::string kUtf8Bom = "\xEF\xBB\xBF";

std::string Trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool IsBlank(const std::vector<std::string>& record) {
    for (const auto& field : record) {
        if (!Trim(field).empty()) return false;
    }
    return true;
}

bool NeedsQuoting(const std::string& field, char delimiter) {
    return field.find(delimiter) != std::string::npos ||
           field.find('"') != std::string::npos ||
           field.find('\n') != std::string::npos ||
           field.find('\r') != std::string::npos;
}

} // namespace

CsvTableStore::CsvTableStore(char delimiter) : m_delimiter(delimiter) {}

std::vector<std::vector<std::string>> CsvTableStore::ParseRecords(const std::string& content, char delimiter) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool inQuotes = false;

    size_t start = content.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0 ? kUtf8Bom.size() : 0;

    for (size_t i = start; i < content.size(); ++i) {
        char c = content[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < content.size() && content[i + 1] == '"') {
                    field += '"'; // escaped quote
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"') {
            inQuotes = true;
        } else if (c == delimiter) {
            record.push_back(field);
            field.clear();
        } else if (c == '\n' || c == '\r') {
            if (c == '\r' && i + 1 < content.size() && content[i + 1] == '\n') ++i;
            record.push_back(field);
            field.clear();
            records.push_back(record);
            record.clear();
        } else {
            field += c;
        }
    }

    if (!field.empty() || !record.empty()) {
        record.push_back(field);
        records.push_back(record);
    }
    return records;
}

std::string CsvTableStore::EscapeField(const std::string& field, char delimiter) {
    if (!NeedsQuoting(field, delimiter)) return field;

    std::string escaped = "\"";
    for (char c : field) {
        if (c == '"') escaped += '"';
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

std::vector<std::vector<std::string>> CsvTableStore::loadRecords(const std::string& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw domain::IoFailureError(path, "cannot open for reading");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw domain::IoFailureError(path, "read failed");
    }
    return ParseRecords(buffer.str(), m_delimiter);
}

std::vector<std::string> CsvTableStore::readHeaders(const std::string& path, int headerRowIndex) {
    auto records = loadRecords(path);
    std::vector<std::string> headers;
    if (headerRowIndex < 0 || headerRowIndex >= static_cast<int>(records.size())) {
        return headers;
    }
    for (const auto& cell : records[headerRowIndex]) {
        std::string name = Trim(cell);
        if (!name.empty()) headers.push_back(name);
    }
    return headers;
}

domain::Table CsvTableStore::readRows(const std::string& path, int headerRowIndex) {
    auto records = loadRecords(path);
    domain::Table table;
    if (headerRowIndex < 0 || headerRowIndex >= static_cast<int>(records.size())) {
        return table;
    }

    // Source positions of the non-empty header cells.
    std::vector<size_t> positions;
    const auto& headerRecord = records[headerRowIndex];
    for (size_t col = 0; col < headerRecord.size(); ++col) {
        std::string name = Trim(headerRecord[col]);
        if (name.empty()) continue;
        table.headers.push_back(name);
        positions.push_back(col);
    }

    for (size_t r = static_cast<size_t>(headerRowIndex) + 1; r < records.size(); ++r) {
        const auto& record = records[r];
        if (IsBlank(record)) continue;

        domain::TableRow row;
        row.reserve(positions.size());
        for (size_t pos : positions) {
            if (pos < record.size() && !record[pos].empty()) {
                row.emplace_back(record[pos]);
            } else {
                row.emplace_back(std::monostate{});
            }
        }
        table.rows.push_back(std::move(row));
    }
    return table;
}

void CsvTableStore::writeRows(const std::string& path, const domain::Table& table) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw domain::IoFailureError(path, "cannot open for writing");
    }

    auto writeRecord = [&](const std::vector<std::string>& fields) {
        for (size_t i = 0; i < fields.size(); ++i) {
            if (i > 0) out << m_delimiter;
            out << EscapeField(fields[i], m_delimiter);
        }
        out << "\r\n";
    };

    out << kUtf8Bom;
    writeRecord(table.headers);
    for (const auto& row : table.rows) {
        std::vector<std::string> fields;
        fields.reserve(row.size());
        for (const auto& value : row) fields.push_back(domain::FieldToString(value));
        writeRecord(fields);
    }

    out.flush();
    if (out.fail()) {
        throw domain::IoFailureError(path, "write failed");
    }
}

} // namespace lancollect::infrastructure
