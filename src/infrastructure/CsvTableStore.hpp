/**
 * @file CsvTableStore.hpp
 * @brief TableStore over RFC 4180 style CSV files.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/TableStore.hpp"

namespace lancollect::infrastructure {

/**
 * @class CsvTableStore
 * @brief Reads and writes UTF-8 CSV (optional BOM, quoted fields with
 * embedded delimiters, quotes and newlines).
 *
 * Cells come back as Text, empty cells as Null; typing is left to the
 * consumer. Output carries a BOM so spreadsheet tools detect UTF-8.
 */
class CsvTableStore : public domain::TableStore {
public:
    explicit CsvTableStore(char delimiter = ',');

    std::string extension() const override { return ".csv"; }
    std::vector<std::string> readHeaders(const std::string& path, int headerRowIndex) override;
    domain::Table readRows(const std::string& path, int headerRowIndex) override;
    void writeRows(const std::string& path, const domain::Table& table) override;

    /** @brief Splits CSV text into records of raw fields. */
    static std::vector<std::vector<std::string>> ParseRecords(const std::string& content, char delimiter);

    static std::string EscapeField(const std::string& field, char delimiter);

private:
    std::vector<std::vector<std::string>> loadRecords(const std::string& path) const;

    char m_delimiter;
};

} // namespace lancollect::infrastructure
