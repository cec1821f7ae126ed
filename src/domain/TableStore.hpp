/**
 * @file TableStore.hpp
 * @brief Row-oriented read/write boundary to spreadsheet files.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/FieldValue.hpp"

namespace lancollect::domain {

/**
 * @class TableStore
 * @brief Abstract spreadsheet access used by the merge engine.
 *
 * Implementations throw on IO or format errors; the engine decides whether a
 * failure skips one file or aborts the run.
 */
class TableStore {
public:
    virtual ~TableStore() = default;

    /** @brief File extension handled by this store, including the dot. */
    virtual std::string extension() const = 0;

    /**
     * @brief Reads the non-empty header cells at the given row.
     * @return Empty vector if the row is out of range or blank.
     */
    virtual std::vector<std::string> readHeaders(const std::string& path, int headerRowIndex) = 0;

    /**
     * @brief Reads the header at headerRowIndex and every row after it.
     * Rows are aligned with the returned headers.
     */
    virtual Table readRows(const std::string& path, int headerRowIndex) = 0;

    /** @brief Writes headers and rows to path, replacing any existing file. */
    virtual void writeRows(const std::string& path, const Table& table) = 0;
};

} // namespace lancollect::domain
