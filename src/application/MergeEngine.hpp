/**
 * @file MergeEngine.hpp
 * @brief Consolidation of a collection folder into one output file.
 */

#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/StatisticsAggregator.hpp"
#include "domain/MergeResult.hpp"
#include "domain/TableSchema.hpp"
#include "domain/TableStore.hpp"
#include "infrastructure/LatestVersionSelector.hpp"

namespace lancollect::application {

/**
 * @class MergeEngine
 * @brief Tabular merge with deduplication and statistics merge of JSON
 * submissions. Both read only the latest version of each submitter.
 *
 * Runs never throw: every outcome is described by the returned MergeResult.
 * Output is produced in a temp file beside the destination and moved into
 * place only after it is complete, so a failed run leaves any previous
 * output untouched.
 *
 * Readers do not take the IoSerializer: a submission landing mid-merge may
 * or may not be included.
 */
class MergeEngine {
public:
    explicit MergeEngine(std::shared_ptr<domain::TableStore> tableStore);

    /**
     * @brief Merges the latest tabular file of every submitter.
     * @param removeDuplicates Enables dedup on dedupColumns.
     * @param dedupColumns Columns forming the dedup key (case-insensitive).
     * @param separator Joins key parts.
     * @param templatePath Optional template giving the canonical headers.
     * @param headerRowIndex Row holding the headers in every file.
     */
    domain::MergeResult mergeLatest(const std::string& sourceFolder,
                                    const std::string& outputPath,
                                    bool removeDuplicates,
                                    const std::vector<std::string>& dedupColumns,
                                    const std::string& separator = "|",
                                    const std::optional<std::string>& templatePath = std::nullopt,
                                    int headerRowIndex = 0);

    /**
     * @brief Builds the per-field statistics report of a form task.
     * @param overrides Per-field settings that win over the schema.
     */
    domain::MergeResult mergeStatistics(const std::string& schemaPath,
                                        const std::string& sourceFolder,
                                        const std::string& outputPath,
                                        const std::map<std::string, domain::ColumnDefinition>& overrides = {});

private:
    /** @brief Writes table to a temp file, then replaces outputPath. */
    void writeOutput(const std::string& outputPath, const domain::Table& table);

    std::shared_ptr<domain::TableStore> m_tableStore;
    infrastructure::LatestVersionSelector m_selector;
    StatisticsAggregator m_aggregator;
};

} // namespace lancollect::application
