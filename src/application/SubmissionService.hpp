/**
 * @file SubmissionService.hpp
 * @brief Write path of the collector: versioned storage plus quota bookkeeping.
 */

#pragma once
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "application/IngestionGate.hpp"
#include "domain/FieldValue.hpp"
#include "domain/Submission.hpp"
#include "domain/Task.hpp"
#include "infrastructure/IoSerializer.hpp"

namespace lancollect::application {

/**
 * @class SubmissionService
 * @brief Stores incoming files under the task's versioning policy and counts
 * them through the ingestion gate.
 *
 * Name allocation and the write happen inside one IoSerializer region, so
 * two concurrent submitters with the same identity always get distinct
 * versions.
 */
class SubmissionService {
public:
    /**
     * @struct FileSubmission
     * @brief A spreadsheet handed in by a contributor.
     */
    struct FileSubmission {
        std::string submitterName;
        std::string contact;
        std::string department;
        std::string originalFilename;   ///< Name on the contributor's side; gives the extension.
        std::string sourcePath;         ///< Local file holding the uploaded bytes.
        std::string clientAddress;
        std::vector<std::string> attachmentPaths;
    };

    /**
     * @struct DataSubmission
     * @brief One online form entry.
     */
    struct DataSubmission {
        std::string submitterName;
        std::string contact;
        std::string department;
        std::string clientAddress;
        domain::Record record;
    };

    /**
     * @param defaultExtension Used when the original file name has none;
     * normally the table store's extension so the file stays mergeable.
     */
    SubmissionService(std::shared_ptr<infrastructure::IoSerializer> ioSerializer,
                      std::shared_ptr<IngestionGate> gate,
                      std::string defaultExtension);

    /**
     * @brief Full intake of a spreadsheet: validate, store, attach, count.
     * If the gate refuses, the just-written files are removed again. In
     * Overwrite mode earlier versions are removed only after the gate has
     * accepted, so a refusal leaves the previous file in place.
     * @throws InvalidArgumentError, CapacityExceededError, IoFailureError
     */
    domain::Submission submitFile(const domain::Task& task, const FileSubmission& request);

    /**
     * @brief Full intake of a form entry, stored as versioned JSON.
     * @throws InvalidArgumentError, CapacityExceededError, IoFailureError
     */
    domain::Submission submitData(const domain::Task& task, const DataSubmission& request);

    /**
     * @brief Storage step only: writes sourcePath into the task folder under
     * "<template>-<name>-<contact>" and returns the stored path.
     * Does not touch the counter.
     */
    std::filesystem::path processSubmission(const domain::Task& task, const std::string& sourcePath,
                                            const std::string& submitterName, const std::string& contact,
                                            const std::string& department, const std::string& originalFilename);

    /**
     * @brief Stores an attachment in "<collection>/<name>-<contact>/" with the
     * "<stem>_v<N><ext>" grammar.
     */
    std::filesystem::path storeAttachment(const domain::Task& task, const std::string& sourcePath,
                                          const std::string& submitterName, const std::string& contact);

    /** @brief "<template>-<name>-<contact>" with each user segment sanitized. */
    static std::string BuildIdentityPrefix(const domain::Task& task, const std::string& submitterName,
                                           const std::string& contact);

private:
    /**
     * @struct PendingArtifact
     * @brief A written file not yet counted. In Overwrite mode the bytes sit
     * in a temp file beside target until commit().
     */
    struct PendingArtifact {
        std::filesystem::path folder;
        std::filesystem::path target;   ///< Final name; recorded in the submission.
        std::filesystem::path staged;   ///< Empty once the file is at target.
        std::string prefix;
        std::string ext;
    };

    PendingArtifact writeVersioned(const domain::Task& task, const std::string& prefix,
                                   const std::string& ext,
                                   const std::function<void(const std::filesystem::path&)>& write);
    PendingArtifact stageAttachment(const domain::Task& task, const std::string& sourcePath,
                                    const std::string& submitterName, const std::string& contact);
    /** @brief Overwrite mode: drops earlier versions and moves the staged file into place. */
    void commit(PendingArtifact& artifact);
    void discard(const PendingArtifact& artifact);
    std::string extensionOf(const std::string& originalFilename) const;

    std::shared_ptr<infrastructure::IoSerializer> m_ioSerializer;
    std::shared_ptr<IngestionGate> m_gate;
    std::string m_defaultExtension;
};

} // namespace lancollect::application
