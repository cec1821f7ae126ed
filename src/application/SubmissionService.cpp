/**
 * @file SubmissionService.cpp
 * @brief Implementation of SubmissionService.
 */

#include "application/SubmissionService.hpp"
#include "domain/DomainErrors.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/FilenameVersioner.hpp"
#include "infrastructure/JsonRecordReader.hpp"
#include "infrastructure/Log.hpp"
#include "infrastructure/PathUtils.hpp"
#include <chrono>

namespace fs = std::filesystem;
using lancollect::infrastructure::AtomicFileWriter;
using lancollect::infrastructure::FilenameVersioner;
using lancollect::infrastructure::Log;
using lancollect::infrastructure::PathUtils;

namespace lancollect::application {

namespace {

bool IsBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

void Require(const std::string& value, const std::string& field) {
    if (IsBlank(value)) {
        throw domain::InvalidArgumentError(field + " 不能为空");
    }
}

void RequireOpen(const domain::Task& task) {
    if (!task.isActive) {
        throw domain::InvalidArgumentError("任务已停用: " + task.title);
    }
}

} // namespace

SubmissionService::SubmissionService(std::shared_ptr<infrastructure::IoSerializer> ioSerializer,
                                     std::shared_ptr<IngestionGate> gate,
                                     std::string defaultExtension)
    : m_ioSerializer(std::move(ioSerializer)),
      m_gate(std::move(gate)),
      m_defaultExtension(std::move(defaultExtension)) {}

std::string SubmissionService::BuildIdentityPrefix(const domain::Task& task, const std::string& submitterName,
                                                   const std::string& contact) {
    std::string templateName = fs::path(task.templatePath).stem().string();
    if (templateName.empty()) {
        templateName = PathUtils::Sanitize(task.title);
    }
    return templateName + "-" + PathUtils::Sanitize(submitterName) + "-" + PathUtils::Sanitize(contact);
}

SubmissionService::PendingArtifact SubmissionService::writeVersioned(
    const domain::Task& task, const std::string& prefix, const std::string& ext,
    const std::function<void(const fs::path&)>& write) {
    fs::path folder(task.collectionPath);

    // Critical section: list -> next version -> write
    auto guard = m_ioSerializer->acquire(prefix);

    std::error_code ec;
    fs::create_directories(folder, ec);
    if (ec) {
        throw domain::IoFailureError(folder.string(), "cannot create collection folder: " + ec.message());
    }

    PendingArtifact artifact;
    artifact.folder = folder;
    artifact.prefix = prefix;
    artifact.ext = ext;

    if (task.versioningMode == domain::VersioningMode::AutoVersion) {
        int version = FilenameVersioner::NextVersion(folder, prefix, ext);
        artifact.target = folder / FilenameVersioner::BuildSubmissionName(
            prefix, version, std::chrono::system_clock::now(), ext);
        write(artifact.target);
        Log::Info("SubmissionService", "Stored " + artifact.target.filename().string());
        return artifact;
    }

    // Overwrite: earlier versions stay until the submission is accepted.
    artifact.target = folder / FilenameVersioner::BuildSubmissionName(
        prefix, 1, std::chrono::system_clock::now(), ext);
    artifact.staged = AtomicFileWriter::MakeTempPath(artifact.target);
    write(artifact.staged);
    Log::Debug("SubmissionService", "Staged " + artifact.target.filename().string());
    return artifact;
}

SubmissionService::PendingArtifact SubmissionService::stageAttachment(const domain::Task& task,
                                                                      const std::string& sourcePath,
                                                                      const std::string& submitterName,
                                                                      const std::string& contact) {
    fs::path source(sourcePath);
    std::string stem = PathUtils::Sanitize(source.stem().string());
    std::string ext = source.extension().string();
    fs::path folder = fs::path(task.collectionPath) /
                      (PathUtils::Sanitize(submitterName) + "-" + PathUtils::Sanitize(contact));

    auto guard = m_ioSerializer->acquire("attachment " + stem);

    std::error_code ec;
    fs::create_directories(folder, ec);
    if (ec) {
        throw domain::IoFailureError(folder.string(), "cannot create attachment folder: " + ec.message());
    }

    PendingArtifact artifact;
    artifact.folder = folder;
    artifact.prefix = stem;
    artifact.ext = ext;

    if (task.versioningMode == domain::VersioningMode::AutoVersion) {
        int version = FilenameVersioner::NextVersion(folder, stem, ext);
        artifact.target = folder / FilenameVersioner::BuildArtifactName(stem, version, ext);
        AtomicFileWriter::CopyFile(source, artifact.target);
        Log::Info("SubmissionService", "Stored attachment " + artifact.target.string());
        return artifact;
    }

    artifact.target = folder / FilenameVersioner::BuildArtifactName(stem, 1, ext);
    artifact.staged = AtomicFileWriter::MakeTempPath(artifact.target);
    AtomicFileWriter::CopyFile(source, artifact.staged);
    return artifact;
}

void SubmissionService::commit(PendingArtifact& artifact) {
    if (artifact.staged.empty()) return;

    auto guard = m_ioSerializer->acquire(artifact.prefix);
    FilenameVersioner::DeleteForOverwrite(artifact.folder, artifact.prefix, artifact.ext, artifact.target);
    AtomicFileWriter::ReplaceWith(artifact.staged, artifact.target);
    artifact.staged.clear();
    Log::Info("SubmissionService", "Stored " + artifact.target.filename().string());
}

void SubmissionService::discard(const PendingArtifact& artifact) {
    const fs::path& path = artifact.staged.empty() ? artifact.target : artifact.staged;
    auto guard = m_ioSerializer->acquire("discard " + path.filename().string());
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        Log::Error("SubmissionService", "Could not remove refused artifact " + path.string() + ": " + ec.message());
    } else {
        Log::Info("SubmissionService", "Removed refused artifact " + path.filename().string());
    }
}

std::string SubmissionService::extensionOf(const std::string& originalFilename) const {
    std::string ext = fs::path(originalFilename).extension().string();
    return ext.empty() ? m_defaultExtension : ext;
}

fs::path SubmissionService::processSubmission(const domain::Task& task, const std::string& sourcePath,
                                              const std::string& submitterName, const std::string& contact,
                                              const std::string& department, const std::string& originalFilename) {
    Require(submitterName, "Submitter");
    Require(contact, "Contact");
    Require(department, "Department");
    Require(originalFilename, "OriginalFileName");

    std::string prefix = BuildIdentityPrefix(task, submitterName, contact);
    PendingArtifact artifact = writeVersioned(task, prefix, extensionOf(originalFilename),
                                              [&](const fs::path& target) {
        AtomicFileWriter::CopyFile(sourcePath, target);
    });
    commit(artifact);
    return artifact.target;
}

fs::path SubmissionService::storeAttachment(const domain::Task& task, const std::string& sourcePath,
                                            const std::string& submitterName, const std::string& contact) {
    PendingArtifact artifact = stageAttachment(task, sourcePath, submitterName, contact);
    commit(artifact);
    return artifact.target;
}

domain::Submission SubmissionService::submitFile(const domain::Task& task, const FileSubmission& request) {
    RequireOpen(task);
    Require(request.submitterName, "Submitter");
    Require(request.contact, "Contact");
    Require(request.department, "Department");
    Require(request.originalFilename, "OriginalFileName");
    if (task.isFull()) {
        throw domain::CapacityExceededError(task.id);
    }

    std::string prefix = BuildIdentityPrefix(task, request.submitterName, request.contact);
    std::vector<PendingArtifact> pending;
    pending.push_back(writeVersioned(task, prefix, extensionOf(request.originalFilename),
                                     [&](const fs::path& target) {
        AtomicFileWriter::CopyFile(request.sourcePath, target);
    }));

    domain::SubmissionData data;
    data.submitterName = request.submitterName;
    data.contact = request.contact;
    data.department = request.department;
    data.originalFilename = request.originalFilename;
    data.storedFilename = pending.front().target.filename().string();
    data.clientAddress = request.clientAddress;

    domain::Submission submission;
    try {
        for (const auto& path : request.attachmentPaths) {
            pending.push_back(stageAttachment(task, path, request.submitterName, request.contact));
            data.attachments.push_back(pending.back().target.string());
        }
        submission = m_gate->recordSubmission(task.id, data);
    } catch (const domain::DomainError& e) {
        Log::Warn("SubmissionService", std::string("Submission refused: ") + e.what());
        for (const auto& artifact : pending) discard(artifact);
        throw;
    }

    for (auto& artifact : pending) commit(artifact);
    return submission;
}

domain::Submission SubmissionService::submitData(const domain::Task& task, const DataSubmission& request) {
    RequireOpen(task);
    Require(request.submitterName, "Submitter");
    Require(request.contact, "Contact");
    Require(request.department, "Department");
    if (request.record.empty()) {
        throw domain::InvalidArgumentError("Submitted data is empty");
    }
    if (task.isFull()) {
        throw domain::CapacityExceededError(task.id);
    }

    std::string prefix = BuildIdentityPrefix(task, request.submitterName, request.contact);
    std::string content = infrastructure::JsonRecordReader::ToJson(request.record).dump(2);
    PendingArtifact artifact = writeVersioned(task, prefix, ".json", [&](const fs::path& target) {
        AtomicFileWriter::WriteText(target, content);
    });

    domain::SubmissionData data;
    data.submitterName = request.submitterName;
    data.contact = request.contact;
    data.department = request.department;
    data.originalFilename = artifact.target.filename().string();
    data.storedFilename = artifact.target.filename().string();
    data.clientAddress = request.clientAddress;

    domain::Submission submission;
    try {
        submission = m_gate->recordSubmission(task.id, data);
    } catch (const domain::DomainError& e) {
        Log::Warn("SubmissionService", std::string("Submission refused: ") + e.what());
        discard(artifact);
        throw;
    }

    commit(artifact);
    return submission;
}

} // namespace lancollect::application
