/**
 * @file AtomicFileWriter.cpp
 * @brief Implementation of AtomicFileWriter.
 */

#include "infrastructure/AtomicFileWriter.hpp"
#include "domain/DomainErrors.hpp"
#include "infrastructure/Log.hpp"
#include <atomic>
#include <chrono>
#include <fstream>

namespace fs = std::filesystem;

namespace lancollect::infrastructure {

namespace {

std::atomic<unsigned long> g_tempSequence{0};

} // namespace

fs::path AtomicFileWriter::MakeTempPath(const fs::path& target) {
    // 1. Ensure directory exists
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw domain::IoFailureError(target.parent_path().string(), "cannot create directory: " + ec.message());
        }
    }

    // filename.<timestamp>-<seq>.tmp, unique per operation
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = target;
    tempPath += "." + std::to_string(timestamp) + "-" + std::to_string(g_tempSequence++) + ".tmp";
    return tempPath;
}

void AtomicFileWriter::DiscardTemp(const fs::path& temp) {
    std::error_code ec;
    fs::remove(temp, ec);
    if (ec) {
        Log::Warn("AtomicFileWriter", "Could not remove temp file " + temp.string() + ": " + ec.message());
    }
}

void AtomicFileWriter::ReplaceWith(const fs::path& temp, const fs::path& target) {
    std::error_code ec;
    // Previous output goes first, then the temp file takes its name.
    if (fs::exists(target, ec)) {
        fs::remove(target, ec);
        if (ec) {
            DiscardTemp(temp);
            throw domain::IoFailureError(target.string(), "cannot remove previous file: " + ec.message());
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        DiscardTemp(temp);
        throw domain::IoFailureError(target.string(), "rename failed: " + ec.message());
    }
}

void AtomicFileWriter::WriteText(const fs::path& target, const std::string& content) {
    fs::path tempPath = MakeTempPath(target);

    {
        std::ofstream ofs(tempPath, std::ios::binary);
        if (!ofs.is_open()) {
            throw domain::IoFailureError(tempPath.string(), "cannot open temp file");
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            DiscardTemp(tempPath);
            throw domain::IoFailureError(tempPath.string(), "write failed");
        }
    }

    ReplaceWith(tempPath, target);
}

void AtomicFileWriter::CopyFile(const fs::path& source, const fs::path& target) {
    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        throw domain::IoFailureError(source.string(), "source file not found");
    }

    fs::path tempPath = MakeTempPath(target);
    fs::copy_file(source, tempPath, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        DiscardTemp(tempPath);
        throw domain::IoFailureError(source.string(), "copy failed: " + ec.message());
    }

    ReplaceWith(tempPath, target);
}

} // namespace lancollect::infrastructure
