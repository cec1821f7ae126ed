/**
 * @file FilenameVersioner.cpp
 * @brief Implementation of FilenameVersioner.
 */

#include "infrastructure/FilenameVersioner.hpp"
#include "domain/DomainErrors.hpp"
#include "infrastructure/Log.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace lancollect::infrastructure {

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

bool StartsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::vector<fs::path> FilenameVersioner::ListFiles(const fs::path& folder) {
    std::vector<fs::path> files;
    std::error_code ec;
    fs::directory_iterator it(folder, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code statEc;
        if (it->is_regular_file(statEc)) files.push_back(it->path());
    }
    if (ec) {
        throw domain::IoFailureError(folder.string(), "cannot list folder: " + ec.message());
    }
    return files;
}

std::string FilenameVersioner::BuildArtifactName(const std::string& prefix, int version, const std::string& ext) {
    return prefix + "_v" + std::to_string(version) + ext;
}

std::string FilenameVersioner::BuildSubmissionName(const std::string& prefix, int version,
                                                   TimePoint timestamp, const std::string& ext) {
    return prefix + "_v" + std::to_string(version) + "-" + FormatTimestamp(timestamp) + ext;
}

std::string FilenameVersioner::EscapeRegex(const std::string& text) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text) {
        if (special.find(c) != std::string::npos) out += '\\';
        out += c;
    }
    return out;
}

std::optional<int> FilenameVersioner::ParseVersion(const std::string& stem, const std::string& prefix) {
    std::regex pattern("^" + EscapeRegex(prefix) + R"(_v(\d+)(-\d{8}-\d{6})?$)");
    std::smatch match;
    if (!std::regex_match(stem, match, pattern)) return std::nullopt;

    try {
        int version = std::stoi(match[1].str());
        if (version <= 0) return std::nullopt;
        return version;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

bool FilenameVersioner::HasExtension(const std::string& filename, const std::string& ext) {
    if (filename.size() < ext.size()) return false;
    return ToLower(filename.substr(filename.size() - ext.size())) == ToLower(ext);
}

int FilenameVersioner::NextVersion(const fs::path& folder, const std::string& prefix, const std::string& ext) {
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) return 1;

    int maxVersion = 0;
    const std::string listPrefix = prefix + "_v";
    for (const auto& path : ListFiles(folder)) {
        std::string filename = path.filename().string();
        if (!StartsWith(filename, listPrefix) || !HasExtension(filename, ext)) continue;

        std::string stem = filename.substr(0, filename.size() - ext.size());
        auto version = ParseVersion(stem, prefix);
        if (!version) {
            Log::Debug("FilenameVersioner", "Ignoring non-conforming file: " + filename);
            continue;
        }
        maxVersion = std::max(maxVersion, *version);
    }
    return maxVersion + 1;
}

int FilenameVersioner::DeleteForOverwrite(const fs::path& folder, const std::string& prefix, const std::string& ext,
                                          const fs::path& keep) {
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) return 0;

    std::vector<fs::path> doomed;
    for (const auto& path : ListFiles(folder)) {
        std::string filename = path.filename().string();
        if (!keep.empty() && filename == keep.filename().string()) continue;
        if (StartsWith(filename, prefix) && HasExtension(filename, ext)) {
            doomed.push_back(path);
        }
    }

    for (const auto& path : doomed) {
        fs::remove(path, ec);
        if (ec) {
            throw domain::IoFailureError(path.string(), ec.message());
        }
        Log::Info("FilenameVersioner", "Removed previous version: " + path.filename().string());
    }
    return static_cast<int>(doomed.size());
}

std::string FilenameVersioner::FormatTimestamp(TimePoint timestamp) {
    std::time_t t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y%m%d-%H%M%S");
    return ss.str();
}

std::optional<FilenameVersioner::TimePoint> FilenameVersioner::ParseTimestamp(const std::string& date,
                                                                              const std::string& time) {
    std::tm tm{};
    std::istringstream ss(date + time);
    ss >> std::get_time(&tm, "%Y%m%d%H%M%S");
    if (ss.fail()) return std::nullopt;
    tm.tm_isdst = -1;
    std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(t);
}

std::optional<domain::StoredArtifact> FilenameVersioner::ParseSubmissionName(const fs::path& path) {
    static const std::regex grammar(R"(^(.+)-(.+)-(.+)_v(\d+)-(\d{8})-(\d{6})$)");

    std::string stem = path.stem().string();
    std::smatch match;
    if (!std::regex_match(stem, match, grammar)) return std::nullopt;

    auto timestamp = ParseTimestamp(match[5].str(), match[6].str());
    if (!timestamp) return std::nullopt;

    domain::StoredArtifact artifact;
    artifact.path = path.string();
    artifact.filename = path.filename().string();
    artifact.templateName = match[1].str();
    artifact.submitterName = match[2].str();
    artifact.contact = match[3].str();
    try {
        artifact.version = std::stoi(match[4].str());
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    artifact.timestamp = *timestamp;
    artifact.parsed = true;
    return artifact;
}

} // namespace lancollect::infrastructure
