/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace lancollect::infrastructure {

namespace fs = std::filesystem;

namespace {

std::string LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "error";
        case LogLevel::Warn: return "warn";
        case LogLevel::Debug: return "debug";
        default: return "info";
    }
}

std::string Resolve(const fs::path& base, const std::string& value) {
    fs::path p(value);
    if (p.is_relative()) p = base / p;
    return p.lexically_normal().string();
}

} // namespace

AppConfig ConfigLoader::Defaults() {
    AppConfig config;
    fs::path root = PathUtils::GetAppDataDir();
    config.dataRoot = root.string();
    config.databasePath = (root / "lancollect.db").string();
    config.collectionRoot = (root / "collections").string();
    return config;
}

AppConfig ConfigLoader::Load(const std::string& configPath) {
    AppConfig config = Defaults();
    fs::path path(configPath);
    if (!fs::exists(path)) {
        Log::Debug("ConfigLoader", "No settings at " + configPath + ", using defaults");
        return config;
    }

    try {
        std::ifstream f(path);
        nlohmann::json j;
        f >> j;

        fs::path base = path.has_parent_path() ? path.parent_path() : fs::current_path();
        bool rootGiven = false;

        if (j.contains("dataRoot")) {
            config.dataRoot = Resolve(base, j["dataRoot"].get<std::string>());
            config.databasePath = (fs::path(config.dataRoot) / "lancollect.db").string();
            config.collectionRoot = (fs::path(config.dataRoot) / "collections").string();
            rootGiven = true;
        }
        if (j.contains("databasePath")) {
            config.databasePath = Resolve(base, j["databasePath"].get<std::string>());
        }
        if (j.contains("collectionRoot")) {
            config.collectionRoot = Resolve(base, j["collectionRoot"].get<std::string>());
        }
        config.defaultSeparator = j.value("defaultSeparator", config.defaultSeparator);
        config.defaultHeaderRowIndex = j.value("defaultHeaderRowIndex", config.defaultHeaderRowIndex);
        config.busyTimeoutMs = j.value("busyTimeoutMs", config.busyTimeoutMs);

        if (j.contains("logLevel")) {
            auto level = Log::ParseLevel(j["logLevel"].get<std::string>());
            if (level) {
                config.logLevel = *level;
            } else {
                Log::Warn("ConfigLoader", "Unknown logLevel in " + configPath + ", keeping 'info'");
            }
        }
        if (config.defaultHeaderRowIndex < 0) config.defaultHeaderRowIndex = 0;
        if (config.busyTimeoutMs < 0) config.busyTimeoutMs = 0;

        Log::Debug("ConfigLoader", std::string("Loaded ") + configPath + (rootGiven ? " (custom data root)" : ""));
    } catch (const std::exception& e) {
        Log::Warn("ConfigLoader", "Error reading " + configPath + ": " + e.what() + "; using defaults");
        return Defaults();
    }

    return config;
}

void ConfigLoader::Save(const std::string& configPath, const AppConfig& config) {
    nlohmann::json j;
    j["dataRoot"] = config.dataRoot;
    j["databasePath"] = config.databasePath;
    j["collectionRoot"] = config.collectionRoot;
    j["defaultSeparator"] = config.defaultSeparator;
    j["defaultHeaderRowIndex"] = config.defaultHeaderRowIndex;
    j["logLevel"] = LevelName(config.logLevel);
    j["busyTimeoutMs"] = config.busyTimeoutMs;

    AtomicFileWriter::WriteText(configPath, j.dump(4));
    Log::Info("ConfigLoader", "Saved settings to " + configPath);
}

} // namespace lancollect::infrastructure
