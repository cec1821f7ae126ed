/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application configuration (settings.json).
 *
 * Missing files or keys fall back to defaults so a fresh machine works
 * without any setup; a malformed file is reported and ignored.
 */

#pragma once

#include <string>
#include "infrastructure/Log.hpp"

namespace lancollect::infrastructure {

/**
 * @struct AppConfig
 * @brief Runtime settings shared by the service container and the CLI.
 */
struct AppConfig {
    std::string dataRoot;              ///< Base directory for the database and collections.
    std::string databasePath;          ///< SQLite file; defaults to <dataRoot>/lancollect.db
    std::string collectionRoot;        ///< Defaults to <dataRoot>/collections
    std::string defaultSeparator = "|";///< Dedup key separator for tabular merges.
    int defaultHeaderRowIndex = 0;
    LogLevel logLevel = LogLevel::Info;
    int busyTimeoutMs = 5000;
};

class ConfigLoader {
public:
    /** @brief Defaults rooted at PathUtils::GetAppDataDir(). */
    static AppConfig Defaults();

    /**
     * @brief Reads configPath over the defaults.
     * Relative dataRoot/databasePath/collectionRoot are resolved against the
     * directory holding the config file.
     */
    static AppConfig Load(const std::string& configPath);

    /**
     * @brief Writes the configuration back atomically.
     * @throws IoFailureError if the file cannot be written.
     */
    static void Save(const std::string& configPath, const AppConfig& config);
};

} // namespace lancollect::infrastructure
