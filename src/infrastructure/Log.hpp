/**
 * @file Log.hpp
 * @brief Tagged console logging with a process-wide verbosity switch.
 *
 * Lines look like "[Component] message". Info and debug go to stdout,
 * warnings and errors to stderr.
 */

#pragma once

#include <optional>
#include <string>

namespace lancollect::infrastructure {

enum class LogLevel {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

class Log {
public:
    static void SetLevel(LogLevel level);
    static LogLevel GetLevel();

    /** @brief Parses "error", "warn", "info", "debug"; nullopt otherwise. */
    static std::optional<LogLevel> ParseLevel(const std::string& text);

    static void Error(const std::string& tag, const std::string& message);
    static void Warn(const std::string& tag, const std::string& message);
    static void Info(const std::string& tag, const std::string& message);
    static void Debug(const std::string& tag, const std::string& message);

private:
    static void Write(LogLevel level, const std::string& tag, const std::string& message);
};

} // namespace lancollect::infrastructure
