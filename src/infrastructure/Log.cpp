/**
 * @file Log.cpp
 * @brief Implementation of Log.
 */

#include "infrastructure/Log.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace lancollect::infrastructure {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_writeMutex; // Keeps lines from concurrent writers intact.

} // namespace

void Log::SetLevel(LogLevel level) {
    g_level = static_cast<int>(level);
}

LogLevel Log::GetLevel() {
    return static_cast<LogLevel>(g_level.load());
}

std::optional<LogLevel> Log::ParseLevel(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return std::tolower(c); });
    if (lower == "error") return LogLevel::Error;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "info") return LogLevel::Info;
    if (lower == "debug") return LogLevel::Debug;
    return std::nullopt;
}

void Log::Error(const std::string& tag, const std::string& message) { Write(LogLevel::Error, tag, message); }
void Log::Warn(const std::string& tag, const std::string& message) { Write(LogLevel::Warn, tag, message); }
void Log::Info(const std::string& tag, const std::string& message) { Write(LogLevel::Info, tag, message); }
void Log::Debug(const std::string& tag, const std::string& message) { Write(LogLevel::Debug, tag, message); }

void Log::Write(LogLevel level, const std::string& tag, const std::string& message) {
    if (static_cast<int>(level) > g_level.load()) return;

    std::lock_guard<std::mutex> lock(g_writeMutex);
    if (level <= LogLevel::Warn) {
        std::cerr << "[" << tag << "] " << message << std::endl;
    } else {
        std::cout << "[" << tag << "] " << message << std::endl;
    }
}

} // namespace lancollect::infrastructure
