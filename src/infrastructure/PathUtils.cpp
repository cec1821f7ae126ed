#include "infrastructure/PathUtils.hpp"
#include <cstdint>
#include <cstdlib>
#include <filesystem>

namespace lancollect::infrastructure {

namespace fs = std::filesystem;

namespace {

/**
 * @brief Decodes one UTF-8 sequence at pos; advances pos past it.
 * Malformed bytes decode as U+FFFD and consume one byte.
 */
uint32_t NextCodePoint(const std::string& s, size_t& pos) {
    unsigned char c = static_cast<unsigned char>(s[pos]);
    int length = 1;
    uint32_t cp = c;
    if (c >= 0xF0 && c <= 0xF4) { length = 4; cp = c & 0x07; }
    else if (c >= 0xE0) { length = 3; cp = c & 0x0F; }
    else if (c >= 0xC2 && c < 0xE0) { length = 2; cp = c & 0x1F; }
    else if (c >= 0x80) { ++pos; return 0xFFFD; }

    if (pos + length > s.size()) { ++pos; return 0xFFFD; }
    for (int i = 1; i < length; ++i) {
        unsigned char cc = static_cast<unsigned char>(s[pos + i]);
        if ((cc & 0xC0) != 0x80) { ++pos; return 0xFFFD; }
        cp = (cp << 6) | (cc & 0x3F);
    }
    pos += length;
    return cp;
}

bool IsInvalidFileNameChar(uint32_t cp) {
    if (cp < 0x20) return true;
    switch (cp) {
        case '<': case '>': case ':': case '"': case '/': case '\\': case '|': case '?': case '*':
            return true;
        default:
            return false;
    }
}

bool IsKept(uint32_t cp) {
    if (cp >= 0x4E00 && cp <= 0x9FA5) return true;
    if ((cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z') || (cp >= '0' && cp <= '9')) return true;
    return cp == '-' || cp == '_';
}

} // namespace

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetAppDataDir() {
    return GetDataHome() / "LanCollect";
}

fs::path PathUtils::GetDefaultConfigPath() {
    return GetConfigHome() / "LanCollect" / "settings.json";
}

std::string PathUtils::Sanitize(const std::string& input) {
    if (input.find_first_not_of(" \t\r\n") == std::string::npos) return "Unknown";

    // Trailing dots are invalid at the end of a file name.
    std::string body = input;
    bool trailingDots = false;
    while (!body.empty() && body.back() == '.') {
        body.pop_back();
        trailingDots = true;
    }

    std::string out;
    bool inInvalidRun = false;
    size_t pos = 0;
    while (pos < body.size()) {
        size_t begin = pos;
        uint32_t cp = NextCodePoint(body, pos);
        if (IsInvalidFileNameChar(cp)) {
            if (!inInvalidRun) out += '_';
            inInvalidRun = true;
            continue;
        }
        inInvalidRun = false;
        if (IsKept(cp)) out.append(body, begin, pos - begin);
    }
    if (trailingDots && !inInvalidRun) out += '_';

    return out.empty() ? "Unknown" : out;
}

fs::path PathUtils::BuildCollectionPath(const fs::path& root, const std::string& title,
                                        const std::string& slug, domain::TaskType type) {
    const char* leaf = type == domain::TaskType::DataCollection ? "在线填表" : "文件收集";
    return root / Sanitize(title) / Sanitize(slug) / leaf;
}

} // namespace lancollect::infrastructure
