#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstdio>
#include <cctype>

namespace utils {

// rclone "remote:path" notation; absolute, relative and drive-letter paths are local
inline bool isRemotePath(const std::string& path) {
    if (path.empty() || path[0] == '/' || path[0] == '.') {
        return false;
    }
    auto colon = path.find(':');
    if (colon == std::string::npos) {
        return false;
    }
    if (colon == 1 && std::isalpha(static_cast<unsigned char>(path[0])) &&
        path.size() > 2 && (path[2] == '\\' || path[2] == '/')) {
        return false;
    }
    // a slash before the colon means a local path containing ':'
    return path.find('/') == std::string::npos || path.find('/') > colon;
}

inline std::string formatBytes(uint64_t bytes) {
    const double kib = 1024.0;
    char buffer[32];
    if (bytes >= kib * kib * kib * kib) {
        snprintf(buffer, sizeof(buffer), "%.2f TB", bytes / (kib * kib * kib * kib));
    } else if (bytes >= kib * kib * kib) {
        snprintf(buffer, sizeof(buffer), "%.2f GB", bytes / (kib * kib * kib));
    } else if (bytes >= kib * kib) {
        snprintf(buffer, sizeof(buffer), "%.2f MB", bytes / (kib * kib));
    } else if (bytes >= kib) {
        snprintf(buffer, sizeof(buffer), "%.2f KB", bytes / kib);
    } else {
        snprintf(buffer, sizeof(buffer), "%llu B", static_cast<unsigned long long>(bytes));
    }
    return buffer;
}

inline std::string joinCommand(const std::vector<std::string>& argv) {
    std::string result;
    for (const auto& arg : argv) {
        if (!result.empty()) {
            result += ' ';
        }
        if (arg.find_first_of(" \t'\"") != std::string::npos) {
            result += "'" + arg + "'";
        } else {
            result += arg;
        }
    }
    return result;
}

inline std::string toLower(std::string text) {
    for (auto& c : text) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return text;
}

// Plain decimal digits only; signs, whitespace and trailing text are rejected
inline bool parseUnsigned(const std::string& text, uint64_t& value) {
    if (text.empty() || text.size() > 20) {
        return false;
    }
    uint64_t result = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (result > (UINT64_MAX - digit) / 10) {
            return false;
        }
        result = result * 10 + digit;
    }
    value = result;
    return true;
}

} // namespace utils
