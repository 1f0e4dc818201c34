/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "crucible/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace crucible {
namespace utils {

// ============================================================================
// STRING MANIPULATION
// ============================================================================

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }

    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

// Convert to lowercase
std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Split string by delimiter
std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream stream(str);

    while (std::getline(stream, token, delimiter)) {
        tokens.push_back(token);
    }

    // getline drops a trailing empty field
    if (!str.empty() && str.back() == delimiter) {
        tokens.emplace_back();
    }

    return tokens;
}

// Split into lines, treating bare CR as a line break
std::vector<std::string> StringUtils::SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\n') {
            lines.push_back(current);
            current.clear();
        } else if (c == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                continue;
            }
            lines.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        lines.push_back(current);
    }

    return lines;
}

// Join strings
std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < strings.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << strings[i];
    }
    return oss.str();
}

// ============================================================================
// STRING INSPECTION
// ============================================================================

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

bool StringUtils::ContainsIgnoreCase(const std::string& str, const std::string& substring) {
    return ToLower(str).find(ToLower(substring)) != std::string::npos;
}

// ============================================================================
// OUTPUT SANITIZATION
// ============================================================================

// Strip ANSI escape sequences
std::string StringUtils::StripAnsi(const std::string& str) {
    std::string result;
    result.reserve(str.size());

    for (std::size_t i = 0; i < str.size(); ++i) {
        if (str[i] != '\x1b') {
            result += str[i];
            continue;
        }

        if (i + 1 >= str.size()) {
            break;
        }

        char kind = str[i + 1];
        if (kind == '[') {
            // CSI: ESC [ params final-byte(0x40-0x7E)
            std::size_t j = i + 2;
            while (j < str.size() && !(str[j] >= 0x40 && str[j] <= 0x7E)) {
                ++j;
            }
            i = j;
        } else if (kind == ']') {
            // OSC: terminated by BEL or ESC '\'
            std::size_t j = i + 2;
            while (j < str.size() && str[j] != '\x07' &&
                   !(str[j] == '\x1b' && j + 1 < str.size() && str[j + 1] == '\\')) {
                ++j;
            }
            i = (j < str.size() && str[j] == '\x1b') ? j + 1 : j;
        } else {
            // Two-byte escape
            i += 1;
        }
    }

    return result;
}

// Truncate with ellipsis
std::string StringUtils::Truncate(const std::string& str, std::size_t max_length,
                                  const std::string& ellipsis) {
    if (str.length() <= max_length) {
        return str;
    }

    if (max_length <= ellipsis.length()) {
        return str.substr(0, max_length);
    }

    return str.substr(0, max_length - ellipsis.length()) + ellipsis;
}

// Single-quote for sh
std::string StringUtils::ShellQuote(const std::string& str) {
    std::string quoted = "'";
    for (char c : str) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace utils
} // namespace crucible
