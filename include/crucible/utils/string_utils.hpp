/**
 * @file string_utils.hpp
 * @brief String helpers shared by detectors, parsers and reporters
 *
 * Small, allocation-friendly routines for trimming, splitting and inspecting
 * captured test-runner output and repository manifest files.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace crucible {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string manipulation utilities
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * for (const auto& line : StringUtils::SplitLines(capture.stdout_output)) {
 *     if (StringUtils::StartsWith(StringUtils::Trim(line), "Tests run:")) {
 *         // ...
 *     }
 * }
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * String Manipulation
     ***************************************************************************/

    /**
     * @brief Remove leading and trailing whitespace
     * @param str Input string
     * @return Trimmed copy
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Convert to lowercase (ASCII only)
     * @param str Input string
     * @return Lowercase copy
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter
     *
     * Empty fields are preserved, so `Split("a,,b", ',')` yields three entries.
     *
     * @param str Input string
     * @param delimiter Delimiter character
     * @return Vector of fields
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Split text into lines
     *
     * Accepts `\n` and `\r\n` line endings. Carriage-return progress redraws
     * (`\r` without `\n`) are treated as line breaks too, which is how most
     * test runners repaint their progress bars.
     *
     * @param text Captured output
     * @return Vector of lines without terminators
     */
    static std::vector<std::string> SplitLines(const std::string& text);

    /**
     * @brief Join strings with delimiter
     * @param strings Strings to join
     * @param delimiter Separator
     * @return Joined string
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    /***************************************************************************
     * String Inspection
     ***************************************************************************/

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Case-insensitive substring search
     * @param str Haystack
     * @param substring Needle
     * @return true if found ignoring ASCII case
     */
    static bool ContainsIgnoreCase(const std::string& str, const std::string& substring);

    /***************************************************************************
     * Output Sanitization
     ***************************************************************************/

    /**
     * @brief Strip ANSI escape sequences (colors, cursor movement)
     *
     * Jest, Vitest, Gradle and cargo colorize summaries even when stdout is
     * a pipe; patterns are matched against the stripped text.
     *
     * @param str Raw terminal output
     * @return Output without CSI/OSC escape sequences
     */
    static std::string StripAnsi(const std::string& str);

    /**
     * @brief Truncate string to maximum length
     * @param str Input string
     * @param max_length Maximum length including ellipsis
     * @param ellipsis Suffix appended when truncated
     * @return Truncated string
     */
    static std::string Truncate(const std::string& str, std::size_t max_length,
                                const std::string& ellipsis = "...");

    /**
     * @brief Quote a string for POSIX sh
     *
     * Wraps in single quotes and escapes embedded single quotes, so the result
     * is always one word for `sh -c`.
     *
     * @param str Raw argument
     * @return Shell-safe quoted argument
     */
    static std::string ShellQuote(const std::string& str);
};

} // namespace utils
} // namespace crucible
