/**
 * @file string_utils.hpp
 * @brief String helpers for command construction and log hygiene
 *
 * Provides static methods for:
 * - Basic manipulation (trim, case conversion, join, replace)
 * - POSIX shell quoting for arguments that end up in a guest shell
 * - Redaction of secrets before command lines reach a log
 *
 * All methods are static - no instantiation required.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace vmsandbox {
namespace utils {

class StringUtils {
public:
    /**
     * @brief Remove leading and trailing whitespace
     * @param str Input string
     * @return Trimmed copy
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Convert to lowercase (ASCII)
     * @param str Input string
     * @return Lowercase copy
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Join strings with delimiter
     * @param strings Strings to join
     * @param delimiter Separator placed between elements
     * @return Joined string
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    static std::string ReplaceAll(const std::string& str, const std::string& from, const std::string& to);

    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Quote a single argument for a POSIX shell
     *
     * Wraps @p arg in single quotes and rewrites embedded single quotes as
     * '\''. The result is always one shell word, whatever @p arg contains.
     *
     * @param arg Raw argument
     * @return Quoted argument
     */
    static std::string ShellQuote(const std::string& arg);

    /**
     * @brief Render an argv as a shell-like display string
     *
     * Arguments equal to @p secret are replaced by "<hidden>". Intended for
     * logs only, never for execution.
     */
    static std::string DescribeCommand(const std::vector<std::string>& argv,
                                       const std::string& secret = "");

    /**
     * @brief Replace every occurrence of @p secret with "<hidden>"
     *
     * Empty secrets leave the input unchanged.
     */
    static std::string Redact(const std::string& str, const std::string& secret);
};

} // namespace utils
} // namespace vmsandbox
