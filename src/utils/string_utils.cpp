/**
 * @file string_utils.cpp
 * @brief Implementation of string manipulation and quoting utilities
 *
 * Guest commands are passed to the control mechanism as argv vectors, so most
 * arguments never meet a shell. The exceptions are the document inspection
 * heredoc and the display strings written to logs; ShellQuote() and Redact()
 * cover those two cases.
 *
 * @date 2025
 */

#include "vmsandbox/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace vmsandbox {
namespace utils {

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

// Convert to lowercase
std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

// Join strings
std::string StringUtils::Join(const std::vector<std::string>& strings,
                             const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

// Replace all occurrences
std::string StringUtils::ReplaceAll(const std::string& str,
                                   const std::string& from,
                                   const std::string& to) {
    if (from.empty()) {
        return str;
    }

    std::string result = str;
    std::size_t pos = 0;

    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }

    return result;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

std::string StringUtils::ShellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string StringUtils::DescribeCommand(const std::vector<std::string>& argv,
                                         const std::string& secret) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            oss << ' ';
        }

        const std::string& arg = argv[i];
        if (!secret.empty() && arg == secret) {
            oss << "<hidden>";
            continue;
        }

        // Only quote when a reader could misread the word boundaries
        bool plain = !arg.empty() &&
            std::all_of(arg.begin(), arg.end(), [](unsigned char c) {
                return std::isalnum(c) || c == '/' || c == '.' || c == '-' ||
                       c == '_' || c == ':' || c == '=' || c == '+' || c == ',';
            });
        oss << (plain ? arg : ShellQuote(arg));
    }
    return Redact(oss.str(), secret);
}

std::string StringUtils::Redact(const std::string& str, const std::string& secret) {
    if (secret.empty()) {
        return str;
    }
    return ReplaceAll(str, secret, "<hidden>");
}

} // namespace utils
} // namespace vmsandbox
