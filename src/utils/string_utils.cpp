/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "warden/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <sstream>

#include <cxxabi.h>

namespace warden {
namespace utils {

// ============================================================================
// BASIC MANIPULATION
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {  // Skip empty tokens
            tokens.push_back(token);
        }
    }

    return tokens;
}

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

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

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

// ============================================================================
// COMMAND LINES
// ============================================================================
// Used only to render commands for logs and error messages; processes are
// always spawned from argv vectors, never through a shell string.

std::string StringUtils::ShellQuote(const std::string& arg) {
    if (arg.empty()) {
        return "''";
    }

    bool safe = std::all_of(arg.begin(), arg.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.' ||
               c == '/' || c == '=' || c == ':' || c == ',' || c == '+' || c == '@';
    });
    if (safe) {
        return arg;
    }

    return "'" + ReplaceAll(arg, "'", "'\\''") + "'";
}

std::string StringUtils::JoinShellQuoted(const std::vector<std::string>& argv) {
    std::vector<std::string> quoted;
    quoted.reserve(argv.size());
    for (const auto& arg : argv) {
        quoted.push_back(ShellQuote(arg));
    }
    return Join(quoted, " ");
}

// ============================================================================
// DIAGNOSTICS
// ============================================================================

std::string StringUtils::Demangle(const char* mangled) {
    if (mangled == nullptr) {
        return "unknown";
    }

    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);

    if (status == 0 && demangled) {
        return demangled.get();
    }
    return mangled;
}

} // namespace utils
} // namespace warden
