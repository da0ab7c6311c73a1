/**
 * @file string_utils.hpp
 * @brief String helpers shared by the sandbox host and launcher
 *
 * Trimming, splitting, joining, shell quoting for command logging, and
 * demangling of exception type names for child error traces.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace warden {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string utilities
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * auto parts = StringUtils::Split("/opt/lib:/usr/lib", ':');
 * std::string cmdline = StringUtils::JoinShellQuoted({"bwrap", "--bind", "/a b", "/x"});
 * // bwrap --bind '/a b' /x
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic Manipulation
     ***************************************************************************/

    /**
     * @brief Remove leading and trailing whitespace
     */
    static std::string Trim(const std::string& str);

    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter
     *
     * Empty tokens are skipped, so "a::b" yields {"a", "b"}.
     *
     * @param str Input string
     * @param delimiter Delimiter character
     * @return Non-empty tokens
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Join strings with delimiter
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    static std::string ReplaceAll(const std::string& str, const std::string& from, const std::string& to);

    static bool StartsWith(const std::string& str, const std::string& prefix);

    /**
     * @brief Truncate string to maximum length
     *
     * @param str Input string
     * @param max_length Maximum length including the ellipsis
     * @param ellipsis Suffix appended when truncated
     */
    static std::string Truncate(const std::string& str, std::size_t max_length,
                                const std::string& ellipsis = "...");

    /***************************************************************************
     * Command Lines
     ***************************************************************************/

    /**
     * @brief Quote a single argument for display in a POSIX shell
     *
     * Arguments made only of safe characters are returned unchanged; others are
     * wrapped in single quotes with embedded quotes escaped.
     */
    static std::string ShellQuote(const std::string& arg);

    /**
     * @brief Render an argv vector as a copy-pastable shell command line
     */
    static std::string JoinShellQuoted(const std::vector<std::string>& argv);

    /***************************************************************************
     * Diagnostics
     ***************************************************************************/

    /**
     * @brief Demangle a C++ type name (typeid(...).name())
     * @return Readable name, or the input when demangling fails
     */
    static std::string Demangle(const char* mangled);
};

} // namespace utils
} // namespace warden
