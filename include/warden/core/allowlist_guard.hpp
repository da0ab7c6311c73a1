/**
 * @file allowlist_guard.hpp
 * @brief File access capability for children without OS filesystem isolation
 *
 * The launcher builds one guard per request and routes every file access it
 * performs on behalf of user code through it; plugin code receives it through
 * its CallContext. Under backends that already isolate the filesystem the
 * guard is constructed permissive and only forwards.
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace warden {
namespace core {

/**
 * @class AllowlistGuard
 * @brief Subpath check against a fixed set of allowed roots
 *
 * Paths are resolved with std::filesystem::weakly_canonical, so symlinks and
 * ".." segments cannot escape a root. Comparison is component-wise:
 * "/work/a" does not allow "/work/ab".
 *
 * **Usage Example**:
 * @code
 * AllowlistGuard guard({"/home/me/project", "/usr/share/zoneinfo"});
 * guard.Check("/home/me/project/data.csv");   // ok
 * guard.ReadFile("/etc/passwd");              // throws SecurityViolation
 * @endcode
 */
class AllowlistGuard {
public:
    /**
     * @brief Enforcing guard
     * @param allowed_roots Directories (or files) whose subtrees are accessible
     */
    explicit AllowlistGuard(std::vector<std::filesystem::path> allowed_roots);

    /// Guard that allows everything
    static AllowlistGuard Permissive();

    bool enforcing() const { return enforcing_; }
    const std::vector<std::filesystem::path>& roots() const { return roots_; }

    /**
     * @brief Whether a path resolves inside an allowed root
     */
    bool IsAllowed(const std::filesystem::path& path) const;

    /**
     * @brief Throwing form of IsAllowed
     * @return Resolved absolute path
     * @throws SecurityViolation "Access to file <path> is denied (Sandboxed)."
     */
    std::filesystem::path Check(const std::filesystem::path& path) const;

    std::ifstream OpenForRead(const std::filesystem::path& path) const;
    std::ofstream OpenForWrite(const std::filesystem::path& path, bool append = false) const;

    /**
     * @brief Read a whole file after the allow-list check
     * @throws SecurityViolation, std::runtime_error
     */
    std::string ReadFile(const std::filesystem::path& path) const;

    /**
     * @brief Write (or append) a file after the allow-list check
     * @throws SecurityViolation, std::runtime_error
     */
    void WriteFile(const std::filesystem::path& path, const std::string& content,
                   bool append = false) const;

private:
    AllowlistGuard() = default;

    static std::filesystem::path Resolve(const std::filesystem::path& path);
    static bool IsSubpath(const std::filesystem::path& path, const std::filesystem::path& root);

    std::vector<std::filesystem::path> roots_;
    bool enforcing_{false};
};

} // namespace core
} // namespace warden
