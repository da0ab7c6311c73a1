/**
 * @file workspace_filesystem.hpp
 * @brief Host/virtual view of the workspace and redacted file listings
 *
 * Callers address the workspace by a stable virtual root ("/workspace") no
 * matter where it lives on the host. WorkspaceFilesystem translates single
 * paths and free text between the two views and renders a bounded, redacted
 * tree of the workspace contents.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace warden {
namespace core {

/**
 * @struct FileTreeOptions
 * @brief Controls for WorkspaceFilesystem::FileTree
 */
struct FileTreeOptions {
    bool include_hidden{false};                  ///< Show dot entries (never the always-hidden set)
    std::optional<std::filesystem::path> root;   ///< Listing root (virtual or host); workspace by default
    std::optional<std::size_t> max_depth;        ///< Levels below root (unlimited by default)
    std::size_t max_items_per_dir{5};            ///< Cap for non-root directories
};

/**
 * @class WorkspaceFilesystem
 * @brief Path and text translation between host and virtual workspace roots
 *
 * Translation is whole-token: "/workspace" inside "/workspace2" or
 * "my/workspace" is never rewritten. When host and virtual roots are equal,
 * path mapping is disabled and MapTextToHost is a no-op.
 *
 * **Usage Example**:
 * @code
 * WorkspaceFilesystem fs("/home/me/project", "/workspace");
 * fs.ToHostPath("/workspace/src/main.py");      // "/home/me/project/src/main.py"
 * fs.MapTextToVirtual("error in /home/me/project/a.py");  // "error in /workspace/a.py"
 * std::cout << fs.FileTree();
 * @endcode
 */
class WorkspaceFilesystem {
public:
    WorkspaceFilesystem(std::filesystem::path host_root,
                        std::filesystem::path virtual_root,
                        std::string control_directory_name = ".sandbox");

    const std::filesystem::path& host_root() const { return host_root_; }
    const std::filesystem::path& virtual_root() const { return virtual_root_; }
    bool path_mapping_enabled() const { return path_mapping_enabled_; }

    /**
     * @brief Virtual path to host path
     *
     * Only the virtual root itself or paths under "root/" are rewritten;
     * anything else is returned unchanged.
     */
    std::filesystem::path ToHostPath(const std::filesystem::path& virtual_path) const;

    /// Inverse of ToHostPath
    std::filesystem::path ToVirtualPath(const std::filesystem::path& host_path) const;

    /// Replace every whole-token occurrence of the virtual root with the host root
    std::string MapTextToHost(const std::string& text) const;

    /// Replace every whole-token occurrence of the host root with the virtual root
    std::string MapTextToVirtual(const std::string& text) const;

    /**
     * @brief Render the workspace tree
     *
     * One line per entry, relative to the listing root. Directories end with
     * '/' and sort before files. The root lists everything; deeper levels show
     * at most max_items_per_dir entries followed by "... (and N more items)".
     * The control directory, VCS/IDE folders and dependency caches are always
     * hidden, and "skills/" is listed one level deep only.
     */
    std::string FileTree(const FileTreeOptions& options = {}) const;

    /**
     * @brief Write a file addressed by virtual or host path
     * @throws std::runtime_error on I/O failure
     */
    void WriteFile(const std::filesystem::path& path, const std::string& content,
                   bool append = false) const;

    /// @throws std::runtime_error if the file cannot be read
    std::string ReadFile(const std::filesystem::path& path) const;

    /// Create a directory (and parents) addressed by virtual or host path
    std::filesystem::path EnsureDirectory(const std::filesystem::path& path) const;

    /**
     * @brief Whole-token replacement used by the Map* helpers
     *
     * A match is rejected when preceded by [A-Za-z0-9_.-/] or followed by
     * [A-Za-z0-9_.-]. A following '/' or end of text is accepted.
     */
    static std::string ReplaceToken(const std::string& text, const std::string& from,
                                    const std::string& to);

private:
    void AppendTree(std::string& out, const std::filesystem::path& dir,
                    const std::filesystem::path& listing_root, std::size_t depth,
                    const FileTreeOptions& options) const;
    bool IsHidden(const std::string& name, bool include_hidden) const;

    static std::filesystem::path StripTrailingSeparator(std::filesystem::path path);
    static std::optional<std::filesystem::path> Rebase(const std::filesystem::path& path,
                                                       const std::filesystem::path& from,
                                                       const std::filesystem::path& to);

    std::filesystem::path host_root_;
    std::filesystem::path virtual_root_;
    std::string control_directory_name_;
    bool path_mapping_enabled_{true};
    std::set<std::string> always_hidden_;
};

} // namespace core
} // namespace warden
