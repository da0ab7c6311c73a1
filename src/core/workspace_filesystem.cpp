/**
 * @file workspace_filesystem.cpp
 * @brief Implementation of workspace path translation and file listings
 *
 * **Token boundaries** (MapText*):
 * ```
 * "cd /workspace/src"      -> rewritten      (space before, '/' after)
 * "see /workspace."        -> not rewritten  ('.' after continues a name)
 * "/data/workspace"        -> not rewritten  ('/' before)
 * "/workspace2"            -> not rewritten  ('2' after)
 * ```
 *
 * @date 2025
 */

#include "warden/core/workspace_filesystem.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace warden {
namespace core {

namespace {

bool IsNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
}

} // anonymous namespace

WorkspaceFilesystem::WorkspaceFilesystem(std::filesystem::path host_root,
                                         std::filesystem::path virtual_root,
                                         std::string control_directory_name)
    : host_root_(StripTrailingSeparator(std::move(host_root)))
    , virtual_root_(StripTrailingSeparator(std::move(virtual_root)))
    , control_directory_name_(std::move(control_directory_name)) {

    path_mapping_enabled_ = host_root_ != virtual_root_;

    always_hidden_ = {".sandbox", ".git", ".idea", ".vscode", "__pycache__",
                      "node_modules", "venv", ".DS_Store"};
    always_hidden_.insert(control_directory_name_);

    if (!path_mapping_enabled_) {
        spdlog::debug("Workspace {} is used without path mapping", host_root_.string());
    }
}

std::filesystem::path WorkspaceFilesystem::StripTrailingSeparator(std::filesystem::path path) {
    auto text = path.string();
    while (text.size() > 1 && text.back() == '/') {
        text.pop_back();
    }
    return text;
}

std::optional<std::filesystem::path> WorkspaceFilesystem::Rebase(const std::filesystem::path& path,
                                                                 const std::filesystem::path& from,
                                                                 const std::filesystem::path& to) {
    const auto text = path.string();
    const auto prefix = from.string();

    if (text == prefix) {
        return to;
    }
    if (utils::StringUtils::StartsWith(text, prefix + "/")) {
        auto rest = text.substr(prefix.size());
        while (!rest.empty() && rest.front() == '/') {
            rest.erase(0, 1);
        }
        return to / rest;
    }
    return std::nullopt;
}

// ============================================================================
// PATH TRANSLATION
// ============================================================================

std::filesystem::path WorkspaceFilesystem::ToHostPath(const std::filesystem::path& virtual_path) const {
    if (!path_mapping_enabled_) {
        return virtual_path;
    }
    return Rebase(virtual_path, virtual_root_, host_root_).value_or(virtual_path);
}

std::filesystem::path WorkspaceFilesystem::ToVirtualPath(const std::filesystem::path& host_path) const {
    if (!path_mapping_enabled_) {
        return host_path;
    }
    return Rebase(host_path, host_root_, virtual_root_).value_or(host_path);
}

std::string WorkspaceFilesystem::ReplaceToken(const std::string& text, const std::string& from,
                                              const std::string& to) {
    if (from.empty() || text.size() < from.size()) {
        return text;
    }

    std::string result;
    result.reserve(text.size());

    std::size_t cursor = 0;
    std::size_t pos = text.find(from);
    while (pos != std::string::npos) {
        bool boundary_before = pos == 0 ||
            !(IsNameChar(text[pos - 1]) || text[pos - 1] == '/');
        std::size_t end = pos + from.size();
        bool boundary_after = end == text.size() || !IsNameChar(text[end]);

        if (boundary_before && boundary_after) {
            result.append(text, cursor, pos - cursor);
            result.append(to);
            cursor = end;
            pos = text.find(from, end);
        } else {
            pos = text.find(from, pos + 1);
        }
    }
    result.append(text, cursor, std::string::npos);
    return result;
}

std::string WorkspaceFilesystem::MapTextToHost(const std::string& text) const {
    if (!path_mapping_enabled_) {
        return text;
    }
    return ReplaceToken(text, virtual_root_.string(), host_root_.string());
}

std::string WorkspaceFilesystem::MapTextToVirtual(const std::string& text) const {
    if (!path_mapping_enabled_) {
        return text;
    }
    return ReplaceToken(text, host_root_.string(), virtual_root_.string());
}

// ============================================================================
// FILE TREE
// ============================================================================

bool WorkspaceFilesystem::IsHidden(const std::string& name, bool include_hidden) const {
    if (always_hidden_.count(name) > 0) {
        return true;
    }
    return !include_hidden && !name.empty() && name.front() == '.';
}

std::string WorkspaceFilesystem::FileTree(const FileTreeOptions& options) const {
    std::filesystem::path root = options.root ? ToHostPath(*options.root) : host_root_;

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return "";
    }

    std::string out;
    AppendTree(out, root, root, 0, options);
    return out;
}

void WorkspaceFilesystem::AppendTree(std::string& out, const std::filesystem::path& dir,
                                     const std::filesystem::path& listing_root, std::size_t depth,
                                     const FileTreeOptions& options) const {
    std::vector<std::string> dirs;
    std::vector<std::string> files;

    std::error_code ec;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (IsHidden(name, options.include_hidden)) {
            continue;
        }
        std::error_code type_ec;
        // Symlinked directories are listed but never followed
        if (it->is_directory(type_ec) && !it->is_symlink(type_ec)) {
            dirs.push_back(name);
        } else {
            files.push_back(name);
        }
    }
    if (ec) {
        spdlog::debug("Cannot list {}: {}", dir.string(), ec.message());
        return;
    }

    // Directories at the depth limit are neither listed nor counted
    const bool at_depth_limit = options.max_depth && depth >= *options.max_depth;
    if (at_depth_limit) {
        dirs.clear();
    }

    std::sort(dirs.begin(), dirs.end());
    std::sort(files.begin(), files.end());

    const std::size_t total = dirs.size() + files.size();
    std::size_t cap = total;
    if (depth > 0 && total > options.max_items_per_dir) {
        cap = options.max_items_per_dir;
    }

    const auto relative = dir.lexically_relative(listing_root);
    auto entry_path = [&relative](const std::string& name) {
        if (relative.empty() || relative == ".") {
            return name;
        }
        return (relative / name).string();
    };

    std::vector<std::string> shown_dirs;
    std::size_t shown = 0;
    for (const auto& name : dirs) {
        if (shown == cap) break;
        out += entry_path(name) + "/\n";
        shown_dirs.push_back(name);
        ++shown;
    }
    for (const auto& name : files) {
        if (shown == cap) break;
        out += entry_path(name) + "\n";
        ++shown;
    }
    if (shown < total) {
        out += "... (and " + std::to_string(total - shown) + " more items)\n";
    }

    if (at_depth_limit) {
        return;
    }
    // skills/ is listed but its subdirectories are not expanded
    if (dir.lexically_relative(host_root_) == "skills") {
        return;
    }

    for (const auto& name : shown_dirs) {
        AppendTree(out, dir / name, listing_root, depth + 1, options);
    }
}

// ============================================================================
// FILE HELPERS
// ============================================================================

void WorkspaceFilesystem::WriteFile(const std::filesystem::path& path, const std::string& content,
                                    bool append) const {
    auto host_path = ToHostPath(path);
    if (host_path.has_parent_path()) {
        std::filesystem::create_directories(host_path.parent_path());
    }

    std::ofstream out(host_path, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
    if (!out) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }
    out << content;
    if (!out) {
        throw std::runtime_error("Failed to write file: " + path.string());
    }
}

std::string WorkspaceFilesystem::ReadFile(const std::filesystem::path& path) const {
    std::ifstream in(ToHostPath(path), std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::filesystem::path WorkspaceFilesystem::EnsureDirectory(const std::filesystem::path& path) const {
    auto host_path = ToHostPath(path);
    std::filesystem::create_directories(host_path);
    return host_path;
}

} // namespace core
} // namespace warden
