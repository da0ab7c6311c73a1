/**
 * @file allowlist_guard.cpp
 * @brief Implementation of the file access allow-list
 *
 * @date 2025
 */

#include "warden/core/allowlist_guard.hpp"
#include "warden/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <sstream>
#include <stdexcept>
#include <system_error>

namespace warden {
namespace core {

AllowlistGuard::AllowlistGuard(std::vector<std::filesystem::path> allowed_roots)
    : enforcing_(true) {
    roots_.reserve(allowed_roots.size());
    for (const auto& root : allowed_roots) {
        if (root.empty()) {
            continue;
        }
        roots_.push_back(Resolve(root));
    }
}

AllowlistGuard AllowlistGuard::Permissive() {
    return AllowlistGuard();
}

std::filesystem::path AllowlistGuard::Resolve(const std::filesystem::path& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    auto resolved = std::filesystem::weakly_canonical(absolute, ec);
    if (ec) {
        return absolute.lexically_normal();
    }
    return resolved;
}

bool AllowlistGuard::IsSubpath(const std::filesystem::path& path,
                               const std::filesystem::path& root) {
    auto path_it = path.begin();
    for (auto root_it = root.begin(); root_it != root.end(); ++root_it) {
        // weakly_canonical keeps a trailing empty component for "dir/"
        if (root_it->empty()) {
            continue;
        }
        if (path_it == path.end() || *path_it != *root_it) {
            return false;
        }
        ++path_it;
    }
    return true;
}

bool AllowlistGuard::IsAllowed(const std::filesystem::path& path) const {
    if (!enforcing_) {
        return true;
    }
    const auto resolved = Resolve(path);
    for (const auto& root : roots_) {
        if (IsSubpath(resolved, root)) {
            return true;
        }
    }
    return false;
}

std::filesystem::path AllowlistGuard::Check(const std::filesystem::path& path) const {
    if (!IsAllowed(path)) {
        spdlog::warn("Blocked access to {}", path.string());
        throw SecurityViolation("Access to file " + path.string() + " is denied (Sandboxed).");
    }
    return enforcing_ ? Resolve(path) : path;
}

std::ifstream AllowlistGuard::OpenForRead(const std::filesystem::path& path) const {
    auto target = Check(path);
    std::ifstream in(target, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open file for reading: " + path.string());
    }
    return in;
}

std::ofstream AllowlistGuard::OpenForWrite(const std::filesystem::path& path, bool append) const {
    auto target = Check(path);
    auto mode = std::ios::binary | (append ? std::ios::app : std::ios::trunc);
    std::ofstream out(target, mode);
    if (!out) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }
    return out;
}

std::string AllowlistGuard::ReadFile(const std::filesystem::path& path) const {
    auto in = OpenForRead(path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void AllowlistGuard::WriteFile(const std::filesystem::path& path, const std::string& content,
                               bool append) const {
    auto out = OpenForWrite(path, append);
    out << content;
    if (!out) {
        throw std::runtime_error("Failed to write file: " + path.string());
    }
}

} // namespace core
} // namespace warden
