/**
 * @file chroot_backend.cpp
 * @brief chroot into the control directory
 *
 * @date 2025
 */

#include "warden/isolation/backends.hpp"
#include "warden/core/errors.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace warden {
namespace isolation {

bool ChrootBackend::HasRootFilesystem() const {
    std::error_code ec;
    const auto& root = context_.control_directory;
    bool has_shell = std::filesystem::exists(root / "bin" / "sh", ec);
    bool has_libs = std::filesystem::is_directory(root / "lib", ec) ||
                    std::filesystem::is_directory(root / "usr" / "lib", ec);
    return has_shell && has_libs;
}

std::filesystem::path ChrootBackend::ToChildPath(const std::filesystem::path& host_path) const {
    const auto text = host_path.string();
    const auto root = context_.control_directory.string();
    if (text == root) {
        return "/";
    }
    if (utils::StringUtils::StartsWith(text, root + "/")) {
        return "/" + text.substr(root.size() + 1);
    }
    return host_path;
}

utils::ProcessOptions ChrootBackend::BuildLaunch(const LaunchSpec& spec) {
    auto chroot = RequireHelper("chroot", "chroot isolation needs coreutils and root privileges");

    if (!HasRootFilesystem()) {
        throw core::SandboxError(
            "chroot isolation needs a root filesystem in " + context_.control_directory.string(),
            "The control directory only holds a bare runtime (no bin/sh, no lib or usr/lib). "
            "Populate it with a minimal root filesystem or use isolation_mode 'bwrap'.");
    }

    utils::ProcessOptions options;
    options.argv = {
        chroot.string(),
        context_.control_directory.string(),
        ToChildPath(spec.launcher).string(),
        ToChildPath(spec.request).string(),
        ToChildPath(spec.response).string(),
    };
    options.merge_stderr = false;

    spdlog::debug("chroot launch: {}", utils::StringUtils::JoinShellQuoted(options.argv));
    return options;
}

} // namespace isolation
} // namespace warden
