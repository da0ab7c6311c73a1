/**
 * @file isolation_backend.cpp
 * @brief Backend selection and factory
 *
 * **Selection table**:
 * ```
 * mode         | Linux                          | macOS
 * -------------+--------------------------------+------------------------------
 * auto         | bwrap on PATH ? NAMESPACE      | NATIVE_PROFILE
 *              |               : SUBPROCESS     |
 * bwrap        | NAMESPACE_CONTAINER            | PLAIN_SUBPROCESS (warn)
 * chroot       | PRIVILEGED_CHROOT              | PLAIN_SUBPROCESS (warn)
 * seatbelt     | PLAIN_SUBPROCESS (warn)        | NATIVE_PROFILE
 * subprocess   | PLAIN_SUBPROCESS               | PLAIN_SUBPROCESS
 * in_process   | IN_PROCESS_LIMITS              | IN_PROCESS_LIMITS
 * ```
 * Host root == virtual root always selects IN_PROCESS_LIMITS.
 *
 * @date 2025
 */

#include "warden/isolation/isolation_backend.hpp"
#include "warden/isolation/backends.hpp"
#include "warden/core/errors.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace warden {
namespace isolation {

std::string BackendKindToString(BackendKind kind) {
    switch (kind) {
        case BackendKind::NATIVE_PROFILE:      return "native_profile";
        case BackendKind::NAMESPACE_CONTAINER: return "namespace_container";
        case BackendKind::PRIVILEGED_CHROOT:   return "privileged_chroot";
        case BackendKind::PLAIN_SUBPROCESS:    return "plain_subprocess";
        case BackendKind::IN_PROCESS_LIMITS:   return "in_process_limits";
    }
    return "unknown";
}

std::string IsolationModeToString(IsolationMode mode) {
    switch (mode) {
        case IsolationMode::AUTO:                return "auto";
        case IsolationMode::NATIVE_PROFILE:      return "seatbelt";
        case IsolationMode::NAMESPACE_CONTAINER: return "bwrap";
        case IsolationMode::CHROOT:              return "chroot";
        case IsolationMode::SUBPROCESS:          return "subprocess";
        case IsolationMode::IN_PROCESS:          return "in_process";
    }
    return "unknown";
}

IsolationMode IsolationModeFromString(const std::string& text) {
    const auto lower = utils::StringUtils::ToLower(utils::StringUtils::Trim(text));
    if (lower == "auto")       return IsolationMode::AUTO;
    if (lower == "seatbelt")   return IsolationMode::NATIVE_PROFILE;
    if (lower == "bwrap")      return IsolationMode::NAMESPACE_CONTAINER;
    if (lower == "chroot")     return IsolationMode::CHROOT;
    if (lower == "subprocess") return IsolationMode::SUBPROCESS;
    if (lower == "in_process") return IsolationMode::IN_PROCESS;
    throw std::invalid_argument("Unknown isolation mode: " + text);
}

Platform CurrentPlatform() {
#if defined(__APPLE__)
    return Platform::MACOS;
#elif defined(__linux__)
    return Platform::LINUX;
#else
    return Platform::OTHER;
#endif
}

IsolationMode DefaultIsolationMode() {
    return CurrentPlatform() == Platform::LINUX ? IsolationMode::NAMESPACE_CONTAINER
                                                : IsolationMode::AUTO;
}

std::string HelperBinaryFor(Platform platform, IsolationMode mode) {
    switch (mode) {
        case IsolationMode::AUTO:
            return platform == Platform::MACOS ? "sandbox-exec" : "bwrap";
        case IsolationMode::NATIVE_PROFILE:
            return "sandbox-exec";
        case IsolationMode::NAMESPACE_CONTAINER:
            return "bwrap";
        case IsolationMode::CHROOT:
            return "chroot";
        default:
            return "";
    }
}

BackendKind DetectBackend(Platform platform, IsolationMode mode, bool helper_available,
                          bool path_mapping_enabled) {
    if (!path_mapping_enabled) {
        return BackendKind::IN_PROCESS_LIMITS;
    }

    if (mode == IsolationMode::SUBPROCESS) {
        return BackendKind::PLAIN_SUBPROCESS;
    }
    if (mode == IsolationMode::IN_PROCESS) {
        return BackendKind::IN_PROCESS_LIMITS;
    }

    if (platform == Platform::MACOS) {
        switch (mode) {
            case IsolationMode::AUTO:
            case IsolationMode::NATIVE_PROFILE:
                return BackendKind::NATIVE_PROFILE;
            default:
                spdlog::warn("Isolation mode '{}' is not available on macOS, using subprocess",
                             IsolationModeToString(mode));
                return BackendKind::PLAIN_SUBPROCESS;
        }
    }

    switch (mode) {
        case IsolationMode::AUTO:
            return helper_available ? BackendKind::NAMESPACE_CONTAINER
                                    : BackendKind::PLAIN_SUBPROCESS;
        case IsolationMode::NAMESPACE_CONTAINER:
            return BackendKind::NAMESPACE_CONTAINER;
        case IsolationMode::CHROOT:
            return BackendKind::PRIVILEGED_CHROOT;
        default:
            spdlog::warn("Isolation mode '{}' is only available on macOS, using subprocess",
                         IsolationModeToString(mode));
            return BackendKind::PLAIN_SUBPROCESS;
    }
}

std::filesystem::path IsolationBackend::RequireHelper(const std::string& helper,
                                                      const std::string& hint) {
    auto resolved = utils::FindExecutable(helper);
    if (!resolved) {
        throw core::SandboxError(helper + " is not installed or not on PATH; " + hint);
    }
    return *resolved;
}

std::unique_ptr<IsolationBackend> CreateBackend(
    BackendKind kind, BackendContext context,
    std::function<int(const std::filesystem::path&, const std::filesystem::path&)> entry) {

    switch (kind) {
        case BackendKind::NATIVE_PROFILE:
            return std::make_unique<SeatbeltBackend>(std::move(context));
        case BackendKind::NAMESPACE_CONTAINER:
            return std::make_unique<BubblewrapBackend>(std::move(context));
        case BackendKind::PRIVILEGED_CHROOT:
            return std::make_unique<ChrootBackend>(std::move(context));
        case BackendKind::PLAIN_SUBPROCESS:
            return std::make_unique<SubprocessBackend>(std::move(context));
        case BackendKind::IN_PROCESS_LIMITS:
            if (!entry) {
                throw std::invalid_argument("In-process backend requires a launcher entry point");
            }
            return std::make_unique<InProcessBackend>(std::move(context), std::move(entry));
    }
    throw std::invalid_argument("Unknown backend kind");
}

} // namespace isolation
} // namespace warden
