/**
 * @file backends.hpp
 * @brief Concrete isolation backends
 *
 * @date 2025
 */

#pragma once

#include "warden/isolation/isolation_backend.hpp"

#include <functional>

namespace warden {
namespace isolation {

/**
 * @class SeatbeltBackend
 * @brief macOS sandbox-exec with a generated per-call profile
 *
 * Reads are broad; writes are limited to the workspace, the control
 * directory, the allowed roots and the system temp locations.
 */
class SeatbeltBackend : public IsolationBackend {
public:
    using IsolationBackend::IsolationBackend;

    BackendKind kind() const override { return BackendKind::NATIVE_PROFILE; }
    utils::ProcessOptions BuildLaunch(const LaunchSpec& spec) override;
    bool EnforcesFilesystem() const override { return true; }
    void Cleanup(const LaunchSpec& spec) override;

    /// Profile text (exposed for tests)
    std::string GenerateProfile() const;

    std::filesystem::path ProfilePath(const LaunchSpec& spec) const;
};

/**
 * @class BubblewrapBackend
 * @brief Linux user namespaces via bwrap
 *
 * The host root is mounted read-only entry by entry, the workspace is bound
 * read-write at the virtual root, and the control directory keeps its real
 * path so the launcher and artifacts resolve identically on both sides.
 */
class BubblewrapBackend : public IsolationBackend {
public:
    using IsolationBackend::IsolationBackend;

    BackendKind kind() const override { return BackendKind::NAMESPACE_CONTAINER; }
    utils::ProcessOptions BuildLaunch(const LaunchSpec& spec) override;
    std::filesystem::path ToChildPath(const std::filesystem::path& host_path) const override;
    bool EnforcesFilesystem() const override { return true; }

    /// bwrap arguments up to and excluding the launcher command
    std::vector<std::string> BuildArguments(const LaunchSpec& spec) const;

    /// Root directory scanned for read-only binds ("/" outside tests)
    void set_system_root(std::filesystem::path root) { system_root_ = std::move(root); }

private:
    std::filesystem::path system_root_{"/"};
};

/**
 * @class ChrootBackend
 * @brief chroot into the control directory (requires root)
 *
 * Only useful when the control directory has been populated with a minimal
 * root filesystem (bin/sh and shared libraries).
 */
class ChrootBackend : public IsolationBackend {
public:
    using IsolationBackend::IsolationBackend;

    BackendKind kind() const override { return BackendKind::PRIVILEGED_CHROOT; }
    utils::ProcessOptions BuildLaunch(const LaunchSpec& spec) override;
    std::filesystem::path ToChildPath(const std::filesystem::path& host_path) const override;
    bool EnforcesFilesystem() const override { return true; }

    /// Whether the control directory looks like a usable root filesystem
    bool HasRootFilesystem() const;
};

/**
 * @class SubprocessBackend
 * @brief Launcher as a plain child process
 */
class SubprocessBackend : public IsolationBackend {
public:
    using IsolationBackend::IsolationBackend;

    BackendKind kind() const override { return BackendKind::PLAIN_SUBPROCESS; }
    utils::ProcessOptions BuildLaunch(const LaunchSpec& spec) override;
    bool EnforcesFilesystem() const override { return false; }
};

/**
 * @class InProcessBackend
 * @brief Forks the host and runs the launcher entry point in the child
 */
class InProcessBackend : public IsolationBackend {
public:
    using Entry = std::function<int(const std::filesystem::path&, const std::filesystem::path&)>;

    InProcessBackend(BackendContext context, Entry entry)
        : IsolationBackend(std::move(context)), entry_(std::move(entry)) {}

    BackendKind kind() const override { return BackendKind::IN_PROCESS_LIMITS; }
    utils::ProcessOptions BuildLaunch(const LaunchSpec& spec) override;
    bool EnforcesFilesystem() const override { return false; }

private:
    Entry entry_;
};

} // namespace isolation
} // namespace warden
