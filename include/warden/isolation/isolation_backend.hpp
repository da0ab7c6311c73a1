/**
 * @file isolation_backend.hpp
 * @brief Isolation backends and the one-time backend selection step
 *
 * A backend turns "run the launcher on this request/response pair" into a
 * concrete process description: the helper binary and its flags, the path
 * view the child sees, and whether the filesystem is already isolated at the
 * OS level (in which case the AllowlistGuard is not needed).
 *
 * **Backends**:
 * ```
 * NATIVE_PROFILE       sandbox-exec -f profile_<id>.sb  (macOS)
 * NAMESPACE_CONTAINER  bwrap --unshare-all ...          (Linux)
 * PRIVILEGED_CHROOT    chroot <control_dir> ...         (root only)
 * PLAIN_SUBPROCESS     launcher as an ordinary child    (guard enabled)
 * IN_PROCESS_LIMITS    forked host running the launcher (guard enabled)
 * ```
 *
 * @date 2025
 */

#pragma once

#include "warden/utils/process_utils.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace warden {
namespace isolation {

/**
 * @enum BackendKind
 * @brief Isolation strategy fixed at Sandbox construction
 */
enum class BackendKind {
    NATIVE_PROFILE,       ///< macOS sandbox-exec profile
    NAMESPACE_CONTAINER,  ///< Linux bubblewrap namespaces
    PRIVILEGED_CHROOT,    ///< chroot into the control directory
    PLAIN_SUBPROCESS,     ///< Subprocess with rlimits and allow-list
    IN_PROCESS_LIMITS     ///< Forked host process with rlimits and allow-list
};

/**
 * @enum IsolationMode
 * @brief Configured preference, resolved to a BackendKind by DetectBackend
 */
enum class IsolationMode {
    AUTO,
    NATIVE_PROFILE,       ///< "seatbelt"
    NAMESPACE_CONTAINER,  ///< "bwrap"
    CHROOT,               ///< "chroot"
    SUBPROCESS,           ///< "subprocess"
    IN_PROCESS            ///< "in_process"
};

/**
 * @enum Platform
 */
enum class Platform {
    LINUX,
    MACOS,
    OTHER
};

std::string BackendKindToString(BackendKind kind);
std::string IsolationModeToString(IsolationMode mode);

/// @throws std::invalid_argument for unknown mode names
IsolationMode IsolationModeFromString(const std::string& text);

/// Platform this binary was built for
Platform CurrentPlatform();

/// Default mode for the current platform ("bwrap" on Linux, "auto" elsewhere)
IsolationMode DefaultIsolationMode();

/**
 * @brief Resolve the backend once, at construction
 *
 * Pure function of its inputs so every platform branch can be tested on any
 * host.
 *
 * @param platform Host platform
 * @param mode Requested mode
 * @param helper_available Whether the mode's helper binary resolves on PATH
 *        (sandbox-exec for NATIVE_PROFILE, bwrap for NAMESPACE_CONTAINER / AUTO on Linux)
 * @param path_mapping_enabled False when host and virtual workspace roots are equal
 */
BackendKind DetectBackend(Platform platform, IsolationMode mode, bool helper_available,
                          bool path_mapping_enabled = true);

/// Helper binary a mode depends on ("bwrap", "sandbox-exec", "chroot"), empty when none
std::string HelperBinaryFor(Platform platform, IsolationMode mode);

/**
 * @struct LaunchSpec
 * @brief Host-side description of one launcher invocation
 */
struct LaunchSpec {
    std::filesystem::path launcher;           ///< Launcher executable (host path)
    std::filesystem::path request;            ///< Request artifact (host path)
    std::filesystem::path response;           ///< Response artifact (host path)
    std::filesystem::path working_directory;  ///< Host path
    std::string run_id;
};

/**
 * @struct BackendContext
 * @brief Workspace layout shared by all backends
 */
struct BackendContext {
    std::filesystem::path host_workspace;
    std::filesystem::path virtual_workspace;
    std::filesystem::path control_directory;        ///< Host path of <workspace>/.sandbox
    std::vector<std::filesystem::path> allowed_paths;
    bool path_mapping_enabled{true};
};

/**
 * @class IsolationBackend
 * @brief Strategy interface implemented by each backend
 */
class IsolationBackend {
public:
    explicit IsolationBackend(BackendContext context) : context_(std::move(context)) {}
    virtual ~IsolationBackend() = default;

    IsolationBackend(const IsolationBackend&) = delete;
    IsolationBackend& operator=(const IsolationBackend&) = delete;

    virtual BackendKind kind() const = 0;

    /**
     * @brief Process description for running the launcher
     *
     * May write per-call artifacts (e.g. a seatbelt profile), removed by
     * Cleanup.
     *
     * @throws core::SandboxError when the helper binary is missing or the
     *         environment cannot support this backend
     */
    virtual utils::ProcessOptions BuildLaunch(const LaunchSpec& spec) = 0;

    /// Host path as seen from inside the child
    virtual std::filesystem::path ToChildPath(const std::filesystem::path& host_path) const {
        return host_path;
    }

    /// True when the OS already confines filesystem access
    virtual bool EnforcesFilesystem() const = 0;

    /// Remove per-call artifacts written by BuildLaunch
    virtual void Cleanup(const LaunchSpec& spec) { (void)spec; }

    const BackendContext& context() const { return context_; }

protected:
    /// Throws SandboxError when helper cannot be found on PATH
    static std::filesystem::path RequireHelper(const std::string& helper, const std::string& hint);

    BackendContext context_;
};

/**
 * @brief Instantiate the backend for a resolved kind
 *
 * @param entry Launcher entry point used by IN_PROCESS_LIMITS; receives the
 *        request and response paths
 */
std::unique_ptr<IsolationBackend> CreateBackend(
    BackendKind kind, BackendContext context,
    std::function<int(const std::filesystem::path&, const std::filesystem::path&)> entry = {});

} // namespace isolation
} // namespace warden
