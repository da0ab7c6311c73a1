/**
 * @file sandbox.hpp
 * @brief Sandboxed execution of module functions, scripts and shell commands
 *
 * The Sandbox is the single entry point for callers. Each call serializes a
 * request into the workspace control directory, runs the launcher in a child
 * process under the selected isolation backend, and turns the response into
 * either a value or exactly one SandboxError.
 *
 * @date 2025
 */

#pragma once

#include "warden/core/environment_provisioner.hpp"
#include "warden/core/execution_types.hpp"
#include "warden/core/sandbox_config.hpp"
#include "warden/core/workspace_filesystem.hpp"
#include "warden/isolation/isolation_backend.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include <nlohmann/json.hpp>

namespace warden {
namespace core {

/**
 * @struct LibraryCall
 * @brief Function (or class method) of a module found on the search path
 */
struct LibraryCall {
    std::string module;                      ///< Dotted module name
    std::optional<std::string> class_name;   ///< Instantiate this class first
    std::string function;
    nlohmann::json args = nlohmann::json::array();
    nlohmann::json kwargs = nlohmann::json::object();
    std::optional<std::filesystem::path> working_directory;   ///< Virtual or host path
    std::vector<std::filesystem::path> search_paths;          ///< Restored in the child
};

/**
 * @struct ModuleCall
 * @brief Function of a module loaded from a file path
 */
struct ModuleCall {
    std::filesystem::path module_path;
    std::string function;
    nlohmann::json args = nlohmann::json::array();
    nlohmann::json kwargs = nlohmann::json::object();
    std::optional<std::filesystem::path> working_directory;
    std::vector<std::filesystem::path> search_paths;
    std::vector<std::string> dependencies;   ///< Installed before the call
};

/**
 * @struct ScriptRun
 */
struct ScriptRun {
    std::filesystem::path script_path;
    std::vector<std::string> arguments;
    std::vector<std::string> dependencies;      ///< "npm:<pkg>", "pip:<pkg>" or bare pip names
    std::optional<std::string> install_command; ///< Raw shell command run before the script
    std::optional<std::filesystem::path> working_directory;
};

/**
 * @struct BackgroundJob
 * @brief Detached shell command started by RunShellCommandBackground
 */
struct BackgroundJob {
    std::string process_id;           ///< "bg_<pid>"
    pid_t pid{-1};
    std::filesystem::path log_file;   ///< Virtual path of the combined output log
    std::string command;
};

/**
 * @class Sandbox
 * @brief Execution dispatcher bound to one workspace
 *
 * Owns the workspace control directory, the cached runtime and the isolation
 * backend chosen at construction. When the host and virtual roots are the
 * same, the control directory is a private temporary directory removed with
 * the Sandbox, and no runtime is provisioned.
 *
 * **Thread Safety**: NOT thread-safe. Sequential calls on one instance are
 * safe; use one Sandbox per concurrent unit of work.
 *
 * **Usage Example**:
 * @code
 * auto config = SandboxBuilder()
 *     .WithWorkspace("/home/me/project")
 *     .WithCpuTimeLimit(30)
 *     .Build();
 * Sandbox sandbox(config);
 *
 * std::string out = sandbox.RunShellCommand("ls /workspace");
 * auto sum = sandbox.RunLibraryFunction({"tools.math", std::nullopt, "add", {1, 2}});
 *
 * try {
 *     sandbox.RunScript({"/workspace/train.py"});
 * } catch (const SandboxError& e) {
 *     std::cerr << e.Describe() << std::endl;
 * }
 * @endcode
 */
class Sandbox {
public:
    /**
     * @brief Construct and select the isolation backend
     * @throws SandboxError for an invalid workspace or a missing launcher
     */
    explicit Sandbox(SandboxConfig config);
    ~Sandbox();

    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    // ========================================================================
    // Execution
    // ========================================================================

    /// @return Function result, host paths mapped to the virtual view
    nlohmann::json RunLibraryFunction(const LibraryCall& call);

    nlohmann::json RunModuleFunction(const ModuleCall& call);

    /**
     * @return Combined stdout/stderr of the script
     *
     * A script body naming virtual paths runs from a host-mapped copy unless
     * the backend mounts the workspace at the virtual root.
     */
    std::string RunScript(const ScriptRun& run);

    /**
     * @brief Run a literal shell command
     * @return Combined output (also returned when the command exits nonzero)
     */
    std::string RunShellCommand(const std::string& command,
                                const std::optional<std::filesystem::path>& working_directory = std::nullopt);

    /**
     * @brief Run a fully specified request
     *
     * Paths in the request are host paths. The returned result is mapped to
     * the virtual view.
     *
     * @throws SandboxError on any pipeline failure or child-reported error
     */
    ExecutionResult Execute(const ExecutionRequest& request);

    // ========================================================================
    // Background jobs
    // ========================================================================

    /**
     * @brief Start a detached shell command with the sandbox limits applied
     *
     * Output goes to <cwd>/.sandbox_logs/bg_<pid>.log. Background jobs always
     * run as plain subprocesses, whichever backend is selected.
     */
    BackgroundJob RunShellCommandBackground(const std::string& command,
                                            const std::optional<std::filesystem::path>& working_directory = std::nullopt);

    /// SIGTERM the job's process group; false if it already exited
    bool TerminateBackgroundJob(const BackgroundJob& job);

    // ========================================================================
    // Path translation
    // ========================================================================

    /// Strings (recursively through arrays and objects) host view to virtual view
    nlohmann::json MapToVirtual(const nlohmann::json& value) const;

    /// Strings (recursively through arrays and objects) virtual view to host view
    nlohmann::json MapToHost(const nlohmann::json& value) const;

    std::string FileTree(const FileTreeOptions& options = {}) const;

    // ========================================================================
    // Accessors
    // ========================================================================

    isolation::BackendKind backend_kind() const { return backend_->kind(); }
    const WorkspaceFilesystem& filesystem() const { return filesystem_; }
    const EnvironmentProvisioner& provisioner() const { return provisioner_; }
    const SandboxConfig& config() const { return config_; }
    const ResourceLimits& limits() const { return limits_; }
    const std::filesystem::path& control_directory() const { return control_directory_; }

    /**
     * @brief Locate the launcher executable
     *
     * config.launcher_path, then $WARDEN_LAUNCHER, then a warden-launcher
     * next to the running executable, then PATH.
     *
     * @return Empty path when nothing was found
     */
    static std::filesystem::path ResolveLauncherPath(const SandboxConfig& config);

private:
    std::filesystem::path HostWorkingDirectory(const std::optional<std::filesystem::path>& cwd) const;
    std::vector<std::filesystem::path> HostSearchPaths(const std::vector<std::filesystem::path>& extra) const;
    ExecutionRequest ToChildRequest(const ExecutionRequest& request) const;
    std::string ToChildText(const std::string& text) const;
    nlohmann::json ToChildValue(const nlohmann::json& value) const;

    SandboxConfig config_;
    WorkspaceFilesystem filesystem_;
    std::filesystem::path control_directory_;
    ResourceLimits limits_;
    EnvironmentProvisioner provisioner_;
    std::unique_ptr<isolation::IsolationBackend> backend_;
    std::filesystem::path launcher_source_;
};

} // namespace core
} // namespace warden
