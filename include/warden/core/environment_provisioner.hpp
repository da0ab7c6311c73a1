/**
 * @file environment_provisioner.hpp
 * @brief Per-workspace runtime, launcher copy and private install prefixes
 *
 * Everything lives under the workspace control directory:
 * ```
 * <workspace>/.sandbox/
 *   runtime/                 Python virtual environment (or bare bin/)
 *   runtime/.warden-runtime.json
 *   runtime/pip.conf
 *   bin/warden-launcher
 *   .pylibs/  .pip-cache/  .npm-global/  .npm-cache/
 * ```
 * The host provisions the runtime and the launcher once; dependency installs
 * run inside the sandboxed child with the environment from
 * PrivateEnvironment(), so nothing is written outside the control directory.
 *
 * @date 2025
 */

#pragma once

#include "warden/core/execution_types.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace warden {
namespace core {

/**
 * @enum ProvisionOutcome
 */
enum class ProvisionOutcome {
    CREATED,  ///< Runtime was built by this call
    REUSED    ///< Cached runtime found
};

/**
 * @class EnvironmentProvisioner
 * @brief Creates and reuses the sandbox runtime and install prefixes
 *
 * **Usage Example**:
 * @code
 * EnvironmentProvisioner provisioner(workspace / ".sandbox");
 * provisioner.EnsureRuntime();                         // CREATED once, REUSED afterwards
 * auto launcher = provisioner.InstallLauncher("/usr/local/bin/warden-launcher");
 *
 * // inside the child
 * provisioner.InstallDependencies({"requests", "npm:lodash"});
 * @endcode
 *
 * **Thread Safety**: NOT thread-safe; concurrent first use of one workspace may
 * provision twice.
 */
class EnvironmentProvisioner {
public:
    /**
     * @param control_directory Control directory (host path on the host side,
     *        child-view path inside the launcher)
     * @param package_index Mirror used for pip installs
     * @param provision_python Create a Python virtual environment when python3 exists
     */
    explicit EnvironmentProvisioner(std::filesystem::path control_directory,
                                    PackageIndex package_index = {},
                                    bool provision_python = true);

    /**
     * @brief Create the runtime if it does not exist yet
     * @throws SandboxError if the virtual environment cannot be created
     */
    ProvisionOutcome EnsureRuntime();

    bool RuntimeExists() const;

    /// Number of runtimes actually created by this provisioner
    std::size_t provision_count() const { return provision_count_; }

    /**
     * @brief Copy the launcher executable into the control directory
     *
     * The copy is rewritten only when its SHA-256 differs from source.
     *
     * @return Path of the installed copy
     * @throws SandboxError if the source is missing or cannot be copied
     */
    std::filesystem::path InstallLauncher(const std::filesystem::path& source);

    /**
     * @brief Bootstrap pip into the runtime and point it at the mirror
     * @throws SandboxError when the runtime has no Python or ensurepip fails
     */
    void EnsurePackageInstaller();

    /**
     * @brief Environment overlay directing every installer to private prefixes
     *
     * Creates the prefix directories on first use.
     */
    std::map<std::string, std::string> PrivateEnvironment() const;

    /**
     * @brief Install "npm:<pkg>", "pip:<pkg>" or bare (pip) dependencies
     * @throws SandboxError with the installer output attached
     */
    void InstallDependencies(const std::vector<std::string>& dependencies,
                             const std::optional<std::filesystem::path>& working_directory = std::nullopt);

    /**
     * @brief Run a raw install command through /bin/sh -c
     * @throws SandboxError with the command output attached
     */
    void RunInstallCommand(const std::string& command,
                           const std::optional<std::filesystem::path>& working_directory = std::nullopt);

    /// Python interpreter for scripts (runtime python, else python3 on PATH)
    std::filesystem::path PythonExecutable() const;

    const std::filesystem::path& control_directory() const { return control_directory_; }
    std::filesystem::path runtime_directory() const { return control_directory_ / "runtime"; }
    std::filesystem::path launcher_path() const { return control_directory_ / "bin" / "warden-launcher"; }
    std::filesystem::path marker_path() const { return runtime_directory() / ".warden-runtime.json"; }

private:
    void WritePipConfig() const;

    std::filesystem::path control_directory_;
    PackageIndex package_index_;
    bool provision_python_;
    std::size_t provision_count_{0};
};

} // namespace core
} // namespace warden
