/**
 * @file sandbox_config.hpp
 * @brief Sandbox construction parameters, JSON loading and fluent builder
 *
 * @date 2025
 */

#pragma once

#include "warden/isolation/isolation_backend.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace warden {
namespace core {

/**
 * @struct SandboxConfig
 * @brief Everything fixed at Sandbox construction
 *
 * Example JSON file:
 * @code{.json}
 * {
 *   "host_workspace": "/home/me/project",
 *   "virtual_workspace": "/workspace",
 *   "isolation_mode": "bwrap",
 *   "cpu_time_limit_seconds": 60,
 *   "memory_limit_mb": 1024,
 *   "allowed_paths": ["/opt/data"]
 * }
 * @endcode
 */
struct SandboxConfig {
    // Resource Limits
    std::uint64_t cpu_time_limit_seconds{60};     ///< RLIMIT_CPU for every child
    std::uint64_t memory_limit_mb{1024};          ///< RLIMIT_AS for every child (clamped)
    std::vector<std::filesystem::path> allowed_paths;  ///< Extra guard roots

    // Workspace
    std::filesystem::path host_workspace;                  ///< Required, absolute
    std::filesystem::path virtual_workspace{"/workspace"}; ///< Root presented to callers
    std::string control_directory_name{".sandbox"};

    // Isolation
    isolation::IsolationMode isolation_mode{isolation::DefaultIsolationMode()};
    std::filesystem::path launcher_path;          ///< Empty: resolved automatically

    // Provisioning
    bool provision_python_runtime{true};
    std::string package_index_url{"https://pypi.tuna.tsinghua.edu.cn/simple"};
    std::string package_index_trusted_host{"pypi.tuna.tsinghua.edu.cn"};
    std::vector<std::filesystem::path> module_search_paths;  ///< Added to every library_call

    // Execution
    std::chrono::seconds wall_clock_timeout{0};   ///< 0 disables the wall-clock kill
    bool verbose_logging{false};

    std::uint64_t memory_limit_bytes() const { return memory_limit_mb * 1024 * 1024; }
};

/**
 * @brief Fixed OS paths always readable by sandboxed code
 *
 * Timezone and MIME databases, per-user tool caches under $HOME and the
 * common binary directories.
 */
std::vector<std::filesystem::path> DefaultAllowedPaths();

void to_json(nlohmann::json& j, const SandboxConfig& config);
void from_json(const nlohmann::json& j, SandboxConfig& config);

/**
 * @brief Load a configuration file
 *
 * Missing keys keep their defaults. Relative host_workspace values are
 * resolved against the file's directory.
 *
 * @throws std::runtime_error if the file is missing or malformed
 */
SandboxConfig LoadSandboxConfig(const std::filesystem::path& path);

/**
 * @brief Apply WARDEN_* environment overrides
 *
 * WARDEN_ISOLATION_MODE, WARDEN_CPU_TIME_LIMIT, WARDEN_MEMORY_LIMIT_MB,
 * WARDEN_VIRTUAL_WORKSPACE and WARDEN_LAUNCHER.
 *
 * @throws std::invalid_argument for unparsable values
 */
void ApplyEnvironmentOverrides(SandboxConfig& config);

/**
 * @class SandboxBuilder
 * @brief Fluent API for constructing sandbox configurations
 *
 * **Usage Example**:
 * @code
 * auto config = SandboxBuilder()
 *     .WithWorkspace("/home/me/project")
 *     .WithIsolationMode(isolation::IsolationMode::SUBPROCESS)
 *     .WithCpuTimeLimit(10)
 *     .WithMemoryLimit(512)
 *     .AllowPath("/opt/datasets")
 *     .Build();
 *
 * Sandbox sandbox(config);
 * @endcode
 */
class SandboxBuilder {
public:
    SandboxBuilder& WithWorkspace(std::filesystem::path host_workspace) {
        config_.host_workspace = std::move(host_workspace);
        return *this;
    }

    SandboxBuilder& WithVirtualWorkspace(std::filesystem::path virtual_workspace) {
        config_.virtual_workspace = std::move(virtual_workspace);
        return *this;
    }

    SandboxBuilder& WithIsolationMode(isolation::IsolationMode mode) {
        config_.isolation_mode = mode;
        return *this;
    }

    /**
     * @brief Set CPU-time limit
     * @param seconds CPU seconds (not wall-clock)
     * @return Reference to builder for chaining
     */
    SandboxBuilder& WithCpuTimeLimit(std::uint64_t seconds) {
        config_.cpu_time_limit_seconds = seconds;
        return *this;
    }

    /**
     * @brief Set memory limit
     * @param mb Memory limit in megabytes
     * @return Reference to builder for chaining
     */
    SandboxBuilder& WithMemoryLimit(std::uint64_t mb) {
        config_.memory_limit_mb = mb;
        return *this;
    }

    SandboxBuilder& WithWallClockTimeout(std::chrono::seconds timeout) {
        config_.wall_clock_timeout = timeout;
        return *this;
    }

    SandboxBuilder& AllowPath(std::filesystem::path path) {
        config_.allowed_paths.push_back(std::move(path));
        return *this;
    }

    SandboxBuilder& AddModuleSearchPath(std::filesystem::path path) {
        config_.module_search_paths.push_back(std::move(path));
        return *this;
    }

    SandboxBuilder& WithLauncher(std::filesystem::path launcher) {
        config_.launcher_path = std::move(launcher);
        return *this;
    }

    SandboxBuilder& ProvisionPythonRuntime(bool enable = true) {
        config_.provision_python_runtime = enable;
        return *this;
    }

    SandboxBuilder& WithPackageIndex(std::string url, std::string trusted_host) {
        config_.package_index_url = std::move(url);
        config_.package_index_trusted_host = std::move(trusted_host);
        return *this;
    }

    SandboxBuilder& VerboseLogging(bool enable = true) {
        config_.verbose_logging = enable;
        return *this;
    }

    SandboxConfig Build() const { return config_; }

private:
    SandboxConfig config_;
};

} // namespace core
} // namespace warden
