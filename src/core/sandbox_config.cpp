/**
 * @file sandbox_config.cpp
 * @brief Configuration defaults, JSON mapping and environment overrides
 *
 * @date 2025
 */

#include "warden/core/sandbox_config.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace warden {
namespace core {

namespace {

std::vector<std::string> ToStrings(const std::vector<std::filesystem::path>& paths) {
    std::vector<std::string> out;
    for (const auto& p : paths) {
        out.push_back(p.string());
    }
    return out;
}

std::vector<std::filesystem::path> ToPaths(const std::vector<std::string>& values) {
    return {values.begin(), values.end()};
}

std::uint64_t ParseUnsigned(const char* name, const std::string& value) {
    try {
        std::size_t consumed = 0;
        auto parsed = std::stoull(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " must be a non-negative integer, got '" +
                                    value + "'");
    }
}

} // anonymous namespace

std::vector<std::filesystem::path> DefaultAllowedPaths() {
    std::vector<std::filesystem::path> paths = {
        "/usr/share/zoneinfo",
        "/etc/localtime",
        "/etc/mime.types",
        "/etc/apache2/mime.types",
        "/usr/local/etc/mime.types",
    };

    if (const char* home = std::getenv("HOME"); home && *home) {
        std::filesystem::path home_dir(home);
        paths.push_back(home_dir / ".npm");
        paths.push_back(home_dir / ".cache");
        paths.push_back(home_dir / ".config");
    }

    for (const char* dir : {"/opt/homebrew/bin", "/usr/local/bin", "/usr/bin", "/bin",
                            "/usr/local/lib/node_modules"}) {
        paths.emplace_back(dir);
    }
    return paths;
}

void to_json(nlohmann::json& j, const SandboxConfig& config) {
    j = nlohmann::json{
        {"cpu_time_limit_seconds", config.cpu_time_limit_seconds},
        {"memory_limit_mb", config.memory_limit_mb},
        {"allowed_paths", ToStrings(config.allowed_paths)},
        {"host_workspace", config.host_workspace.string()},
        {"virtual_workspace", config.virtual_workspace.string()},
        {"control_directory_name", config.control_directory_name},
        {"isolation_mode", isolation::IsolationModeToString(config.isolation_mode)},
        {"launcher_path", config.launcher_path.string()},
        {"provision_python_runtime", config.provision_python_runtime},
        {"package_index_url", config.package_index_url},
        {"package_index_trusted_host", config.package_index_trusted_host},
        {"module_search_paths", ToStrings(config.module_search_paths)},
        {"wall_clock_timeout_seconds", config.wall_clock_timeout.count()},
        {"verbose_logging", config.verbose_logging}
    };
}

void from_json(const nlohmann::json& j, SandboxConfig& config) {
    config.cpu_time_limit_seconds = j.value("cpu_time_limit_seconds", config.cpu_time_limit_seconds);
    config.memory_limit_mb = j.value("memory_limit_mb", config.memory_limit_mb);
    config.allowed_paths = ToPaths(j.value("allowed_paths", ToStrings(config.allowed_paths)));
    config.host_workspace = j.value("host_workspace", config.host_workspace.string());
    config.virtual_workspace = j.value("virtual_workspace", config.virtual_workspace.string());
    config.control_directory_name = j.value("control_directory_name", config.control_directory_name);

    if (j.contains("isolation_mode")) {
        config.isolation_mode =
            isolation::IsolationModeFromString(j.at("isolation_mode").get<std::string>());
    }

    config.launcher_path = j.value("launcher_path", config.launcher_path.string());
    config.provision_python_runtime = j.value("provision_python_runtime", config.provision_python_runtime);
    config.package_index_url = j.value("package_index_url", config.package_index_url);
    config.package_index_trusted_host =
        j.value("package_index_trusted_host", config.package_index_trusted_host);
    config.module_search_paths =
        ToPaths(j.value("module_search_paths", ToStrings(config.module_search_paths)));
    config.wall_clock_timeout = std::chrono::seconds(
        j.value("wall_clock_timeout_seconds", static_cast<std::int64_t>(config.wall_clock_timeout.count())));
    config.verbose_logging = j.value("verbose_logging", config.verbose_logging);
}

SandboxConfig LoadSandboxConfig(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Config file not found: " + path.string());
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed config file " + path.string() + ": " + e.what());
    }

    SandboxConfig config;
    try {
        config = document.get<SandboxConfig>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config file " + path.string() + ": " + e.what());
    }

    if (!config.host_workspace.empty() && config.host_workspace.is_relative()) {
        config.host_workspace = std::filesystem::absolute(path).parent_path() / config.host_workspace;
        config.host_workspace = config.host_workspace.lexically_normal();
    }

    spdlog::debug("Loaded sandbox config from {}", path.string());
    return config;
}

void ApplyEnvironmentOverrides(SandboxConfig& config) {
    if (const char* mode = std::getenv("WARDEN_ISOLATION_MODE"); mode && *mode) {
        config.isolation_mode = isolation::IsolationModeFromString(mode);
    }
    if (const char* cpu = std::getenv("WARDEN_CPU_TIME_LIMIT"); cpu && *cpu) {
        config.cpu_time_limit_seconds = ParseUnsigned("WARDEN_CPU_TIME_LIMIT", cpu);
    }
    if (const char* memory = std::getenv("WARDEN_MEMORY_LIMIT_MB"); memory && *memory) {
        config.memory_limit_mb = ParseUnsigned("WARDEN_MEMORY_LIMIT_MB", memory);
    }
    if (const char* root = std::getenv("WARDEN_VIRTUAL_WORKSPACE"); root && *root) {
        config.virtual_workspace = root;
    }
    if (const char* launcher = std::getenv("WARDEN_LAUNCHER"); launcher && *launcher) {
        config.launcher_path = launcher;
    }
}

} // namespace core
} // namespace warden
