/**
 * @file environment_provisioner.cpp
 * @brief Implementation of runtime provisioning and dependency installs
 *
 * @date 2025
 */

#include "warden/core/environment_provisioner.hpp"
#include "warden/core/errors.hpp"
#include "warden/utils/hash_utils.hpp"
#include "warden/utils/process_utils.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <system_error>

namespace warden {
namespace core {

namespace {

constexpr const char* kNpmPrefix = "npm:";
constexpr const char* kPipPrefix = "pip:";

std::string CurrentTimestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

} // anonymous namespace

EnvironmentProvisioner::EnvironmentProvisioner(std::filesystem::path control_directory,
                                               PackageIndex package_index,
                                               bool provision_python)
    : control_directory_(std::move(control_directory))
    , package_index_(std::move(package_index))
    , provision_python_(provision_python) {
}

bool EnvironmentProvisioner::RuntimeExists() const {
    std::error_code ec;
    return std::filesystem::exists(marker_path(), ec);
}

// ============================================================================
// RUNTIME
// ============================================================================

ProvisionOutcome EnvironmentProvisioner::EnsureRuntime() {
    if (RuntimeExists()) {
        spdlog::debug("Reusing runtime at {}", runtime_directory().string());
        return ProvisionOutcome::REUSED;
    }

    spdlog::info("Provisioning sandbox runtime at {}", runtime_directory().string());
    std::filesystem::create_directories(control_directory_);

    nlohmann::json marker = {
        {"created_at", CurrentTimestamp()},
        {"python", nullptr}
    };

    auto python = provision_python_ ? utils::FindExecutable("python3") : std::nullopt;
    if (python) {
        utils::ProcessOptions options;
        options.argv = {python->string(), "-m", "venv", "--without-pip",
                        runtime_directory().string()};
        auto result = utils::RunProcess(options);
        if (!result.success()) {
            throw SandboxError("Failed to create Python runtime at " + runtime_directory().string() +
                               " (" + utils::DescribeExit(result) + ")", result.output);
        }
        marker["python"] = (runtime_directory() / "bin" / "python").string();
    } else {
        if (provision_python_) {
            spdlog::warn("python3 not found; provisioning a bare runtime");
        }
        std::filesystem::create_directories(runtime_directory() / "bin");
    }

    std::ofstream out(marker_path(), std::ios::trunc);
    if (!out) {
        throw SandboxError("Failed to write runtime marker " + marker_path().string());
    }
    out << marker.dump(2);

    ++provision_count_;
    spdlog::info("✓ Sandbox runtime ready");
    return ProvisionOutcome::CREATED;
}

std::filesystem::path EnvironmentProvisioner::InstallLauncher(const std::filesystem::path& source) {
    std::error_code ec;
    if (!std::filesystem::exists(source, ec)) {
        throw SandboxError("Launcher executable not found: " + source.string());
    }

    const auto target = launcher_path();
    try {
        if (std::filesystem::exists(target, ec) &&
            utils::HashUtils::ComputeSHA256(target) == utils::HashUtils::ComputeSHA256(source)) {
            return target;
        }

        std::filesystem::create_directories(target.parent_path());
        // Write next to the target and rename so a running copy is never truncated
        auto staging = target;
        staging += ".new";
        std::filesystem::copy_file(source, staging, std::filesystem::copy_options::overwrite_existing);
        std::filesystem::permissions(staging,
                                     std::filesystem::perms::owner_all |
                                     std::filesystem::perms::group_read | std::filesystem::perms::group_exec |
                                     std::filesystem::perms::others_read | std::filesystem::perms::others_exec);
        std::filesystem::rename(staging, target);
    } catch (const std::filesystem::filesystem_error& e) {
        throw SandboxError("Failed to install launcher into " + target.string(), e.what());
    } catch (const std::runtime_error& e) {
        throw SandboxError("Failed to hash launcher " + source.string(), e.what());
    }

    spdlog::debug("Installed launcher {}", target.string());
    return target;
}

// ============================================================================
// PACKAGE INSTALLERS
// ============================================================================

std::filesystem::path EnvironmentProvisioner::PythonExecutable() const {
    std::error_code ec;
    auto runtime_python = runtime_directory() / "bin" / "python";
    if (std::filesystem::exists(runtime_python, ec)) {
        return runtime_python;
    }
    if (auto python = utils::FindExecutable("python3")) {
        return *python;
    }
    return "python3";
}

void EnvironmentProvisioner::WritePipConfig() const {
    std::filesystem::create_directories(runtime_directory());
    std::ofstream out(runtime_directory() / "pip.conf", std::ios::trunc);
    if (!out) {
        throw SandboxError("Failed to write pip configuration in " + runtime_directory().string());
    }
    out << "[global]\n"
        << "index-url = " << package_index_.url << "\n"
        << "trusted-host = " << package_index_.trusted_host << "\n";
}

void EnvironmentProvisioner::EnsurePackageInstaller() {
    WritePipConfig();

    const auto python = PythonExecutable().string();
    auto env = PrivateEnvironment();

    utils::ProcessOptions pip_check;
    pip_check.argv = {python, "-m", "pip", "--version"};
    pip_check.environment = env;
    if (utils::RunProcess(pip_check).success()) {
        return;
    }

    spdlog::info("Bootstrapping pip into {}", runtime_directory().string());
    utils::ProcessOptions bootstrap;
    bootstrap.argv = {python, "-m", "ensurepip", "--upgrade"};
    bootstrap.environment = env;
    bootstrap.environment.erase("PIP_TARGET");
    bootstrap.unset_environment = {"PIP_TARGET"};

    auto result = utils::RunProcess(bootstrap);
    if (!result.success()) {
        throw SandboxError("Failed to bootstrap pip (" + utils::DescribeExit(result) + ")",
                           result.output);
    }
}

std::map<std::string, std::string> EnvironmentProvisioner::PrivateEnvironment() const {
    const auto pylibs = control_directory_ / ".pylibs";
    const auto pip_cache = control_directory_ / ".pip-cache";
    const auto npm_global = control_directory_ / ".npm-global";
    const auto npm_cache = control_directory_ / ".npm-cache";

    for (const auto& dir : {pylibs, pip_cache, npm_global, npm_cache}) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            spdlog::debug("Could not create {}: {}", dir.string(), ec.message());
        }
    }

    std::map<std::string, std::string> env;
    env["PIP_TARGET"] = pylibs.string();
    env["PIP_CACHE_DIR"] = pip_cache.string();
    env["PIP_CONFIG_FILE"] = (runtime_directory() / "pip.conf").string();
    env["NPM_CONFIG_PREFIX"] = npm_global.string();
    env["NPM_CONFIG_CACHE"] = npm_cache.string();
    env["NODE_PATH"] = (npm_global / "lib" / "node_modules").string();
    env["VIRTUAL_ENV"] = runtime_directory().string();
    env["WARDEN_PYTHON"] = PythonExecutable().string();

    std::string pythonpath = pylibs.string();
    if (const char* existing = std::getenv("PYTHONPATH"); existing && *existing) {
        pythonpath += ":" + std::string(existing);
    }
    env["PYTHONPATH"] = pythonpath;

    std::string path = (runtime_directory() / "bin").string() + ":" + (npm_global / "bin").string();
    if (const char* existing = std::getenv("PATH"); existing && *existing) {
        path += ":" + std::string(existing);
    } else {
        path += ":/usr/local/bin:/usr/bin:/bin";
    }
    env["PATH"] = path;

    return env;
}

void EnvironmentProvisioner::InstallDependencies(
    const std::vector<std::string>& dependencies,
    const std::optional<std::filesystem::path>& working_directory) {

    bool pip_ready = false;
    for (const auto& raw : dependencies) {
        const auto dependency = utils::StringUtils::Trim(raw);
        if (dependency.empty()) {
            continue;
        }

        utils::ProcessOptions options;
        options.working_directory = working_directory;
        options.environment = PrivateEnvironment();
        std::string package;

        if (utils::StringUtils::StartsWith(dependency, kNpmPrefix)) {
            package = dependency.substr(std::char_traits<char>::length(kNpmPrefix));
            options.argv = {"npm", "install", "-g", package};
        } else {
            package = utils::StringUtils::StartsWith(dependency, kPipPrefix)
                ? dependency.substr(std::char_traits<char>::length(kPipPrefix))
                : dependency;
            if (!pip_ready) {
                EnsurePackageInstaller();
                pip_ready = true;
            }
            options.argv = {PythonExecutable().string(), "-m", "pip", "install", package,
                            "-i", package_index_.url, "--trusted-host", package_index_.trusted_host};
        }

        spdlog::info("Installing dependency {}", dependency);
        utils::ProcessResult result;
        try {
            result = utils::RunProcess(options);
        } catch (const std::runtime_error& e) {
            throw SandboxError("Failed to install " + dependency, e.what());
        }
        if (!result.success()) {
            throw SandboxError("Failed to install " + dependency + " (" +
                               utils::DescribeExit(result) + ")", result.output);
        }
    }
}

void EnvironmentProvisioner::RunInstallCommand(
    const std::string& command,
    const std::optional<std::filesystem::path>& working_directory) {

    utils::ProcessOptions options;
    options.argv = {"/bin/sh", "-c", command};
    options.working_directory = working_directory;
    options.environment = PrivateEnvironment();

    spdlog::info("Running install command: {}", command);
    auto result = utils::RunProcess(options);
    if (!result.success()) {
        throw SandboxError("Install command failed (" + utils::DescribeExit(result) + "): " + command,
                           result.output);
    }
}

} // namespace core
} // namespace warden
