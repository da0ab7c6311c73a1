/**
 * @file seatbelt_backend.cpp
 * @brief macOS sandbox-exec profile generation and launch
 *
 * Profile sketch:
 * ```
 * (version 1)
 * (deny default)
 * (allow file-read*)
 * (allow file-write* (subpath "<workspace>") (subpath "<control>") ...)
 * (allow process* signal network* sysctl-read mach-lookup ipc-posix-shm)
 * ```
 *
 * @date 2025
 */

#include "warden/isolation/backends.hpp"
#include "warden/core/errors.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <set>
#include <sstream>
#include <system_error>

namespace warden {
namespace isolation {

namespace {

std::string QuoteProfileString(const std::string& value) {
    auto escaped = utils::StringUtils::ReplaceAll(value, "\\", "\\\\");
    escaped = utils::StringUtils::ReplaceAll(escaped, "\"", "\\\"");
    return "\"" + escaped + "\"";
}

} // anonymous namespace

std::filesystem::path SeatbeltBackend::ProfilePath(const LaunchSpec& spec) const {
    return context_.control_directory / ("profile_" + spec.run_id + ".sb");
}

std::string SeatbeltBackend::GenerateProfile() const {
    std::set<std::string> writable;
    writable.insert(context_.host_workspace.string());
    writable.insert(context_.control_directory.string());
    for (const auto& path : context_.allowed_paths) {
        writable.insert(path.string());
    }
    writable.insert("/private/tmp");
    writable.insert("/private/var/folders");

    std::ostringstream profile;
    profile << "(version 1)\n"
            << "(deny default)\n"
            << "(allow file-read*)\n"
            << "(allow file-write*\n";
    for (const auto& path : writable) {
        profile << "    (literal " << QuoteProfileString(path) << ")\n"
                << "    (subpath " << QuoteProfileString(path) << ")\n";
    }
    profile << "    (subpath \"/dev\"))\n"
            << "(allow process*)\n"
            << "(allow signal)\n"
            << "(allow network*)\n"
            << "(allow sysctl-read)\n"
            << "(allow mach-lookup)\n"
            << "(allow ipc-posix-shm)\n";
    return profile.str();
}

utils::ProcessOptions SeatbeltBackend::BuildLaunch(const LaunchSpec& spec) {
    auto sandbox_exec = RequireHelper("sandbox-exec", "native profile isolation is macOS only");

    const auto profile_path = ProfilePath(spec);
    {
        std::ofstream out(profile_path, std::ios::trunc);
        if (!out) {
            throw core::SandboxError("Failed to write sandbox profile: " + profile_path.string());
        }
        out << GenerateProfile();
    }

    utils::ProcessOptions options;
    options.argv = {
        sandbox_exec.string(), "-f", profile_path.string(),
        spec.launcher.string(), spec.request.string(), spec.response.string(),
    };
    options.working_directory = spec.working_directory;
    options.merge_stderr = false;

    spdlog::debug("seatbelt launch: {}", utils::StringUtils::JoinShellQuoted(options.argv));
    return options;
}

void SeatbeltBackend::Cleanup(const LaunchSpec& spec) {
    std::error_code ec;
    std::filesystem::remove(ProfilePath(spec), ec);
}

} // namespace isolation
} // namespace warden
