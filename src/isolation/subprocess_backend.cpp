/**
 * @file subprocess_backend.cpp
 * @brief Backends without OS filesystem isolation
 *
 * Both rely on the launcher's resource limits and AllowlistGuard. The
 * in-process variant skips exec entirely: the forked copy of the host runs
 * the launcher entry point and exits with its status.
 *
 * @date 2025
 */

#include "warden/isolation/backends.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace warden {
namespace isolation {

utils::ProcessOptions SubprocessBackend::BuildLaunch(const LaunchSpec& spec) {
    utils::ProcessOptions options;
    options.argv = {spec.launcher.string(), spec.request.string(), spec.response.string()};
    options.working_directory = spec.working_directory;
    options.merge_stderr = false;

    spdlog::debug("subprocess launch: {}", utils::StringUtils::JoinShellQuoted(options.argv));
    return options;
}

utils::ProcessOptions InProcessBackend::BuildLaunch(const LaunchSpec& spec) {
    utils::ProcessOptions options;
    options.working_directory = spec.working_directory;
    options.merge_stderr = false;

    auto entry = entry_;
    auto request = spec.request;
    auto response = spec.response;
    options.entry = [entry, request, response]() { return entry(request, response); };

    spdlog::debug("in-process launch for {}", spec.request.string());
    return options;
}

} // namespace isolation
} // namespace warden
