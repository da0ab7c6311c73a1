/**
 * @file bubblewrap_backend.cpp
 * @brief Linux namespace isolation through bubblewrap
 *
 * **Mount layout inside the child**:
 * ```
 * /usr, /etc, /lib, ...     read-only binds of the host entries
 * /bin -> usr/bin           host symlinks recreated as symlinks
 * /proc /dev /tmp           fresh procfs, minimal devtmpfs, empty tmpfs
 * <virtual_workspace>       read-write bind of the host workspace
 * <control_directory>       read-write bind at its real host path
 * ```
 *
 * @date 2025
 */

#include "warden/isolation/backends.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <system_error>

namespace warden {
namespace isolation {

namespace {

const std::set<std::string>& ReplacedMounts() {
    static const std::set<std::string> mounts = {"proc", "dev", "tmp"};
    return mounts;
}

} // anonymous namespace

std::filesystem::path BubblewrapBackend::ToChildPath(const std::filesystem::path& host_path) const {
    const auto text = host_path.string();
    const auto host = context_.host_workspace.string();
    if (text == host) {
        return context_.virtual_workspace;
    }
    if (utils::StringUtils::StartsWith(text, host + "/")) {
        return context_.virtual_workspace / text.substr(host.size() + 1);
    }
    return host_path;
}

std::vector<std::string> BubblewrapBackend::BuildArguments(const LaunchSpec& spec) const {
    std::vector<std::string> args = {
        "--die-with-parent",
        "--unshare-all",
        "--share-net",
    };

    std::vector<std::filesystem::directory_entry> entries;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(system_root_, ec), end; !ec && it != end;
         it.increment(ec)) {
        entries.push_back(*it);
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.path().filename() < b.path().filename(); });

    for (const auto& entry : entries) {
        const auto name = entry.path().filename().string();
        if (ReplacedMounts().count(name) > 0) {
            continue;
        }
        const auto child_path = "/" + name;

        std::error_code link_ec;
        if (entry.is_symlink(link_ec)) {
            auto target = std::filesystem::read_symlink(entry.path(), link_ec);
            if (!link_ec) {
                args.insert(args.end(), {"--symlink", target.string(), child_path});
            }
            continue;
        }
        args.insert(args.end(), {"--ro-bind", entry.path().string(), child_path});
    }

    args.insert(args.end(), {"--proc", "/proc", "--dev", "/dev", "--tmpfs", "/tmp"});

    args.insert(args.end(), {"--bind", context_.host_workspace.string(),
                             context_.virtual_workspace.string()});
    args.insert(args.end(), {"--bind", context_.control_directory.string(),
                             context_.control_directory.string()});
    args.insert(args.end(), {"--chdir", ToChildPath(spec.working_directory).string()});

    return args;
}

utils::ProcessOptions BubblewrapBackend::BuildLaunch(const LaunchSpec& spec) {
    auto bwrap = RequireHelper("bwrap", "install bubblewrap or set isolation_mode to 'subprocess'");

    utils::ProcessOptions options;
    options.argv.push_back(bwrap.string());
    auto args = BuildArguments(spec);
    options.argv.insert(options.argv.end(), args.begin(), args.end());
    options.argv.push_back("--");
    options.argv.push_back(ToChildPath(spec.launcher).string());
    options.argv.push_back(ToChildPath(spec.request).string());
    options.argv.push_back(ToChildPath(spec.response).string());
    options.merge_stderr = false;

    spdlog::debug("bwrap launch: {}", utils::StringUtils::JoinShellQuoted(options.argv));
    return options;
}

} // namespace isolation
} // namespace warden
