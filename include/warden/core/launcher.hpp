/**
 * @file launcher.hpp
 * @brief Fixed program run inside every sandboxed child
 *
 * The launcher reads one request artifact, applies resource limits, builds
 * the allow-list guard, dispatches the work item and writes exactly one
 * response artifact. It is the entry point of the `warden-launcher`
 * executable and is also called directly by the in-process backend.
 *
 * Exit status: 0 when a response envelope (success or error) was written,
 * nonzero when even the error envelope could not be written.
 *
 * @date 2025
 */

#pragma once

#include "warden/core/allowlist_guard.hpp"
#include "warden/core/execution_types.hpp"

#include <exception>
#include <filesystem>
#include <string>
#include <vector>

namespace warden {
namespace core {

/**
 * @class Launcher
 * @brief Request dispatcher executed in the child process
 */
class Launcher {
public:
    /**
     * @brief Process one request/response artifact pair
     * @return Process exit status
     */
    static int Run(const std::filesystem::path& request_path,
                   const std::filesystem::path& response_path);

    /**
     * @brief Execute a parsed request (limits must already be applied)
     *
     * Failures are returned as an error ExecutionResult, never thrown.
     */
    static ExecutionResult Execute(const ExecutionRequest& request, const AllowlistGuard& guard);

    /**
     * @brief Locate the shared object for a dotted module name
     *
     * "pkg.tool" is looked up as pkg/libtool.so and pkg/tool.so in each
     * search directory.
     *
     * @throws std::runtime_error if no candidate exists
     */
    static std::filesystem::path ResolveModule(const std::string& module,
                                               const std::vector<std::filesystem::path>& search_paths);

    /**
     * @brief Interpreter argv prefix for a script, by file extension
     * @return Empty when the extension names no supported runtime
     */
    static std::vector<std::string> RuntimeCommand(const std::filesystem::path& script,
                                                   const std::filesystem::path& python);

    /**
     * @brief Indented "Type: message" chain of a nested exception
     */
    static std::string FormatTrace(const std::exception& error);

    /// Message of the innermost nested exception
    static std::string InnermostMessage(const std::exception& error);

    /**
     * @brief Search directories for library_call
     *
     * Request entries first, then WARDEN_MODULE_PATH, then the current
     * working directory.
     */
    static std::vector<std::filesystem::path> ModuleSearchPath(const ExecutionRequest& request);
};

} // namespace core
} // namespace warden
