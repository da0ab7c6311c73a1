/**
 * @file process_utils.hpp
 * @brief Child process spawning with output capture
 *
 * fork/exec wrapper used by every isolation backend and by the launcher for
 * scripts, shell commands and package installers. Processes are always
 * spawned from an argv vector; a shell is involved only when the argv itself
 * names one.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace warden {
namespace utils {

/**
 * @struct ProcessOptions
 * @brief Everything needed to start one child process
 */
struct ProcessOptions {
    std::vector<std::string> argv;                    ///< Program and arguments (argv[0] resolved on PATH)
    std::optional<std::filesystem::path> working_directory;  ///< chdir target in the child
    std::map<std::string, std::string> environment;   ///< Variables set on top of the inherited environment
    std::vector<std::string> unset_environment;       ///< Variables removed from the inherited environment
    bool merge_stderr{true};                          ///< Send stderr into the stdout capture
    bool new_process_group{true};                     ///< setpgid(0, 0) so the whole group can be killed
    std::chrono::milliseconds timeout{0};             ///< Wall-clock deadline (0 = none)
    std::size_t max_output_bytes{16 * 1024 * 1024};  ///< Capture cap per stream

    /// Runs in the child after fork, before exec (resource limits, etc.)
    std::function<void()> pre_exec;

    /// When set, the child runs this instead of exec'ing argv and exits with its return value
    std::function<int()> entry;
};

/**
 * @struct ProcessResult
 * @brief Outcome of a finished child process
 */
struct ProcessResult {
    int exit_code{-1};                      ///< Exit status, or 128 + signal when killed
    int term_signal{0};                     ///< Terminating signal (0 if exited normally)
    bool timed_out{false};                  ///< Killed because the wall-clock deadline passed
    std::string output;                     ///< Captured stdout (and stderr when merged)
    std::string error_output;               ///< Captured stderr when not merged
    std::chrono::milliseconds duration{0};  ///< Wall-clock runtime

    bool success() const { return !timed_out && term_signal == 0 && exit_code == 0; }
};

/**
 * @brief Run a child process to completion and capture its output
 *
 * The caller's thread blocks until the child exits. When a timeout is set
 * and expires, the child's process group receives SIGKILL.
 *
 * @param options Process description
 * @return ProcessResult with exit status and captured output
 *
 * @throws std::runtime_error if the executable cannot be found, fork fails,
 *         or exec fails in the child
 */
ProcessResult RunProcess(const ProcessOptions& options);

/**
 * @brief Start a fully detached process writing to a log file
 *
 * The process is double-forked into its own session so it is never left as a
 * zombie of the caller. stdin is /dev/null, stdout and stderr append to
 * log_file.
 *
 * @return PID of the detached process
 * @throws std::runtime_error if the process could not be started
 */
pid_t SpawnDetached(const ProcessOptions& options, const std::filesystem::path& log_file);

/**
 * @brief Resolve an executable name against PATH
 *
 * Names containing '/' are checked directly.
 *
 * @param name Executable name
 * @param search_path PATH-style list (defaults to the current PATH)
 * @return Absolute path if found and executable
 */
std::optional<std::filesystem::path> FindExecutable(const std::string& name,
                                                    const std::optional<std::string>& search_path = std::nullopt);

/**
 * @brief Human-readable description of how a process ended
 *
 * Examples: "exit code 2", "terminated by signal SIGXCPU (24)",
 * "killed after wall-clock timeout".
 */
std::string DescribeExit(const ProcessResult& result);

/**
 * @brief Symbolic name for a signal number (e.g. "SIGKILL")
 */
std::string SignalName(int signal_number);

} // namespace utils
} // namespace warden
