/**
 * @file execution_types.hpp
 * @brief Request and response envelopes exchanged with the sandboxed child
 *
 * One ExecutionRequest is serialized to the request artifact before a child is
 * spawned; the launcher answers with exactly one ExecutionResult in the
 * response artifact. Both are JSON documents.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace warden {
namespace core {

/**
 * @enum ExecutionMode
 * @brief Kind of work item carried by a request
 */
enum class ExecutionMode {
    LIBRARY_CALL,  ///< Function from an installed module
    MODULE_CALL,   ///< Function from a module file path
    SCRIPT_RUN,    ///< Standalone script
    SHELL_RUN      ///< Raw shell command
};

std::string ExecutionModeToString(ExecutionMode mode);
ExecutionMode ExecutionModeFromString(const std::string& text);

// ============================================================================
// TARGETS
// ============================================================================

/// Installed module resolved on the search path
struct LibraryTarget {
    std::string module;                     ///< Dotted module name (e.g. "tools.math")
    std::optional<std::string> class_name;  ///< Class to instantiate before the call
    std::string function;                   ///< Function or method name
};

/// Module loaded straight from a file
struct ModuleTarget {
    std::filesystem::path module_path;
    std::string function;
};

struct ScriptTarget {
    std::filesystem::path script_path;
    std::vector<std::string> arguments;
};

struct ShellTarget {
    std::string command;
};

using ExecutionTarget = std::variant<LibraryTarget, ModuleTarget, ScriptTarget, ShellTarget>;

/**
 * @struct ResourceLimits
 * @brief Ceilings reapplied inside every child
 */
struct ResourceLimits {
    std::uint64_t cpu_time_seconds{60};                   ///< RLIMIT_CPU soft limit
    std::uint64_t memory_bytes{1024ULL * 1024 * 1024};    ///< RLIMIT_AS ceiling (already clamped)
    std::vector<std::filesystem::path> allowed_paths;     ///< Guard roots
};

/**
 * @struct PackageIndex
 * @brief Package mirror used for dependency installs
 */
struct PackageIndex {
    std::string url{"https://pypi.tuna.tsinghua.edu.cn/simple"};
    std::string trusted_host{"pypi.tuna.tsinghua.edu.cn"};
};

/**
 * @struct ExecutionRequest
 * @brief One work item, created per call and discarded after it
 *
 * The mode is derived from the active target alternative, so a request can
 * never carry a target that disagrees with its mode. All paths are expressed
 * in the child's view of the filesystem once the dispatcher has translated
 * them.
 */
struct ExecutionRequest {
    ExecutionTarget target;
    nlohmann::json args = nlohmann::json::array();
    nlohmann::json kwargs = nlohmann::json::object();
    std::optional<std::filesystem::path> working_directory;
    std::vector<std::filesystem::path> search_paths;
    std::vector<std::string> dependencies;
    std::optional<std::string> install_command;
    ResourceLimits limits;
    bool enforce_allowlist{false};
    std::filesystem::path control_directory;
    std::filesystem::path runtime_directory;
    PackageIndex package_index;

    ExecutionMode mode() const;
};

/**
 * @enum ExecutionStatus
 */
enum class ExecutionStatus {
    SUCCESS,
    ERROR
};

/**
 * @struct ExecutionResult
 * @brief Response envelope written once by the launcher
 *
 * `result` is meaningful only on success; `error_message` and `error_trace`
 * only on error. For scripts and shell commands a successful result equals
 * captured_output.
 */
struct ExecutionResult {
    ExecutionStatus status{ExecutionStatus::SUCCESS};
    nlohmann::json result;
    std::string error_message;
    std::string error_trace;
    std::string captured_output;

    bool ok() const { return status == ExecutionStatus::SUCCESS; }

    static ExecutionResult Success(nlohmann::json value, std::string output = {});
    static ExecutionResult Failure(std::string message, std::string trace,
                                   std::string output = {});
};

// ============================================================================
// JSON ENVELOPES
// ============================================================================

void to_json(nlohmann::json& j, const ExecutionRequest& request);
void from_json(const nlohmann::json& j, ExecutionRequest& request);

void to_json(nlohmann::json& j, const ExecutionResult& result);
void from_json(const nlohmann::json& j, ExecutionResult& result);

/**
 * @brief Write an envelope to disk atomically (temp file + rename)
 * @throws std::runtime_error on I/O failure
 */
void WriteEnvelope(const std::filesystem::path& path, const nlohmann::json& envelope);

/**
 * @brief Read and parse an envelope
 * @throws std::runtime_error if the file is missing or not valid JSON
 */
nlohmann::json ReadEnvelope(const std::filesystem::path& path);

} // namespace core
} // namespace warden
