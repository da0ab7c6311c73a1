/**
 * @file execution_types.cpp
 * @brief JSON serialization of request and response envelopes
 *
 * Request layout:
 * ```json
 * {
 *   "mode": "library_call",
 *   "target": {"module": "tools.math", "class_name": null, "function": "add"},
 *   "args": [1, 2], "kwargs": {},
 *   "working_directory": "/workspace",
 *   "search_paths": [], "dependencies": [], "install_command": null,
 *   "limits": {"cpu_time_seconds": 60, "memory_bytes": 1073741824, "allowed_paths": []},
 *   "enforce_allowlist": false,
 *   "control_directory": "...", "runtime_directory": "...",
 *   "package_index": {"url": "...", "trusted_host": "..."}
 * }
 * ```
 *
 * @date 2025
 */

#include "warden/core/execution_types.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

namespace warden {
namespace core {

namespace {

std::vector<std::string> PathsToStrings(const std::vector<std::filesystem::path>& paths) {
    std::vector<std::string> out;
    out.reserve(paths.size());
    for (const auto& p : paths) {
        out.push_back(p.string());
    }
    return out;
}

std::vector<std::filesystem::path> StringsToPaths(const nlohmann::json& j) {
    std::vector<std::filesystem::path> out;
    if (!j.is_array()) {
        return out;
    }
    for (const auto& item : j) {
        out.emplace_back(item.get<std::string>());
    }
    return out;
}

nlohmann::json OptionalString(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<std::string> ReadOptionalString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // anonymous namespace

std::string ExecutionModeToString(ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::LIBRARY_CALL: return "library_call";
        case ExecutionMode::MODULE_CALL:  return "module_call";
        case ExecutionMode::SCRIPT_RUN:   return "script_run";
        case ExecutionMode::SHELL_RUN:    return "shell_run";
    }
    return "unknown";
}

ExecutionMode ExecutionModeFromString(const std::string& text) {
    if (text == "library_call") return ExecutionMode::LIBRARY_CALL;
    if (text == "module_call")  return ExecutionMode::MODULE_CALL;
    if (text == "script_run")   return ExecutionMode::SCRIPT_RUN;
    if (text == "shell_run")    return ExecutionMode::SHELL_RUN;
    throw std::invalid_argument("Unknown execution mode: " + text);
}

ExecutionMode ExecutionRequest::mode() const {
    switch (target.index()) {
        case 0:  return ExecutionMode::LIBRARY_CALL;
        case 1:  return ExecutionMode::MODULE_CALL;
        case 2:  return ExecutionMode::SCRIPT_RUN;
        default: return ExecutionMode::SHELL_RUN;
    }
}

ExecutionResult ExecutionResult::Success(nlohmann::json value, std::string output) {
    ExecutionResult r;
    r.status = ExecutionStatus::SUCCESS;
    r.result = std::move(value);
    r.captured_output = std::move(output);
    return r;
}

ExecutionResult ExecutionResult::Failure(std::string message, std::string trace,
                                         std::string output) {
    ExecutionResult r;
    r.status = ExecutionStatus::ERROR;
    r.error_message = std::move(message);
    r.error_trace = std::move(trace);
    r.captured_output = std::move(output);
    return r;
}

// ============================================================================
// REQUEST
// ============================================================================

void to_json(nlohmann::json& j, const ExecutionRequest& request) {
    nlohmann::json target;
    if (const auto* lib = std::get_if<LibraryTarget>(&request.target)) {
        target = {{"module", lib->module},
                  {"class_name", OptionalString(lib->class_name)},
                  {"function", lib->function}};
    } else if (const auto* mod = std::get_if<ModuleTarget>(&request.target)) {
        target = {{"module_path", mod->module_path.string()}, {"function", mod->function}};
    } else if (const auto* script = std::get_if<ScriptTarget>(&request.target)) {
        target = {{"script_path", script->script_path.string()},
                  {"arguments", script->arguments}};
    } else {
        target = {{"command", std::get<ShellTarget>(request.target).command}};
    }

    j = nlohmann::json{
        {"mode", ExecutionModeToString(request.mode())},
        {"target", target},
        {"args", request.args},
        {"kwargs", request.kwargs},
        {"working_directory", request.working_directory
            ? nlohmann::json(request.working_directory->string()) : nlohmann::json(nullptr)},
        {"search_paths", PathsToStrings(request.search_paths)},
        {"dependencies", request.dependencies},
        {"install_command", OptionalString(request.install_command)},
        {"limits", {
            {"cpu_time_seconds", request.limits.cpu_time_seconds},
            {"memory_bytes", request.limits.memory_bytes},
            {"allowed_paths", PathsToStrings(request.limits.allowed_paths)}
        }},
        {"enforce_allowlist", request.enforce_allowlist},
        {"control_directory", request.control_directory.string()},
        {"runtime_directory", request.runtime_directory.string()},
        {"package_index", {
            {"url", request.package_index.url},
            {"trusted_host", request.package_index.trusted_host}
        }}
    };
}

void from_json(const nlohmann::json& j, ExecutionRequest& request) {
    const auto mode = ExecutionModeFromString(j.at("mode").get<std::string>());
    const auto& target = j.at("target");

    switch (mode) {
        case ExecutionMode::LIBRARY_CALL:
            request.target = LibraryTarget{target.at("module").get<std::string>(),
                                           ReadOptionalString(target, "class_name"),
                                           target.at("function").get<std::string>()};
            break;
        case ExecutionMode::MODULE_CALL:
            request.target = ModuleTarget{target.at("module_path").get<std::string>(),
                                          target.at("function").get<std::string>()};
            break;
        case ExecutionMode::SCRIPT_RUN:
            request.target = ScriptTarget{
                target.at("script_path").get<std::string>(),
                target.value("arguments", std::vector<std::string>{})};
            break;
        case ExecutionMode::SHELL_RUN:
            request.target = ShellTarget{target.at("command").get<std::string>()};
            break;
    }

    request.args = j.value("args", nlohmann::json::array());
    request.kwargs = j.value("kwargs", nlohmann::json::object());

    if (auto cwd = ReadOptionalString(j, "working_directory")) {
        request.working_directory = std::filesystem::path(*cwd);
    } else {
        request.working_directory.reset();
    }

    request.search_paths = StringsToPaths(j.value("search_paths", nlohmann::json::array()));
    request.dependencies = j.value("dependencies", std::vector<std::string>{});
    request.install_command = ReadOptionalString(j, "install_command");

    const auto& limits = j.at("limits");
    request.limits.cpu_time_seconds = limits.at("cpu_time_seconds").get<std::uint64_t>();
    request.limits.memory_bytes = limits.at("memory_bytes").get<std::uint64_t>();
    request.limits.allowed_paths = StringsToPaths(limits.value("allowed_paths", nlohmann::json::array()));

    request.enforce_allowlist = j.value("enforce_allowlist", false);
    request.control_directory = j.value("control_directory", std::string{});
    request.runtime_directory = j.value("runtime_directory", std::string{});

    if (j.contains("package_index")) {
        const auto& index = j.at("package_index");
        request.package_index.url = index.value("url", request.package_index.url);
        request.package_index.trusted_host =
            index.value("trusted_host", request.package_index.trusted_host);
    }
}

// ============================================================================
// RESULT
// ============================================================================

void to_json(nlohmann::json& j, const ExecutionResult& result) {
    j = nlohmann::json{
        {"status", result.ok() ? "success" : "error"},
        {"captured_output", result.captured_output}
    };
    if (result.ok()) {
        j["result"] = result.result;
    } else {
        j["error_message"] = result.error_message;
        j["error_trace"] = result.error_trace;
    }
}

void from_json(const nlohmann::json& j, ExecutionResult& result) {
    const auto status = j.at("status").get<std::string>();
    if (status == "success") {
        result.status = ExecutionStatus::SUCCESS;
        result.result = j.value("result", nlohmann::json());
    } else if (status == "error") {
        result.status = ExecutionStatus::ERROR;
        result.error_message = j.value("error_message", std::string{});
        result.error_trace = j.value("error_trace", std::string{});
    } else {
        throw std::invalid_argument("Unknown result status: " + status);
    }
    result.captured_output = j.value("captured_output", std::string{});
}

// ============================================================================
// ARTIFACT I/O
// ============================================================================

void WriteEnvelope(const std::filesystem::path& path, const nlohmann::json& envelope) {
    auto temp = path;
    temp += ".tmp";

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Failed to open artifact for writing: " + temp.string());
        }
        // Captured output is arbitrary bytes; invalid UTF-8 becomes U+FFFD
        out << envelope.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        if (!out) {
            throw std::runtime_error("Failed to write artifact: " + temp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        std::filesystem::remove(temp, ec);
        throw std::runtime_error("Failed to publish artifact: " + path.string());
    }
}

nlohmann::json ReadEnvelope(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Artifact not found: " + path.string());
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed artifact " + path.string() + ": " + e.what());
    }
}

} // namespace core
} // namespace warden
