/**
 * @file launcher.cpp
 * @brief Child-side request dispatch
 *
 * **Sequence**:
 * ```
 * read request ─▶ apply limits ─▶ build guard ─▶ restore search paths
 *      ─▶ chdir ─▶ dispatch(mode) ─▶ write response (success | error)
 * ```
 * Any failure after the request has been read is converted into an error
 * envelope. If that write fails as well, the process exits nonzero and the
 * dispatcher reports the missing artifact.
 *
 * @date 2025
 */

#include "warden/core/launcher.hpp"
#include "warden/core/environment_provisioner.hpp"
#include "warden/core/errors.hpp"
#include "warden/core/resource_limiter.hpp"
#include "warden/plugin/plugin_api.hpp"
#include "warden/utils/process_utils.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <typeinfo>

#include <dlfcn.h>
#include <unistd.h>

namespace warden {
namespace core {

namespace {

void ConfigureLauncherLogging() {
    auto sink = std::make_shared<spdlog::sinks::stderr_sink_st>();
    auto logger = std::make_shared<spdlog::logger>("launcher", sink);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S] [LAUNCHER] %v");
    logger->set_level(spdlog::level::info);
    if (const char* level = std::getenv("WARDEN_LAUNCHER_LOG_LEVEL")) {
        logger->set_level(spdlog::level::from_str(level));
    }
    spdlog::set_default_logger(logger);
}

/**
 * dlopen handle. Handles stay open for the life of the child: exceptions and
 * objects created by plugin code reference its code and type information.
 */
class SharedLibrary {
public:
    explicit SharedLibrary(const std::filesystem::path& path) : path_(path) {
        handle_ = ::dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
        if (handle_ == nullptr) {
            const char* reason = ::dlerror();
            throw std::runtime_error("Failed to load module " + path.string() + ": " +
                                     (reason ? reason : "unknown error"));
        }
    }

    template <typename T>
    T Symbol(const std::string& name) const {
        ::dlerror();
        void* symbol = ::dlsym(handle_, name.c_str());
        return reinterpret_cast<T>(symbol);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    void* handle_{nullptr};
};

class GuardedCallContext : public plugin::CallContext {
public:
    GuardedCallContext(const nlohmann::json& args, const nlohmann::json& kwargs,
                       std::filesystem::path working_directory, const AllowlistGuard& guard)
        : args_(args.is_array() ? args : nlohmann::json::array({args}))
        , kwargs_(kwargs.is_object() ? kwargs : nlohmann::json::object())
        , working_directory_(std::move(working_directory))
        , guard_(guard) {}

    const nlohmann::json& Args() const override { return args_; }
    const nlohmann::json& Kwargs() const override { return kwargs_; }
    std::filesystem::path WorkingDirectory() const override { return working_directory_; }

    std::string ReadFile(const std::filesystem::path& path) const override {
        return guard_.ReadFile(Absolute(path));
    }

    void WriteFile(const std::filesystem::path& path, const std::string& content,
                   bool append) const override {
        guard_.WriteFile(Absolute(path), content, append);
    }

private:
    std::filesystem::path Absolute(const std::filesystem::path& path) const {
        return path.is_absolute() ? path : working_directory_ / path;
    }

    nlohmann::json args_;
    nlohmann::json kwargs_;
    std::filesystem::path working_directory_;
    const AllowlistGuard& guard_;
};

nlohmann::json CallFunction(const SharedLibrary& library, const std::string& function,
                            plugin::CallContext& ctx) {
    auto entry = library.Symbol<plugin::FunctionEntry>(plugin::kFunctionPrefix + function);
    if (entry == nullptr) {
        throw std::runtime_error("Module " + library.path().filename().string() +
                                 " has no function '" + function + "'");
    }
    nlohmann::json result;
    entry(ctx, result);
    return result;
}

nlohmann::json CallMethod(const SharedLibrary& library, const std::string& class_name,
                          const std::string& method, plugin::CallContext& ctx) {
    auto factory = library.Symbol<plugin::ClassFactory>(plugin::kClassPrefix + class_name);
    if (factory == nullptr) {
        throw std::runtime_error("Module " + library.path().filename().string() +
                                 " has no class '" + class_name + "'");
    }
    std::unique_ptr<plugin::Object> instance(factory());
    if (!instance) {
        throw std::runtime_error("Factory for class '" + class_name + "' returned null");
    }
    if (!instance->HasMethod(method)) {
        throw std::runtime_error("Class '" + class_name + "' has no method '" + method + "'");
    }
    nlohmann::json result;
    instance->Invoke(method, ctx, result);
    return result;
}

std::string DescribeTarget(const ExecutionRequest& request) {
    if (const auto* lib = std::get_if<LibraryTarget>(&request.target)) {
        return "library_call " + lib->module + "." +
               (lib->class_name ? *lib->class_name + "." : std::string()) + lib->function;
    }
    if (const auto* mod = std::get_if<ModuleTarget>(&request.target)) {
        return "module_call " + mod->module_path.string() + ":" + mod->function;
    }
    if (const auto* script = std::get_if<ScriptTarget>(&request.target)) {
        return "script_run " + script->script_path.string();
    }
    return "shell_run";
}

void PrependEnvironmentPath(const char* name, const std::vector<std::filesystem::path>& entries) {
    if (entries.empty()) {
        return;
    }
    std::vector<std::string> parts;
    for (const auto& entry : entries) {
        parts.push_back(entry.string());
    }
    if (const char* existing = std::getenv(name); existing && *existing) {
        parts.emplace_back(existing);
    }
    ::setenv(name, utils::StringUtils::Join(parts, ":").c_str(), 1);
}

std::filesystem::path CurrentDirectory() {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return ec ? std::filesystem::path("/") : cwd;
}

// ============================================================================
// MODE HANDLERS
// ============================================================================

nlohmann::json RunLibraryCall(const ExecutionRequest& request, const LibraryTarget& target,
                              const AllowlistGuard& guard) {
    auto module_path = Launcher::ResolveModule(target.module, Launcher::ModuleSearchPath(request));
    spdlog::info("Loading module {} from {}", target.module, module_path.string());

    SharedLibrary library(module_path);
    GuardedCallContext ctx(request.args, request.kwargs, CurrentDirectory(), guard);
    if (target.class_name) {
        return CallMethod(library, *target.class_name, target.function, ctx);
    }
    return CallFunction(library, target.function, ctx);
}

nlohmann::json RunModuleCall(const ExecutionRequest& request, const ModuleTarget& target,
                             const AllowlistGuard& guard) {
    auto module_path = target.module_path.is_absolute()
        ? target.module_path : CurrentDirectory() / target.module_path;
    module_path = guard.Check(module_path);

    if (!request.dependencies.empty()) {
        EnvironmentProvisioner provisioner(request.control_directory, request.package_index);
        provisioner.InstallDependencies(request.dependencies, request.working_directory);
    }

    spdlog::info("Loading module file {}", module_path.string());
    SharedLibrary library(module_path);
    GuardedCallContext ctx(request.args, request.kwargs, CurrentDirectory(), guard);
    return CallFunction(library, target.function, ctx);
}

nlohmann::json RunScript(const ExecutionRequest& request, const ScriptTarget& target,
                         const AllowlistGuard& guard, std::string& captured) {
    EnvironmentProvisioner provisioner(request.control_directory, request.package_index);

    if (!request.dependencies.empty()) {
        provisioner.InstallDependencies(request.dependencies, request.working_directory);
    }
    if (request.install_command) {
        provisioner.RunInstallCommand(*request.install_command, request.working_directory);
    }

    auto script = target.script_path.is_absolute()
        ? target.script_path : CurrentDirectory() / target.script_path;
    script = guard.Check(script);

    utils::ProcessOptions options;
    options.environment = provisioner.PrivateEnvironment();
    options.working_directory = CurrentDirectory();

    auto runtime = Launcher::RuntimeCommand(script, provisioner.PythonExecutable());
    if (!runtime.empty()) {
        options.argv = runtime;
        options.argv.push_back(script.string());
    } else {
        // No known runtime: the script text runs in a fresh shell, $0 is the script path
        options.argv = {"/bin/sh", "-c", guard.ReadFile(script), script.string()};
    }
    options.argv.insert(options.argv.end(), target.arguments.begin(), target.arguments.end());

    spdlog::info("Running script {}", script.string());
    auto result = utils::RunProcess(options);
    captured = result.output;

    if (!result.success()) {
        throw SandboxError("Script " + script.filename().string() + " failed (" +
                           utils::DescribeExit(result) + ")", result.output);
    }
    return result.output;
}

nlohmann::json RunShell(const ExecutionRequest& request, const ShellTarget& target,
                        std::string& captured) {
    EnvironmentProvisioner provisioner(request.control_directory, request.package_index);

    utils::ProcessOptions options;
    options.argv = {"/bin/sh", "-c", target.command};
    options.environment = provisioner.PrivateEnvironment();
    options.working_directory = CurrentDirectory();

    spdlog::info("Running shell command: {}", utils::StringUtils::Truncate(target.command, 200));
    auto result = utils::RunProcess(options);
    captured = result.output;

    if (result.term_signal != 0 || result.timed_out) {
        throw SandboxError("Shell command " + utils::DescribeExit(result), result.output);
    }
    if (result.exit_code != 0) {
        throw SandboxError("Command failed with code " + std::to_string(result.exit_code),
                           result.output);
    }
    return result.output;
}

nlohmann::json Dispatch(const ExecutionRequest& request, const AllowlistGuard& guard,
                        std::string& captured) {
    if (const auto* lib = std::get_if<LibraryTarget>(&request.target)) {
        return RunLibraryCall(request, *lib, guard);
    }
    if (const auto* mod = std::get_if<ModuleTarget>(&request.target)) {
        return RunModuleCall(request, *mod, guard);
    }
    if (const auto* script = std::get_if<ScriptTarget>(&request.target)) {
        return RunScript(request, *script, guard, captured);
    }
    return RunShell(request, std::get<ShellTarget>(request.target), captured);
}

AllowlistGuard BuildGuard(const ExecutionRequest& request) {
    if (!request.enforce_allowlist) {
        return AllowlistGuard::Permissive();
    }
    auto roots = request.limits.allowed_paths;
    if (!request.control_directory.empty()) {
        roots.push_back(request.control_directory);
    }
    return AllowlistGuard(std::move(roots));
}

bool WriteResponse(const std::filesystem::path& response_path, const ExecutionResult& result) {
    try {
        WriteEnvelope(response_path, nlohmann::json(result));
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to write response {}: {}", response_path.string(), e.what());
    }

    // One last envelope without the payload that failed to serialize
    try {
        WriteEnvelope(response_path, nlohmann::json(ExecutionResult::Failure(
            "Failed to write sandbox response", {}, {})));
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to write error response {}: {}", response_path.string(), e.what());
        return false;
    }
}

} // anonymous namespace

// ============================================================================
// PUBLIC API
// ============================================================================

std::vector<std::filesystem::path> Launcher::ModuleSearchPath(const ExecutionRequest& request) {
    std::vector<std::filesystem::path> paths = request.search_paths;
    if (const char* env = std::getenv("WARDEN_MODULE_PATH")) {
        for (const auto& entry : utils::StringUtils::Split(env, ':')) {
            paths.emplace_back(entry);
        }
    }
    paths.push_back(CurrentDirectory());
    return paths;
}

std::filesystem::path Launcher::ResolveModule(const std::string& module,
                                              const std::vector<std::filesystem::path>& search_paths) {
    if (module.empty()) {
        throw std::invalid_argument("Module name is empty");
    }

    std::filesystem::path relative(utils::StringUtils::ReplaceAll(module, ".", "/"));
    const auto stem = relative.filename().string();
    const auto parent = relative.parent_path();

    std::vector<std::string> names = {"lib" + stem + ".so", stem + ".so"};
#ifdef __APPLE__
    names.push_back("lib" + stem + ".dylib");
    names.push_back(stem + ".dylib");
#endif

    std::error_code ec;
    for (const auto& dir : search_paths) {
        for (const auto& name : names) {
            auto candidate = dir / parent / name;
            if (std::filesystem::is_regular_file(candidate, ec)) {
                return candidate;
            }
        }
    }
    throw std::runtime_error("No module named '" + module + "'");
}

std::vector<std::string> Launcher::RuntimeCommand(const std::filesystem::path& script,
                                                  const std::filesystem::path& python) {
    const auto ext = utils::StringUtils::ToLower(script.extension().string());
    if (ext == ".py")                                      return {python.string()};
    if (ext == ".js" || ext == ".mjs" || ext == ".cjs")    return {"node"};
    if (ext == ".sh")                                      return {"/bin/sh"};
    if (ext == ".bash")                                    return {"bash"};
    if (ext == ".rb")                                      return {"ruby"};
    if (ext == ".pl")                                      return {"perl"};
    return {};
}

std::string Launcher::FormatTrace(const std::exception& error) {
    std::string trace;
    const std::exception* current = &error;
    std::size_t depth = 0;

    // Walk the nested chain; each level rethrows its inner exception
    std::exception_ptr next;
    while (current != nullptr) {
        trace += std::string(depth * 2, ' ') + utils::StringUtils::Demangle(typeid(*current).name()) +
                 ": " + current->what() + "\n";
        if (const auto* sandbox_error = dynamic_cast<const SandboxError*>(current);
            sandbox_error && !sandbox_error->details().empty()) {
            trace += sandbox_error->details();
            if (trace.back() != '\n') trace += "\n";
        }

        const auto* nested = dynamic_cast<const std::nested_exception*>(current);
        if (nested == nullptr || !nested->nested_ptr()) {
            break;
        }
        next = nested->nested_ptr();
        try {
            std::rethrow_exception(next);
        } catch (const std::exception& inner) {
            // inner lives as long as `next` holds the exception object
            current = &inner;
        } catch (...) {
            trace += std::string((depth + 1) * 2, ' ') + "non-standard exception\n";
            break;
        }
        ++depth;
    }
    return trace;
}

std::string Launcher::InnermostMessage(const std::exception& error) {
    try {
        std::rethrow_if_nested(error);
    } catch (const std::exception& inner) {
        return InnermostMessage(inner);
    } catch (...) {
        return error.what();
    }
    return error.what();
}

ExecutionResult Launcher::Execute(const ExecutionRequest& request, const AllowlistGuard& guard) {
    std::string captured;
    try {
        try {
            PrependEnvironmentPath("WARDEN_MODULE_PATH", request.search_paths);
            PrependEnvironmentPath("PYTHONPATH", request.search_paths);

            if (request.working_directory && ::chdir(request.working_directory->c_str()) != 0) {
                throw std::runtime_error("Cannot change directory to " +
                                         request.working_directory->string() + ": " +
                                         std::strerror(errno));
            }

            auto value = Dispatch(request, guard, captured);
            return ExecutionResult::Success(std::move(value), captured);
        } catch (...) {
            std::throw_with_nested(std::runtime_error(DescribeTarget(request) + " failed"));
        }
    } catch (const std::exception& e) {
        auto message = InnermostMessage(e);
        spdlog::error("{}", message);
        return ExecutionResult::Failure(message, FormatTrace(e), captured);
    }
}

int Launcher::Run(const std::filesystem::path& request_path,
                  const std::filesystem::path& response_path) {
    ConfigureLauncherLogging();

    ExecutionRequest request;
    try {
        request = ReadEnvelope(request_path).get<ExecutionRequest>();
    } catch (const std::exception& e) {
        spdlog::error("Invalid request {}: {}", request_path.string(), e.what());
        auto failure = ExecutionResult::Failure(std::string("Invalid request: ") + e.what(),
                                                FormatTrace(e));
        return WriteResponse(response_path, failure) ? 0 : 1;
    }

    try {
        auto applied = ResourceLimiter::Apply(request.limits);
        if (applied.memory_bytes) {
            spdlog::info("Limits applied: cpu={}s memory={}MB", applied.cpu_soft_seconds,
                         *applied.memory_bytes / (1024 * 1024));
        } else {
            spdlog::info("Limits applied: cpu={}s (memory ceiling unsupported)",
                         applied.cpu_soft_seconds);
        }
    } catch (const std::exception& e) {
        auto failure = ExecutionResult::Failure(std::string("Failed to apply resource limits: ") +
                                                e.what(), FormatTrace(e));
        return WriteResponse(response_path, failure) ? 0 : 1;
    }

    spdlog::info("Dispatching {} (runtime {})", ExecutionModeToString(request.mode()),
                 request.runtime_directory.string());

    ExecutionResult result;
    try {
        auto guard = BuildGuard(request);
        result = Execute(request, guard);
    } catch (const std::exception& e) {
        result = ExecutionResult::Failure(e.what(), FormatTrace(e));
    }

    return WriteResponse(response_path, result) ? 0 : 1;
}

} // namespace core
} // namespace warden
