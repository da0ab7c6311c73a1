/**
 * @file sandbox.cpp
 * @brief Implementation of the execution dispatcher
 *
 * **Call pipeline**:
 * ```
 * caller args (virtual view)
 *     │ MapToHost
 *     ▼
 * ExecutionRequest (host view) ── ToChildRequest ──▶ request_<id>.json
 *                                                        │
 *                         backend->BuildLaunch ──▶ RunProcess ──▶ launcher
 *                                                        │
 * ExecutionResult ◀── MapToVirtual ◀── response_<id>.json
 * ```
 * Both artifacts (and any backend artifact such as a seatbelt profile) are
 * removed when the call returns or throws.
 *
 * @date 2025
 */

#include "warden/core/sandbox.hpp"
#include "warden/core/errors.hpp"
#include "warden/core/launcher.hpp"
#include "warden/core/resource_limiter.hpp"
#include "warden/utils/hash_utils.hpp"
#include "warden/utils/process_utils.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

namespace warden {
namespace core {

namespace {

std::filesystem::path NormalizeWorkspace(const std::filesystem::path& workspace) {
    if (workspace.empty()) {
        throw SandboxError("host_workspace is required");
    }
    if (workspace.is_relative()) {
        throw SandboxError("host_workspace must be an absolute path: " + workspace.string());
    }

    std::error_code ec;
    std::filesystem::create_directories(workspace, ec);
    if (ec) {
        throw SandboxError("Cannot create workspace " + workspace.string(), ec.message());
    }
    auto canonical = std::filesystem::weakly_canonical(workspace, ec);
    return ec ? workspace.lexically_normal() : canonical;
}

/**
 * Removes per-call artifacts on scope exit.
 */
class ArtifactScope {
public:
    ArtifactScope(isolation::IsolationBackend& backend, isolation::LaunchSpec spec)
        : backend_(backend), spec_(std::move(spec)) {}

    ~ArtifactScope() {
        std::error_code ec;
        for (const auto& path : {spec_.request, spec_.response}) {
            std::filesystem::remove(path, ec);
            auto temp = path;
            temp += ".tmp";
            std::filesystem::remove(temp, ec);
        }
        try {
            backend_.Cleanup(spec_);
        } catch (const std::exception& e) {
            spdlog::debug("Backend cleanup failed: {}", e.what());
        }
    }

    ArtifactScope(const ArtifactScope&) = delete;
    ArtifactScope& operator=(const ArtifactScope&) = delete;

    const isolation::LaunchSpec& spec() const { return spec_; }

private:
    isolation::IsolationBackend& backend_;
    isolation::LaunchSpec spec_;
};

/**
 * Host-path copy of a script whose body names virtual paths.
 *
 * The copy keeps the script's file name and is removed on scope exit. When
 * the body needs no rewriting (or cannot be read) the original path is used.
 */
class StagedScript {
public:
    StagedScript(const std::filesystem::path& source, const std::filesystem::path& staging_root,
                 const WorkspaceFilesystem& filesystem)
        : path_(source) {
        std::ifstream in(source, std::ios::binary);
        if (!in) {
            return;
        }
        const std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        const auto mapped = filesystem.MapTextToHost(body);
        if (mapped == body) {
            return;
        }

        std::error_code ec;
        directory_ = staging_root / utils::HashUtils::RandomHex(8);
        std::filesystem::create_directories(directory_, ec);
        if (ec) {
            throw SandboxError("Cannot stage script " + source.filename().string(), ec.message());
        }
        path_ = directory_ / source.filename();
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        out << mapped;
        out.close();
        if (!out) {
            throw SandboxError("Cannot stage script " + source.filename().string(),
                               "write failed: " + path_.string());
        }
        std::filesystem::permissions(path_, std::filesystem::status(source, ec).permissions(), ec);
        spdlog::debug("Staged {} with host paths at {}", source.string(), path_.string());
    }

    ~StagedScript() {
        if (!directory_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(directory_, ec);
        }
    }

    StagedScript(const StagedScript&) = delete;
    StagedScript& operator=(const StagedScript&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::filesystem::path directory_;
};

template <typename Fn>
nlohmann::json MapStrings(const nlohmann::json& value, const Fn& map) {
    if (value.is_string()) {
        return map(value.get<std::string>());
    }
    if (value.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& item : value) {
            out.push_back(MapStrings(item, map));
        }
        return out;
    }
    if (value.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            out[it.key()] = MapStrings(it.value(), map);
        }
        return out;
    }
    return value;
}

std::string JoinDiagnostics(const std::string& first, const std::string& second) {
    if (first.empty()) return second;
    if (second.empty()) return first;
    return first + (first.back() == '\n' ? "" : "\n") + second;
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

Sandbox::Sandbox(SandboxConfig config)
    : config_(std::move(config))
    , filesystem_(NormalizeWorkspace(config_.host_workspace), config_.virtual_workspace,
                  config_.control_directory_name)
    , control_directory_(filesystem_.path_mapping_enabled()
                             ? filesystem_.host_root() / config_.control_directory_name
                             : std::filesystem::temp_directory_path() /
                                   ("warden-" + utils::HashUtils::RandomHex(8)))
    , provisioner_(control_directory_,
                   PackageIndex{config_.package_index_url, config_.package_index_trusted_host},
                   config_.provision_python_runtime) {

    if (config_.verbose_logging) {
        spdlog::set_level(spdlog::level::debug);
    }

    std::error_code ec;
    std::filesystem::create_directories(control_directory_, ec);
    if (ec) {
        throw SandboxError("Cannot create control directory " + control_directory_.string(),
                           ec.message());
    }

    // Limits
    limits_.cpu_time_seconds = config_.cpu_time_limit_seconds;
    limits_.memory_bytes = config_.memory_limit_bytes();
    if (ResourceLimiter::MemoryCeilingSupported()) {
        limits_.memory_bytes = ResourceLimiter::ClampMemory(
            limits_.memory_bytes, ResourceLimiter::AmbientMemoryCeiling(),
            ResourceLimiter::HardMemoryLimit());
    }
    limits_.allowed_paths = DefaultAllowedPaths();
    limits_.allowed_paths.insert(limits_.allowed_paths.end(),
                                 config_.allowed_paths.begin(), config_.allowed_paths.end());
    limits_.allowed_paths.push_back(filesystem_.host_root());
    limits_.allowed_paths.push_back(control_directory_);

    // Backend
    const auto platform = isolation::CurrentPlatform();
    const auto helper = isolation::HelperBinaryFor(platform, config_.isolation_mode);
    const bool helper_available = helper.empty() || utils::FindExecutable(helper).has_value();
    const auto kind = isolation::DetectBackend(platform, config_.isolation_mode, helper_available,
                                               filesystem_.path_mapping_enabled());

    isolation::BackendContext context;
    context.host_workspace = filesystem_.host_root();
    context.virtual_workspace = filesystem_.virtual_root();
    context.control_directory = control_directory_;
    context.allowed_paths = limits_.allowed_paths;
    context.path_mapping_enabled = filesystem_.path_mapping_enabled();

    backend_ = isolation::CreateBackend(kind, std::move(context), &Launcher::Run);

    if (kind != isolation::BackendKind::IN_PROCESS_LIMITS) {
        launcher_source_ = ResolveLauncherPath(config_);
        if (launcher_source_.empty()) {
            throw SandboxError("warden-launcher executable not found",
                               "Set launcher_path, WARDEN_LAUNCHER, or install warden-launcher "
                               "next to this program or on PATH.");
        }
    }

    spdlog::info("Sandbox ready: workspace={} virtual={} backend={}",
                 filesystem_.host_root().string(), filesystem_.virtual_root().string(),
                 isolation::BackendKindToString(kind));
    spdlog::info("Limits: cpu={}s memory={}MB", limits_.cpu_time_seconds,
                 limits_.memory_bytes / (1024 * 1024));

    if (config_.wall_clock_timeout.count() == 0) {
        spdlog::warn("No wall-clock timeout: the CPU-time ceiling does not stop a child that "
                     "sleeps or blocks on I/O");
    } else {
        spdlog::info("Wall-clock timeout: {}s", config_.wall_clock_timeout.count());
    }
}

Sandbox::~Sandbox() {
    // Identical roots keep their artifacts in a private temporary directory
    if (!filesystem_.path_mapping_enabled()) {
        std::error_code ec;
        std::filesystem::remove_all(control_directory_, ec);
        if (ec) {
            spdlog::debug("Failed to remove {}: {}", control_directory_.string(), ec.message());
        }
    }
}

std::filesystem::path Sandbox::ResolveLauncherPath(const SandboxConfig& config) {
    std::error_code ec;
    if (!config.launcher_path.empty()) {
        return std::filesystem::exists(config.launcher_path, ec) ? config.launcher_path
                                                                 : std::filesystem::path();
    }

    if (const char* env = std::getenv("WARDEN_LAUNCHER"); env && *env) {
        if (std::filesystem::exists(env, ec)) {
            return env;
        }
        spdlog::warn("WARDEN_LAUNCHER points to a missing file: {}", env);
    }

    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        auto sibling = self.parent_path() / "warden-launcher";
        if (std::filesystem::exists(sibling, ec)) {
            return sibling;
        }
    }

    if (auto on_path = utils::FindExecutable("warden-launcher")) {
        return *on_path;
    }
    return {};
}

// ============================================================================
// TRANSLATION
// ============================================================================

nlohmann::json Sandbox::MapToVirtual(const nlohmann::json& value) const {
    return MapStrings(value, [this](const std::string& text) {
        return filesystem_.MapTextToVirtual(text);
    });
}

nlohmann::json Sandbox::MapToHost(const nlohmann::json& value) const {
    return MapStrings(value, [this](const std::string& text) {
        return filesystem_.MapTextToHost(text);
    });
}

std::string Sandbox::ToChildText(const std::string& text) const {
    // The namespace container presents the workspace at the virtual root
    if (backend_->kind() == isolation::BackendKind::NAMESPACE_CONTAINER) {
        return filesystem_.MapTextToVirtual(text);
    }
    return text;
}

nlohmann::json Sandbox::ToChildValue(const nlohmann::json& value) const {
    return MapStrings(value, [this](const std::string& text) { return ToChildText(text); });
}

std::filesystem::path Sandbox::HostWorkingDirectory(const std::optional<std::filesystem::path>& cwd) const {
    if (!cwd) {
        return filesystem_.host_root();
    }
    auto host = filesystem_.ToHostPath(*cwd);
    return host.is_absolute() ? host : filesystem_.host_root() / host;
}

std::vector<std::filesystem::path> Sandbox::HostSearchPaths(const std::vector<std::filesystem::path>& extra) const {
    std::vector<std::filesystem::path> paths;
    for (const auto& path : config_.module_search_paths) {
        paths.push_back(filesystem_.ToHostPath(path));
    }
    for (const auto& path : extra) {
        paths.push_back(filesystem_.ToHostPath(path));
    }
    return paths;
}

ExecutionRequest Sandbox::ToChildRequest(const ExecutionRequest& request) const {
    ExecutionRequest child = request;

    if (auto* mod = std::get_if<ModuleTarget>(&child.target)) {
        mod->module_path = backend_->ToChildPath(mod->module_path);
    } else if (auto* script = std::get_if<ScriptTarget>(&child.target)) {
        script->script_path = backend_->ToChildPath(script->script_path);
        for (auto& arg : script->arguments) {
            arg = ToChildText(arg);
        }
    } else if (auto* shell = std::get_if<ShellTarget>(&child.target)) {
        shell->command = ToChildText(shell->command);
    }

    child.args = ToChildValue(request.args);
    child.kwargs = ToChildValue(request.kwargs);
    if (request.working_directory) {
        child.working_directory = backend_->ToChildPath(*request.working_directory);
    }
    for (auto& path : child.search_paths) {
        path = backend_->ToChildPath(path);
    }
    for (auto& path : child.limits.allowed_paths) {
        path = backend_->ToChildPath(path);
    }
    child.control_directory = backend_->ToChildPath(control_directory_);
    child.runtime_directory = backend_->ToChildPath(provisioner_.runtime_directory());
    child.enforce_allowlist = !backend_->EnforcesFilesystem();
    return child;
}

// ============================================================================
// DISPATCH
// ============================================================================

ExecutionResult Sandbox::Execute(const ExecutionRequest& request) {
    ResourceLimiter::CheckHeadroom(limits_);

    // Nothing is provisioned into a workspace that is also the caller's own tree
    if (filesystem_.path_mapping_enabled()) {
        try {
            provisioner_.EnsureRuntime();
        } catch (const SandboxError&) {
            throw;
        } catch (const std::exception& e) {
            throw SandboxError("Failed to provision sandbox runtime", e.what());
        }
    }

    ExecutionRequest full = request;
    full.limits = limits_;
    full.package_index = PackageIndex{config_.package_index_url, config_.package_index_trusted_host};
    if (!full.working_directory) {
        full.working_directory = filesystem_.host_root();
    }

    isolation::LaunchSpec spec;
    spec.run_id = utils::HashUtils::RandomHex(16);
    spec.request = control_directory_ / ("request_" + spec.run_id + ".json");
    spec.response = control_directory_ / ("response_" + spec.run_id + ".json");
    spec.working_directory = *full.working_directory;
    if (backend_->kind() != isolation::BackendKind::IN_PROCESS_LIMITS) {
        spec.launcher = provisioner_.InstallLauncher(launcher_source_);
    }

    ArtifactScope artifacts(*backend_, spec);

    try {
        WriteEnvelope(spec.request, nlohmann::json(ToChildRequest(full)));
    } catch (const std::exception& e) {
        throw SandboxError("Failed to write sandbox request", e.what());
    }

    auto options = backend_->BuildLaunch(spec);
    if (config_.wall_clock_timeout.count() > 0) {
        options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.wall_clock_timeout);
    }

    spdlog::debug("Dispatching {} run {}", ExecutionModeToString(full.mode()), spec.run_id);

    utils::ProcessResult process;
    try {
        process = utils::RunProcess(options);
    } catch (const std::exception& e) {
        throw SandboxError("Failed to start sandbox child", e.what());
    }

    const auto diagnostics = filesystem_.MapTextToVirtual(
        JoinDiagnostics(process.output, process.error_output));

    if (!process.success()) {
        throw SandboxError("Sandbox child failed: " + utils::DescribeExit(process), diagnostics);
    }

    std::error_code ec;
    if (!std::filesystem::exists(spec.response, ec)) {
        throw SandboxError("sandbox produced no output", diagnostics);
    }

    ExecutionResult result;
    try {
        result = ReadEnvelope(spec.response).get<ExecutionResult>();
    } catch (const std::exception& e) {
        throw SandboxError("Malformed sandbox response", JoinDiagnostics(e.what(), diagnostics));
    }

    // Function calls leave stdout uncaptured in the child; attach what the process printed
    if (result.captured_output.empty()) {
        result.captured_output = process.output;
    }

    result.captured_output = filesystem_.MapTextToVirtual(result.captured_output);
    if (result.ok()) {
        result.result = MapToVirtual(result.result);
        return result;
    }

    auto message = filesystem_.MapTextToVirtual(result.error_message);
    auto details = JoinDiagnostics(filesystem_.MapTextToVirtual(result.error_trace),
                                   result.captured_output);
    throw SandboxError(message, details);
}

nlohmann::json Sandbox::RunLibraryFunction(const LibraryCall& call) {
    ExecutionRequest request;
    request.target = LibraryTarget{call.module, call.class_name, call.function};
    request.args = MapToHost(call.args);
    request.kwargs = MapToHost(call.kwargs);
    request.working_directory = HostWorkingDirectory(call.working_directory);
    request.search_paths = HostSearchPaths(call.search_paths);
    return Execute(request).result;
}

nlohmann::json Sandbox::RunModuleFunction(const ModuleCall& call) {
    ExecutionRequest request;
    auto module_path = filesystem_.ToHostPath(call.module_path);
    if (module_path.is_relative()) {
        module_path = HostWorkingDirectory(call.working_directory) / module_path;
    }
    request.target = ModuleTarget{module_path, call.function};
    request.args = MapToHost(call.args);
    request.kwargs = MapToHost(call.kwargs);
    request.working_directory = HostWorkingDirectory(call.working_directory);
    request.search_paths = HostSearchPaths(call.search_paths);
    request.dependencies = call.dependencies;
    return Execute(request).result;
}

std::string Sandbox::RunScript(const ScriptRun& run) {
    ExecutionRequest request;
    auto script_path = filesystem_.ToHostPath(run.script_path);
    if (script_path.is_relative()) {
        script_path = HostWorkingDirectory(run.working_directory) / script_path;
    }

    std::vector<std::string> arguments;
    for (const auto& arg : run.arguments) {
        arguments.push_back(filesystem_.MapTextToHost(arg));
    }

    // Only a backend that mounts the workspace at the virtual root can run the body as written
    std::optional<StagedScript> staged;
    if (filesystem_.path_mapping_enabled() &&
        backend_->ToChildPath(filesystem_.host_root()) != filesystem_.virtual_root()) {
        staged.emplace(script_path, control_directory_ / "scripts", filesystem_);
        script_path = staged->path();
    }
    request.target = ScriptTarget{script_path, arguments};
    request.working_directory = HostWorkingDirectory(run.working_directory);
    request.dependencies = run.dependencies;
    if (run.install_command) {
        request.install_command = filesystem_.MapTextToHost(*run.install_command);
    }
    return Execute(request).captured_output;
}

std::string Sandbox::RunShellCommand(const std::string& command,
                                     const std::optional<std::filesystem::path>& working_directory) {
    ExecutionRequest request;
    request.target = ShellTarget{filesystem_.MapTextToHost(command)};
    request.working_directory = HostWorkingDirectory(working_directory);
    return Execute(request).captured_output;
}

std::string Sandbox::FileTree(const FileTreeOptions& options) const {
    return filesystem_.FileTree(options);
}

// ============================================================================
// BACKGROUND JOBS
// ============================================================================

BackgroundJob Sandbox::RunShellCommandBackground(const std::string& command,
                                                 const std::optional<std::filesystem::path>& working_directory) {
    if (backend_->EnforcesFilesystem()) {
        spdlog::warn("Background jobs run outside the {} backend, with resource limits only",
                     isolation::BackendKindToString(backend_->kind()));
    }
    ResourceLimiter::CheckHeadroom(limits_);

    const auto cwd = HostWorkingDirectory(working_directory);
    const auto log_dir = cwd / ".sandbox_logs";
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (ec) {
        throw SandboxError("Cannot create log directory " + log_dir.string(), ec.message());
    }

    const auto staging_log = log_dir / ("bg_pending_" + utils::HashUtils::RandomHex(8) + ".log");
    const auto limits = limits_;

    utils::ProcessOptions options;
    options.argv = {"/bin/sh", "-c", filesystem_.MapTextToHost(command)};
    options.working_directory = cwd;
    options.environment = provisioner_.PrivateEnvironment();
    options.pre_exec = [limits]() { ResourceLimiter::Apply(limits); };

    pid_t pid = -1;
    try {
        pid = utils::SpawnDetached(options, staging_log);
    } catch (const std::exception& e) {
        throw SandboxError("Failed to start background command", e.what());
    }

    const auto log_file = log_dir / ("bg_" + std::to_string(pid) + ".log");
    std::filesystem::rename(staging_log, log_file, ec);
    if (ec) {
        spdlog::warn("Could not rename background log {}: {}", staging_log.string(), ec.message());
    }

    BackgroundJob job;
    job.process_id = "bg_" + std::to_string(pid);
    job.pid = pid;
    job.log_file = filesystem_.ToVirtualPath(ec ? staging_log : log_file);
    job.command = command;

    spdlog::info("Started background job {}: {}", job.process_id,
                 utils::StringUtils::Truncate(command, 120));
    return job;
}

bool Sandbox::TerminateBackgroundJob(const BackgroundJob& job) {
    if (job.pid <= 0) {
        return false;
    }
    // Detached jobs lead their own process group, so the group id equals the pid
    if (::kill(-job.pid, SIGTERM) == 0) {
        spdlog::info("Terminated background job {}", job.process_id);
        return true;
    }
    if (errno != ESRCH) {
        throw SandboxError("Failed to terminate " + job.process_id + ": " + std::strerror(errno));
    }
    return false;
}

} // namespace core
} // namespace warden
