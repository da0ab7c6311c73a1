/**
 * @file main.cpp
 * @brief warden - Command-line interface
 *
 * Front-end over warden::core::Sandbox. Results go to stdout; logs and
 * errors go to stderr so command output can be piped.
 *
 * ```
 * warden -w ~/project shell "ls /workspace"
 * warden -w ~/project script /workspace/job.py -- --epochs 3
 * warden -w ~/project call tools.math add --args '[1, 2]'
 * warden -w ~/project tree --depth 2
 * warden detect
 * ```
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "warden/core/errors.hpp"
#include "warden/core/sandbox.hpp"
#include "warden/core/sandbox_config.hpp"
#include "warden/utils/process_utils.hpp"

#include <cstdlib>
#include <iostream>

using json = nlohmann::json;
using warden::core::Sandbox;
using warden::core::SandboxConfig;

namespace {

json ParseJsonOption(const std::string& text, const char* name, json fallback) {
    if (text.empty()) {
        return fallback;
    }
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument(std::string("--") + name + " is not valid JSON: " + e.what());
    }
}

void PrintDetection(const SandboxConfig& config) {
    namespace iso = warden::isolation;

    const auto platform = iso::CurrentPlatform();
    const auto helper = iso::HelperBinaryFor(platform, config.isolation_mode);
    auto helper_path = helper.empty() ? std::nullopt : warden::utils::FindExecutable(helper);
    const bool mapping = config.host_workspace.empty() ||
                         config.host_workspace != config.virtual_workspace;
    const auto kind = iso::DetectBackend(platform, config.isolation_mode,
                                         helper.empty() || helper_path.has_value(), mapping);

    json report = {
        {"platform", platform == iso::Platform::LINUX ? "linux"
                     : platform == iso::Platform::MACOS ? "macos" : "other"},
        {"isolation_mode", iso::IsolationModeToString(config.isolation_mode)},
        {"helper", helper.empty() ? json(nullptr) : json(helper)},
        {"helper_path", helper_path ? json(helper_path->string()) : json(nullptr)},
        {"backend", iso::BackendKindToString(kind)},
        {"launcher", Sandbox::ResolveLauncherPath(config).string()}
    };
    std::cout << report.dump(2) << std::endl;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"warden - sandboxed code execution"};
    app.require_subcommand(1);

    std::string workspace;
    std::string virtual_root;
    std::string isolation;
    std::string config_file;
    std::uint64_t cpu_limit = 0;
    std::uint64_t memory_limit = 0;
    int wall_clock = 0;
    std::vector<std::string> allowed;
    bool verbose = false;

    app.add_option("-w,--workspace", workspace, "Host workspace directory (default: current directory)");
    app.add_option("--virtual-root", virtual_root, "Virtual root presented to sandboxed code");
    app.add_option("-i,--isolation", isolation, "Isolation mode: auto, seatbelt, bwrap, chroot, subprocess, in_process");
    app.add_option("-c,--config", config_file, "JSON configuration file")
        ->check(CLI::ExistingFile);
    auto* cpu_opt = app.add_option("--cpu", cpu_limit, "CPU-time limit in seconds");
    auto* memory_opt = app.add_option("--memory", memory_limit, "Memory limit in MB");
    auto* timeout_opt = app.add_option("--timeout", wall_clock, "Wall-clock timeout in seconds (0 = none)");
    app.add_option("--allow", allowed, "Additional allowed path (repeatable)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    // shell
    auto* shell_cmd = app.add_subcommand("shell", "Run a shell command");
    std::string shell_command;
    std::string cwd;
    shell_cmd->add_option("command", shell_command, "Command line")->required();
    shell_cmd->add_option("--cwd", cwd, "Working directory (virtual or host path)");

    // bg
    auto* bg_cmd = app.add_subcommand("bg", "Start a detached shell command");
    bg_cmd->add_option("command", shell_command, "Command line")->required();
    bg_cmd->add_option("--cwd", cwd, "Working directory (virtual or host path)");

    // kill
    auto* kill_cmd = app.add_subcommand("kill", "Terminate a background job");
    int kill_pid = 0;
    kill_cmd->add_option("pid", kill_pid, "Process id of the job")->required();

    // script
    auto* script_cmd = app.add_subcommand("script", "Run a script file");
    std::string script_path;
    std::vector<std::string> script_args;
    std::vector<std::string> dependencies;
    std::string install_command;
    script_cmd->add_option("path", script_path, "Script path (virtual or host)")->required();
    script_cmd->add_option("args", script_args, "Script arguments");
    script_cmd->add_option("-d,--dep", dependencies, "Dependency: name, pip:<pkg> or npm:<pkg>");
    script_cmd->add_option("--install", install_command, "Raw install command run first");
    script_cmd->add_option("--cwd", cwd, "Working directory");

    // call
    auto* call_cmd = app.add_subcommand("call", "Call a function from an installed module");
    std::string module_name;
    std::string function_name;
    std::string class_name;
    std::string args_text;
    std::string kwargs_text;
    std::vector<std::string> search_paths;
    call_cmd->add_option("module", module_name, "Dotted module name")->required();
    call_cmd->add_option("function", function_name, "Function or method name")->required();
    call_cmd->add_option("--class", class_name, "Instantiate this class and call a method");
    call_cmd->add_option("--args", args_text, "Positional arguments as a JSON array");
    call_cmd->add_option("--kwargs", kwargs_text, "Keyword arguments as a JSON object");
    call_cmd->add_option("-p,--search-path", search_paths, "Extra module search directory");
    call_cmd->add_option("--cwd", cwd, "Working directory");

    // call-file
    auto* call_file_cmd = app.add_subcommand("call-file", "Call a function from a module file");
    std::string module_path;
    call_file_cmd->add_option("path", module_path, "Module file (virtual or host)")->required();
    call_file_cmd->add_option("function", function_name, "Function name")->required();
    call_file_cmd->add_option("--args", args_text, "Positional arguments as a JSON array");
    call_file_cmd->add_option("--kwargs", kwargs_text, "Keyword arguments as a JSON object");
    call_file_cmd->add_option("-d,--dep", dependencies, "Dependency installed first");
    call_file_cmd->add_option("--cwd", cwd, "Working directory");

    // tree
    auto* tree_cmd = app.add_subcommand("tree", "Print the workspace file tree");
    warden::core::FileTreeOptions tree_options;
    std::string tree_root;
    std::size_t tree_depth = 0;
    tree_cmd->add_flag("-a,--all", tree_options.include_hidden, "Include hidden entries");
    tree_cmd->add_option("--root", tree_root, "Listing root");
    auto* depth_opt = tree_cmd->add_option("--depth", tree_depth, "Maximum depth");
    tree_cmd->add_option("--max-items", tree_options.max_items_per_dir, "Items shown per subdirectory")
        ->default_val(5);

    // detect
    auto* detect_cmd = app.add_subcommand("detect", "Show the isolation backend that would be used");

    CLI11_PARSE(app, argc, argv);

    auto logger = spdlog::stderr_color_mt("warden");
    spdlog::set_default_logger(logger);
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        SandboxConfig config = config_file.empty() ? SandboxConfig{}
                                                   : warden::core::LoadSandboxConfig(config_file);
        warden::core::ApplyEnvironmentOverrides(config);

        if (!workspace.empty()) {
            config.host_workspace = std::filesystem::absolute(workspace).lexically_normal();
        } else if (config.host_workspace.empty()) {
            config.host_workspace = std::filesystem::current_path();
        }
        if (!virtual_root.empty()) config.virtual_workspace = virtual_root;
        if (!isolation.empty()) config.isolation_mode = warden::isolation::IsolationModeFromString(isolation);
        if (cpu_opt->count() > 0) config.cpu_time_limit_seconds = cpu_limit;
        if (memory_opt->count() > 0) config.memory_limit_mb = memory_limit;
        if (timeout_opt->count() > 0) config.wall_clock_timeout = std::chrono::seconds(wall_clock);
        for (const auto& path : allowed) {
            config.allowed_paths.emplace_back(path);
        }
        config.verbose_logging = verbose;

        if (*detect_cmd) {
            PrintDetection(config);
            return 0;
        }

        if (!*tree_cmd) {
            spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
        }

        Sandbox sandbox(config);
        std::optional<std::filesystem::path> working_directory;
        if (!cwd.empty()) {
            working_directory = cwd;
        }

        if (*shell_cmd) {
            std::cout << sandbox.RunShellCommand(shell_command, working_directory);
        } else if (*bg_cmd) {
            auto job = sandbox.RunShellCommandBackground(shell_command, working_directory);
            std::cout << json{{"process_id", job.process_id}, {"pid", job.pid},
                              {"log_file", job.log_file.string()}, {"command", job.command}}
                             .dump(2, ' ', false, json::error_handler_t::replace)
                      << std::endl;
        } else if (*kill_cmd) {
            warden::core::BackgroundJob job;
            job.pid = kill_pid;
            job.process_id = "bg_" + std::to_string(kill_pid);
            if (!sandbox.TerminateBackgroundJob(job)) {
                spdlog::warn("No running job with pid {}", kill_pid);
                return 1;
            }
        } else if (*script_cmd) {
            warden::core::ScriptRun run;
            run.script_path = script_path;
            run.arguments = script_args;
            run.dependencies = dependencies;
            if (!install_command.empty()) run.install_command = install_command;
            run.working_directory = working_directory;
            std::cout << sandbox.RunScript(run);
        } else if (*call_cmd) {
            warden::core::LibraryCall call;
            call.module = module_name;
            if (!class_name.empty()) call.class_name = class_name;
            call.function = function_name;
            call.args = ParseJsonOption(args_text, "args", json::array());
            call.kwargs = ParseJsonOption(kwargs_text, "kwargs", json::object());
            call.working_directory = working_directory;
            call.search_paths.assign(search_paths.begin(), search_paths.end());
            std::cout << sandbox.RunLibraryFunction(call).dump(2) << std::endl;
        } else if (*call_file_cmd) {
            warden::core::ModuleCall call;
            call.module_path = module_path;
            call.function = function_name;
            call.args = ParseJsonOption(args_text, "args", json::array());
            call.kwargs = ParseJsonOption(kwargs_text, "kwargs", json::object());
            call.working_directory = working_directory;
            call.dependencies = dependencies;
            std::cout << sandbox.RunModuleFunction(call).dump(2) << std::endl;
        } else if (*tree_cmd) {
            if (!tree_root.empty()) tree_options.root = tree_root;
            if (depth_opt->count() > 0) tree_options.max_depth = tree_depth;
            std::cout << sandbox.FileTree(tree_options);
        }

        return 0;

    } catch (const warden::core::SandboxError& e) {
        spdlog::error("{}", e.Describe());
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
