/**
 * @file test_sandbox_e2e.cpp
 * @brief Full round trips through the dispatcher, launcher and plugin loader
 *
 * Uses the plain subprocess backend so the suite runs without bwrap or root.
 */

#include "warden/core/errors.hpp"
#include "warden/core/sandbox.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace warden::core;
using warden::isolation::BackendKind;
using warden::isolation::IsolationMode;
using warden::testing::TempDir;

namespace {

const std::filesystem::path kModuleDirectory =
    std::filesystem::path(WARDEN_TEST_MODULE_PATH).parent_path();

SandboxBuilder BaseConfig(const TempDir& ws) {
    return SandboxBuilder()
        .WithWorkspace(ws.path())
        .WithVirtualWorkspace("/workspace")
        .WithIsolationMode(IsolationMode::SUBPROCESS)
        .WithLauncher(WARDEN_TEST_LAUNCHER_PATH)
        .ProvisionPythonRuntime(false)
        .WithCpuTimeLimit(20)
        .WithMemoryLimit(1024)
        .WithWallClockTimeout(std::chrono::seconds(30));
}

LibraryCall SampleCall(const std::string& function) {
    LibraryCall call;
    call.module = "warden_sample";
    call.function = function;
    call.search_paths = {kModuleDirectory};
    return call;
}

} // anonymous namespace

class SandboxE2ETest : public ::testing::Test {
protected:
    TempDir ws_;
};

// ============================================================================
// Shell and scripts
// ============================================================================

TEST_F(SandboxE2ETest, ShellCommandSeesVirtualPaths) {
    Sandbox sandbox(BaseConfig(ws_).Build());
    EXPECT_EQ(sandbox.backend_kind(), BackendKind::PLAIN_SUBPROCESS);

    EXPECT_EQ(sandbox.RunShellCommand("echo 42"), "42\n");

    ws_.Write("notes/todo.txt", "ship it\n");
    EXPECT_EQ(sandbox.RunShellCommand("cat /workspace/notes/todo.txt"), "ship it\n");
    EXPECT_EQ(sandbox.RunShellCommand("pwd", std::filesystem::path("/workspace/notes")),
              "/workspace/notes\n");
}

TEST_F(SandboxE2ETest, NonzeroShellExitRaisesWithOutput) {
    Sandbox sandbox(BaseConfig(ws_).Build());
    try {
        sandbox.RunShellCommand("echo partial; exit 3");
        FAIL() << "nonzero shell exit did not raise";
    } catch (const SandboxError& e) {
        EXPECT_EQ(std::string(e.what()), "Command failed with code 3");
        EXPECT_NE(e.details().find("partial"), std::string::npos);
    }
}

TEST_F(SandboxE2ETest, NonUtf8OutputIsReplacedNotLost) {
    Sandbox sandbox(BaseConfig(ws_).Build());
    auto out = sandbox.RunShellCommand("printf 'ok\\377\\n'");
    EXPECT_EQ(out, "ok\xEF\xBF\xBD\n");
}

TEST_F(SandboxE2ETest, RuntimeIsProvisionedOnce) {
    Sandbox sandbox(BaseConfig(ws_).Build());
    EXPECT_EQ(sandbox.provisioner().provision_count(), 0u);

    sandbox.RunShellCommand("true");
    sandbox.RunShellCommand("true");
    EXPECT_EQ(sandbox.provisioner().provision_count(), 1u);
    EXPECT_TRUE(std::filesystem::exists(sandbox.provisioner().launcher_path()));

    // Request and response artifacts are removed after each run
    for (const auto& entry : std::filesystem::directory_iterator(sandbox.control_directory())) {
        EXPECT_EQ(entry.path().filename().string().rfind("request_", 0), std::string::npos);
        EXPECT_EQ(entry.path().filename().string().rfind("response_", 0), std::string::npos);
    }
}

TEST_F(SandboxE2ETest, ScriptRunsWithArguments) {
    ws_.Write("hello.sh", "echo hello \"$1\"\n");
    Sandbox sandbox(BaseConfig(ws_).Build());

    ScriptRun run;
    run.script_path = "/workspace/hello.sh";
    run.arguments = {"/workspace/data"};
    EXPECT_EQ(sandbox.RunScript(run), "hello /workspace/data\n");
}

TEST_F(SandboxE2ETest, FailingScriptRaisesSandboxError) {
    ws_.Write("fail.sh", "echo partial output\nexit 3\n");
    Sandbox sandbox(BaseConfig(ws_).Build());

    ScriptRun run;
    run.script_path = "fail.sh";
    try {
        sandbox.RunScript(run);
        FAIL() << "failing script did not raise";
    } catch (const SandboxError& e) {
        EXPECT_EQ(std::string(e.what()), "Script fail.sh failed (exit code 3)");
        EXPECT_NE(e.details().find("partial output"), std::string::npos);
    }
}

TEST_F(SandboxE2ETest, InstallCommandRunsBeforeScript) {
    ws_.Write("check.sh", "cat /workspace/marker.txt\n");
    Sandbox sandbox(BaseConfig(ws_).Build());

    ScriptRun run;
    run.script_path = "/workspace/check.sh";
    run.install_command = "echo installed > /workspace/marker.txt";
    EXPECT_NE(sandbox.RunScript(run).find("installed"), std::string::npos);
}

TEST_F(SandboxE2ETest, ScriptBodyPathsAreMapped) {
    ws_.Write("data/input.txt", "from the workspace\n");
    ws_.Write("show.sh", "cat /workspace/data/input.txt\necho \"$0\"\n");
    Sandbox sandbox(BaseConfig(ws_).Build());

    ScriptRun run;
    run.script_path = "/workspace/show.sh";
    auto out = sandbox.RunScript(run);
    EXPECT_EQ(out.rfind("from the workspace\n", 0), 0u) << out;
    EXPECT_NE(out.find("show.sh"), std::string::npos);

    // The mapped copy is gone and the original is untouched
    const auto staging = sandbox.control_directory() / "scripts";
    EXPECT_TRUE(!std::filesystem::exists(staging) || std::filesystem::is_empty(staging));
    EXPECT_EQ(warden::testing::Slurp(ws_.path() / "show.sh"),
              "cat /workspace/data/input.txt\necho \"$0\"\n");
}

// ============================================================================
// Library and module calls
// ============================================================================

TEST_F(SandboxE2ETest, LibraryFunctionReturnsJson) {
    Sandbox sandbox(BaseConfig(ws_).Build());

    auto add = SampleCall("add");
    add.args = {1, 2};
    EXPECT_EQ(sandbox.RunLibraryFunction(add), 3);

    auto greet = SampleCall("greet");
    greet.kwargs = {{"name", "warden"}};
    EXPECT_EQ(sandbox.RunLibraryFunction(greet), "hello, warden");
}

TEST_F(SandboxE2ETest, CapturedStdoutAccompaniesFunctionResult) {
    Sandbox sandbox(BaseConfig(ws_).Build());

    ExecutionRequest request;
    request.target = LibraryTarget{"warden_sample", std::nullopt, "greet"};
    request.kwargs = {{"name", "log"}};
    request.search_paths = {kModuleDirectory};

    auto result = sandbox.Execute(request);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.result, "hello, log");
    EXPECT_NE(result.captured_output.find("greeting log"), std::string::npos);
}

TEST_F(SandboxE2ETest, FunctionResultPathsAreVirtual) {
    ws_.Mkdir("work");
    Sandbox sandbox(BaseConfig(ws_).Build());

    auto cwd = SampleCall("cwd");
    cwd.working_directory = std::filesystem::path("/workspace/work");
    EXPECT_EQ(sandbox.RunLibraryFunction(cwd), "/workspace/work");
}

TEST_F(SandboxE2ETest, ClassMethodIsDispatched) {
    Sandbox sandbox(BaseConfig(ws_).Build());

    auto increment = SampleCall("increment");
    increment.class_name = "Counter";
    increment.kwargs = {{"step", 5}};
    EXPECT_EQ(sandbox.RunLibraryFunction(increment), 5);

    // Every call gets a fresh child, so no state carries over
    EXPECT_EQ(sandbox.RunLibraryFunction(increment), 5);

    auto missing = SampleCall("reset");
    missing.class_name = "Counter";
    EXPECT_THROW(sandbox.RunLibraryFunction(missing), SandboxError);
}

TEST_F(SandboxE2ETest, PluginExceptionBecomesSandboxError) {
    Sandbox sandbox(BaseConfig(ws_).Build());

    auto boom = SampleCall("boom");
    boom.kwargs = {{"reason", "on purpose"}};
    try {
        sandbox.RunLibraryFunction(boom);
        FAIL() << "plugin exception was not reported";
    } catch (const SandboxError& e) {
        EXPECT_EQ(std::string(e.what()), "boom: on purpose");
        EXPECT_NE(e.details().find("library_call"), std::string::npos) << e.Describe();
    }
}

TEST_F(SandboxE2ETest, MissingModuleIsReported) {
    Sandbox sandbox(BaseConfig(ws_).Build());

    LibraryCall call;
    call.module = "does_not_exist";
    call.function = "main";
    try {
        sandbox.RunLibraryFunction(call);
        FAIL() << "missing module was not reported";
    } catch (const SandboxError& e) {
        EXPECT_EQ(std::string(e.what()), "No module named 'does_not_exist'");
    }
}

TEST_F(SandboxE2ETest, ModuleFileInsideWorkspace) {
    std::filesystem::copy_file(WARDEN_TEST_MODULE_PATH, ws_.path() / "plugin.so");
    Sandbox sandbox(BaseConfig(ws_).Build());

    ModuleCall call;
    call.module_path = "/workspace/plugin.so";
    call.function = "write_file";
    call.args = {"/workspace/result.txt", "written"};
    EXPECT_EQ(sandbox.RunModuleFunction(call), true);
    EXPECT_EQ(warden::testing::Slurp(ws_.path() / "result.txt"), "written");
}

// ============================================================================
// Enforcement
// ============================================================================

TEST_F(SandboxE2ETest, GuardDeniesReadsOutsideAllowList) {
    TempDir outside("warden-outside");
    auto secret = outside.Write("secret.txt", "top secret");
    Sandbox sandbox(BaseConfig(ws_).Build());

    auto read = SampleCall("read_file");
    read.args = {secret.string()};
    try {
        sandbox.RunLibraryFunction(read);
        FAIL() << "read outside the allow-list succeeded";
    } catch (const SandboxError& e) {
        EXPECT_EQ(std::string(e.what()), "Access to file " + secret.string() + " is denied (Sandboxed).");
    }

    ws_.Write("inside.txt", "visible");
    read.args = {"/workspace/inside.txt"};
    EXPECT_EQ(sandbox.RunLibraryFunction(read), "visible");
}

TEST_F(SandboxE2ETest, ExtraAllowedPathIsReadable) {
    TempDir shared("warden-shared");
    auto data = shared.Write("data.txt", "shared data");
    Sandbox sandbox(BaseConfig(ws_).AllowPath(shared.path()).Build());

    auto read = SampleCall("read_file");
    read.args = {data.string()};
    EXPECT_EQ(sandbox.RunLibraryFunction(read), "shared data");
}

TEST_F(SandboxE2ETest, MemoryCeilingStopsLargeAllocation) {
#ifdef __APPLE__
    GTEST_SKIP() << "address-space ceiling is not applied on macOS";
#endif
    Sandbox sandbox(BaseConfig(ws_).WithMemoryLimit(10).Build());

    auto allocate = SampleCall("allocate");
    allocate.args = {200};
    EXPECT_THROW(sandbox.RunLibraryFunction(allocate), SandboxError);
}

TEST_F(SandboxE2ETest, CpuCeilingStopsBusyLoop) {
    ws_.Write("spin.sh", "while :; do :; done\n");
    Sandbox sandbox(BaseConfig(ws_).WithCpuTimeLimit(1).Build());

    ScriptRun run;
    run.script_path = "/workspace/spin.sh";

    const auto start = std::chrono::steady_clock::now();
    try {
        sandbox.RunScript(run);
        FAIL() << "busy loop outlived the CPU ceiling";
    } catch (const SandboxError& e) {
        const auto text = e.Describe();
        EXPECT_TRUE(text.find("SIGXCPU") != std::string::npos ||
                    text.find("SIGKILL") != std::string::npos) << text;
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(4));
}

TEST_F(SandboxE2ETest, WallClockTimeoutKillsIdleChild) {
    Sandbox sandbox(BaseConfig(ws_).WithWallClockTimeout(std::chrono::seconds(1)).Build());

    try {
        sandbox.RunShellCommand("sleep 5");
        FAIL() << "idle child outlived the wall-clock timeout";
    } catch (const SandboxError& e) {
        EXPECT_NE(std::string(e.what()).find("wall-clock timeout"), std::string::npos);
    }
}

TEST_F(SandboxE2ETest, RelativeWorkspaceIsRejected) {
    SandboxConfig config;
    config.host_workspace = "relative/workspace";
    EXPECT_THROW(Sandbox sandbox(config), SandboxError);
}

// ============================================================================
// Background jobs
// ============================================================================

TEST_F(SandboxE2ETest, BackgroundJobWritesLogAndCanBeTerminated) {
    Sandbox sandbox(BaseConfig(ws_).Build());

    auto job = sandbox.RunShellCommandBackground("echo started; sleep 30");
    EXPECT_GT(job.pid, 0);
    EXPECT_EQ(job.process_id, "bg_" + std::to_string(job.pid));
    EXPECT_EQ(job.log_file.string(), "/workspace/.sandbox_logs/bg_" + std::to_string(job.pid) + ".log");

    const auto host_log = sandbox.filesystem().ToHostPath(job.log_file);
    std::string log;
    for (int i = 0; i < 50 && log.find("started") == std::string::npos; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        log = warden::testing::Slurp(host_log);
    }
    EXPECT_NE(log.find("started"), std::string::npos);

    EXPECT_TRUE(sandbox.TerminateBackgroundJob(job));
}

// ============================================================================
// In-process limits
// ============================================================================

TEST_F(SandboxE2ETest, IdenticalRootsRunInForkedChild) {
    auto config = BaseConfig(ws_)
        .WithVirtualWorkspace(ws_.path())
        .WithIsolationMode(IsolationMode::AUTO)
        .Build();
    Sandbox sandbox(config);
    EXPECT_EQ(sandbox.backend_kind(), BackendKind::IN_PROCESS_LIMITS);

    EXPECT_EQ(sandbox.RunShellCommand("echo in-process"), "in-process\n");
    EXPECT_EQ(sandbox.MapToVirtual(nlohmann::json(ws_.path().string())), ws_.path().string());

    // The caller's tree is left as it was
    EXPECT_FALSE(std::filesystem::exists(ws_.path() / ".sandbox"));
    EXPECT_EQ(sandbox.provisioner().provision_count(), 0u);
    EXPECT_FALSE(sandbox.provisioner().RuntimeExists());
}

TEST_F(SandboxE2ETest, IdenticalRootsControlDirectoryIsRemoved) {
    std::filesystem::path control;
    {
        Sandbox sandbox(BaseConfig(ws_)
            .WithVirtualWorkspace(ws_.path())
            .WithIsolationMode(IsolationMode::AUTO)
            .Build());
        control = sandbox.control_directory();
        EXPECT_NE(control.parent_path(), ws_.path());
        EXPECT_TRUE(std::filesystem::is_directory(control));
    }
    EXPECT_FALSE(std::filesystem::exists(control));
}

TEST_F(SandboxE2ETest, MapToVirtualWalksNestedValues) {
    Sandbox sandbox(BaseConfig(ws_).Build());
    nlohmann::json value = {
        {"file", (ws_.path() / "a.txt").string()},
        {"list", {(ws_.path() / "b").string(), 7, "/etc/hosts"}}
    };
    auto mapped = sandbox.MapToVirtual(value);
    EXPECT_EQ(mapped.at("file"), "/workspace/a.txt");
    EXPECT_EQ(mapped.at("list").at(0), "/workspace/b");
    EXPECT_EQ(mapped.at("list").at(1), 7);
    EXPECT_EQ(mapped.at("list").at(2), "/etc/hosts");
    EXPECT_EQ(sandbox.MapToHost(mapped), value);
}
