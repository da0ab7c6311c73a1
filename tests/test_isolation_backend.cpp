#include "warden/core/errors.hpp"
#include "warden/isolation/backends.hpp"
#include "warden/isolation/isolation_backend.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

using namespace warden::isolation;
using warden::testing::TempDir;

namespace {

BackendContext MakeContext(const std::filesystem::path& workspace) {
    BackendContext ctx;
    ctx.host_workspace = workspace;
    ctx.virtual_workspace = "/workspace";
    ctx.control_directory = workspace / ".sandbox";
    ctx.allowed_paths = {workspace, workspace / ".sandbox", "/usr/share/zoneinfo"};
    return ctx;
}

LaunchSpec MakeSpec(const std::filesystem::path& workspace) {
    LaunchSpec spec;
    spec.run_id = "abc123";
    spec.launcher = workspace / ".sandbox" / "bin" / "warden-launcher";
    spec.request = workspace / ".sandbox" / "request_abc123.json";
    spec.response = workspace / ".sandbox" / "response_abc123.json";
    spec.working_directory = workspace / "src";
    return spec;
}

std::ptrdiff_t IndexOf(const std::vector<std::string>& args, const std::string& value) {
    auto it = std::find(args.begin(), args.end(), value);
    return it == args.end() ? -1 : std::distance(args.begin(), it);
}

} // anonymous namespace

// ============================================================================
// Selection
// ============================================================================

TEST(DetectBackendTest, LinuxSelection) {
    EXPECT_EQ(DetectBackend(Platform::LINUX, IsolationMode::AUTO, true), BackendKind::NAMESPACE_CONTAINER);
    EXPECT_EQ(DetectBackend(Platform::LINUX, IsolationMode::AUTO, false), BackendKind::PLAIN_SUBPROCESS);
    EXPECT_EQ(DetectBackend(Platform::LINUX, IsolationMode::NAMESPACE_CONTAINER, false),
              BackendKind::NAMESPACE_CONTAINER);
    EXPECT_EQ(DetectBackend(Platform::LINUX, IsolationMode::CHROOT, true), BackendKind::PRIVILEGED_CHROOT);
    EXPECT_EQ(DetectBackend(Platform::LINUX, IsolationMode::NATIVE_PROFILE, true),
              BackendKind::PLAIN_SUBPROCESS);
    EXPECT_EQ(DetectBackend(Platform::LINUX, IsolationMode::SUBPROCESS, true), BackendKind::PLAIN_SUBPROCESS);
    EXPECT_EQ(DetectBackend(Platform::LINUX, IsolationMode::IN_PROCESS, true), BackendKind::IN_PROCESS_LIMITS);
}

TEST(DetectBackendTest, MacSelection) {
    EXPECT_EQ(DetectBackend(Platform::MACOS, IsolationMode::AUTO, true), BackendKind::NATIVE_PROFILE);
    EXPECT_EQ(DetectBackend(Platform::MACOS, IsolationMode::NATIVE_PROFILE, true), BackendKind::NATIVE_PROFILE);
    EXPECT_EQ(DetectBackend(Platform::MACOS, IsolationMode::NAMESPACE_CONTAINER, true),
              BackendKind::PLAIN_SUBPROCESS);
    EXPECT_EQ(DetectBackend(Platform::MACOS, IsolationMode::CHROOT, true), BackendKind::PLAIN_SUBPROCESS);
}

TEST(DetectBackendTest, IdenticalRootsUseInProcessLimits) {
    for (auto mode : {IsolationMode::AUTO, IsolationMode::NAMESPACE_CONTAINER, IsolationMode::CHROOT,
                      IsolationMode::SUBPROCESS}) {
        EXPECT_EQ(DetectBackend(Platform::LINUX, mode, true, false), BackendKind::IN_PROCESS_LIMITS);
    }
}

TEST(DetectBackendTest, ModeNames) {
    EXPECT_EQ(IsolationModeFromString("bwrap"), IsolationMode::NAMESPACE_CONTAINER);
    EXPECT_EQ(IsolationModeFromString(" Seatbelt "), IsolationMode::NATIVE_PROFILE);
    EXPECT_EQ(IsolationModeToString(IsolationMode::IN_PROCESS), "in_process");
    EXPECT_THROW(IsolationModeFromString("docker"), std::invalid_argument);
    EXPECT_EQ(BackendKindToString(BackendKind::PRIVILEGED_CHROOT), "privileged_chroot");
    EXPECT_EQ(HelperBinaryFor(Platform::LINUX, IsolationMode::AUTO), "bwrap");
    EXPECT_EQ(HelperBinaryFor(Platform::MACOS, IsolationMode::AUTO), "sandbox-exec");
    EXPECT_EQ(HelperBinaryFor(Platform::LINUX, IsolationMode::SUBPROCESS), "");
}

// ============================================================================
// Bubblewrap
// ============================================================================

TEST(BubblewrapBackendTest, ArgumentsMountWorkspaceAtVirtualRoot) {
    TempDir fake_root;
    fake_root.Mkdir("usr");
    fake_root.Mkdir("etc");
    fake_root.Mkdir("proc");
    fake_root.Mkdir("tmp");
    std::filesystem::create_directory_symlink("usr/bin", fake_root.path() / "bin");

    TempDir ws;
    BubblewrapBackend backend(MakeContext(ws.path()));
    backend.set_system_root(fake_root.path());

    auto args = backend.BuildArguments(MakeSpec(ws.path()));

    EXPECT_EQ(args.at(0), "--die-with-parent");
    EXPECT_NE(IndexOf(args, "--unshare-all"), -1);

    auto symlink = IndexOf(args, "--symlink");
    ASSERT_NE(symlink, -1);
    EXPECT_EQ(args.at(symlink + 1), "usr/bin");
    EXPECT_EQ(args.at(symlink + 2), "/bin");

    auto usr = IndexOf(args, (fake_root.path() / "usr").string());
    ASSERT_NE(usr, -1);
    EXPECT_EQ(args.at(usr - 1), "--ro-bind");
    EXPECT_EQ(args.at(usr + 1), "/usr");

    // Replaced by fresh mounts rather than bound from the host
    EXPECT_EQ(IndexOf(args, (fake_root.path() / "proc").string()), -1);
    EXPECT_EQ(IndexOf(args, (fake_root.path() / "tmp").string()), -1);
    EXPECT_NE(IndexOf(args, "--proc"), -1);
    EXPECT_NE(IndexOf(args, "--tmpfs"), -1);

    auto ws_bind = IndexOf(args, ws.path().string());
    ASSERT_NE(ws_bind, -1);
    EXPECT_EQ(args.at(ws_bind - 1), "--bind");
    EXPECT_EQ(args.at(ws_bind + 1), "/workspace");

    auto chdir = IndexOf(args, "--chdir");
    ASSERT_NE(chdir, -1);
    EXPECT_EQ(args.at(chdir + 1), "/workspace/src");
}

TEST(BubblewrapBackendTest, ChildPathsUseVirtualRoot) {
    TempDir ws;
    BubblewrapBackend backend(MakeContext(ws.path()));
    EXPECT_EQ(backend.ToChildPath(ws.path() / "a" / "b.py").string(), "/workspace/a/b.py");
    EXPECT_EQ(backend.ToChildPath(ws.path()).string(), "/workspace");
    EXPECT_EQ(backend.ToChildPath("/usr/lib/x.so").string(), "/usr/lib/x.so");
    EXPECT_TRUE(backend.EnforcesFilesystem());
}

// ============================================================================
// chroot
// ============================================================================

TEST(ChrootBackendTest, ChildPathsAreRelativeToControlDirectory) {
    TempDir ws;
    ChrootBackend backend(MakeContext(ws.path()));
    EXPECT_EQ(backend.ToChildPath(ws.path() / ".sandbox" / "bin" / "warden-launcher").string(),
              "/bin/warden-launcher");
    EXPECT_EQ(backend.ToChildPath(ws.path() / ".sandbox").string(), "/");
}

TEST(ChrootBackendTest, BareControlDirectoryIsRejectedWithHint) {
    TempDir ws;
    std::filesystem::create_directories(ws.path() / ".sandbox" / "runtime" / "bin");
    ChrootBackend backend(MakeContext(ws.path()));
    EXPECT_FALSE(backend.HasRootFilesystem());

    try {
        backend.BuildLaunch(MakeSpec(ws.path()));
        FAIL() << "chroot launch without a root filesystem succeeded";
    } catch (const warden::core::SandboxError& e) {
        // Either chroot is missing from PATH or the root filesystem check fails;
        // both are reported as a SandboxError with guidance
        EXPECT_NE(e.Describe().find("chroot"), std::string::npos);
    }
}

TEST(ChrootBackendTest, RootFilesystemDetection) {
    TempDir ws;
    ws.Write(".sandbox/bin/sh", "#!");
    ws.Mkdir(".sandbox/usr/lib");
    ChrootBackend backend(MakeContext(ws.path()));
    EXPECT_TRUE(backend.HasRootFilesystem());
}

// ============================================================================
// Seatbelt
// ============================================================================

TEST(SeatbeltBackendTest, ProfileDeniesByDefaultAndAllowsWorkspaceWrites) {
    TempDir ws;
    SeatbeltBackend backend(MakeContext(ws.path()));
    auto profile = backend.GenerateProfile();

    EXPECT_EQ(profile.rfind("(version 1)\n(deny default)\n", 0), 0u);
    EXPECT_NE(profile.find("(allow file-read*)"), std::string::npos);
    EXPECT_NE(profile.find("(subpath \"" + ws.path().string() + "\")"), std::string::npos);
    EXPECT_NE(profile.find("(subpath \"/usr/share/zoneinfo\")"), std::string::npos);
    EXPECT_NE(profile.find("(allow process*)"), std::string::npos);

    auto spec = MakeSpec(ws.path());
    EXPECT_EQ(backend.ProfilePath(spec).filename().string(), "profile_abc123.sb");
}

TEST(SeatbeltBackendTest, CleanupRemovesProfile) {
    TempDir ws;
    auto spec = MakeSpec(ws.path());
    SeatbeltBackend backend(MakeContext(ws.path()));
    ws.Write(".sandbox/profile_abc123.sb", "(version 1)");
    backend.Cleanup(spec);
    EXPECT_FALSE(std::filesystem::exists(backend.ProfilePath(spec)));
}

// ============================================================================
// Subprocess / in-process
// ============================================================================

TEST(SubprocessBackendTest, LaunchesLauncherDirectly) {
    TempDir ws;
    SubprocessBackend backend(MakeContext(ws.path()));
    auto spec = MakeSpec(ws.path());
    auto options = backend.BuildLaunch(spec);

    ASSERT_EQ(options.argv.size(), 3u);
    EXPECT_EQ(options.argv[0], spec.launcher.string());
    EXPECT_EQ(options.argv[1], spec.request.string());
    EXPECT_EQ(options.argv[2], spec.response.string());
    EXPECT_FALSE(options.merge_stderr);
    EXPECT_FALSE(backend.EnforcesFilesystem());
}

TEST(InProcessBackendTest, EntryReceivesArtifactPaths) {
    TempDir ws;
    ws.Mkdir("src");
    auto backend = CreateBackend(BackendKind::IN_PROCESS_LIMITS, MakeContext(ws.path()),
        [](const std::filesystem::path& request, const std::filesystem::path& response) {
            return request.filename() == "request_abc123.json" &&
                   response.filename() == "response_abc123.json" ? 0 : 5;
        });
    ASSERT_EQ(backend->kind(), BackendKind::IN_PROCESS_LIMITS);

    auto options = backend->BuildLaunch(MakeSpec(ws.path()));
    ASSERT_TRUE(static_cast<bool>(options.entry));
    auto result = warden::utils::RunProcess(options);
    EXPECT_EQ(result.exit_code, 0);
}

TEST(InProcessBackendTest, FactoryRequiresEntry) {
    TempDir ws;
    EXPECT_THROW(CreateBackend(BackendKind::IN_PROCESS_LIMITS, MakeContext(ws.path())),
                 std::invalid_argument);
}
