#include "warden/core/workspace_filesystem.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using warden::core::FileTreeOptions;
using warden::core::WorkspaceFilesystem;
using warden::testing::TempDir;

TEST(WorkspaceFilesystemTest, SinglePathTranslation) {
    WorkspaceFilesystem fs("/home/u/proj", "/workspace");
    EXPECT_TRUE(fs.path_mapping_enabled());

    EXPECT_EQ(fs.ToHostPath("/workspace").string(), "/home/u/proj");
    EXPECT_EQ(fs.ToHostPath("/workspace/src/main.py").string(), "/home/u/proj/src/main.py");
    EXPECT_EQ(fs.ToHostPath("/workspace2/x").string(), "/workspace2/x");
    EXPECT_EQ(fs.ToHostPath("relative/path").string(), "relative/path");

    EXPECT_EQ(fs.ToVirtualPath("/home/u/proj/src").string(), "/workspace/src");
    EXPECT_EQ(fs.ToVirtualPath("/home/u/project").string(), "/home/u/project");
}

TEST(WorkspaceFilesystemTest, RoundTripIsIdentity) {
    WorkspaceFilesystem fs("/home/u/proj/", "/workspace/");
    EXPECT_EQ(fs.host_root().string(), "/home/u/proj");
    EXPECT_EQ(fs.virtual_root().string(), "/workspace");

    for (const char* host : {"/home/u/proj", "/home/u/proj/a/b.txt", "/etc/passwd"}) {
        EXPECT_EQ(fs.ToHostPath(fs.ToVirtualPath(host)).string(), host);
    }
    const std::string text = "cd /home/u/proj/src && cat /home/u/proj/a.txt";
    EXPECT_EQ(fs.MapTextToHost(fs.MapTextToVirtual(text)), text);
}

TEST(WorkspaceFilesystemTest, TextMappingRespectsTokenBoundaries) {
    WorkspaceFilesystem fs("/home/u/proj", "/workspace");

    EXPECT_EQ(fs.MapTextToHost("ls /workspace/src"), "ls /home/u/proj/src");
    EXPECT_EQ(fs.MapTextToHost("cd /workspace && ls"), "cd /home/u/proj && ls");
    EXPECT_EQ(fs.MapTextToHost("'/workspace'"), "'/home/u/proj'");
    EXPECT_EQ(fs.MapTextToHost("/workspace"), "/home/u/proj");

    EXPECT_EQ(fs.MapTextToHost("/data/workspace/x"), "/data/workspace/x");
    EXPECT_EQ(fs.MapTextToHost("/workspace2"), "/workspace2");
    EXPECT_EQ(fs.MapTextToHost("my/workspace"), "my/workspace");
    EXPECT_EQ(fs.MapTextToHost("/workspace_old"), "/workspace_old");

    EXPECT_EQ(fs.MapTextToVirtual("Traceback: /home/u/proj/a.py line 3"),
              "Traceback: /workspace/a.py line 3");
    EXPECT_EQ(fs.MapTextToVirtual("/home/u/project/a.py"), "/home/u/project/a.py");
}

TEST(WorkspaceFilesystemTest, IdenticalRootsDisableMapping) {
    WorkspaceFilesystem fs("/srv/ws", "/srv/ws");
    EXPECT_FALSE(fs.path_mapping_enabled());
    EXPECT_EQ(fs.MapTextToHost("ls /srv/ws"), "ls /srv/ws");
    EXPECT_EQ(fs.ToVirtualPath("/srv/ws/a").string(), "/srv/ws/a");
}

TEST(WorkspaceFilesystemTest, FileTreeHidesControlEntriesAndCapsSubdirectories) {
    TempDir ws;
    ws.Write("README.md", "#");
    ws.Write(".env", "SECRET=1");
    ws.Write(".git/HEAD", "ref");
    ws.Write(".sandbox/runtime/marker", "{}");
    ws.Write("node_modules/pkg/index.js", "");
    for (const char* name : {"a.py", "b.py", "c.py", "d.py", "e.py", "f.py", "g.py"}) {
        ws.Write(std::string("src/") + name, "");
    }
    ws.Write("skills/tool1/deep/file.txt", "");

    WorkspaceFilesystem fs(ws.path(), "/workspace");
    const std::string expected =
        "skills/\n"
        "src/\n"
        "README.md\n"
        "skills/tool1/\n"
        "src/a.py\n"
        "src/b.py\n"
        "src/c.py\n"
        "src/d.py\n"
        "src/e.py\n"
        "... (and 2 more items)\n";
    EXPECT_EQ(fs.FileTree(), expected);
}

TEST(WorkspaceFilesystemTest, FileTreeHiddenAndDepthOptions) {
    TempDir ws;
    ws.Write(".env", "x");
    ws.Write(".git/HEAD", "ref");
    ws.Write("pkg/mod/file.txt", "");

    WorkspaceFilesystem fs(ws.path(), "/workspace");

    FileTreeOptions options;
    options.include_hidden = true;
    options.max_depth = 0;
    EXPECT_EQ(fs.FileTree(options), ".env\n");

    FileTreeOptions one_level;
    one_level.max_depth = 1;
    EXPECT_EQ(fs.FileTree(one_level), "pkg/\n");

    FileTreeOptions rooted;
    rooted.root = std::filesystem::path("/workspace/pkg");
    EXPECT_EQ(fs.FileTree(rooted), "mod/\nmod/file.txt\n");

    FileTreeOptions missing;
    missing.root = std::filesystem::path("/workspace/nope");
    EXPECT_EQ(fs.FileTree(missing), "");
}

TEST(WorkspaceFilesystemTest, FileHelpersUseVirtualPaths) {
    TempDir ws;
    WorkspaceFilesystem fs(ws.path(), "/workspace");

    fs.WriteFile("/workspace/out/result.txt", "one");
    fs.WriteFile("/workspace/out/result.txt", "two", true);
    EXPECT_EQ(warden::testing::Slurp(ws.path() / "out" / "result.txt"), "onetwo");
    EXPECT_EQ(fs.ReadFile("/workspace/out/result.txt"), "onetwo");
    EXPECT_THROW(fs.ReadFile("/workspace/none.txt"), std::runtime_error);

    auto dir = fs.EnsureDirectory("/workspace/cache/a");
    EXPECT_TRUE(std::filesystem::is_directory(dir));
    EXPECT_EQ(dir.string(), (ws.path() / "cache" / "a").string());
}
