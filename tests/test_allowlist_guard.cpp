#include "warden/core/allowlist_guard.hpp"
#include "warden/core/errors.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using warden::core::AllowlistGuard;
using warden::core::SecurityViolation;
using warden::testing::TempDir;

TEST(AllowlistGuardTest, AllowsPathsUnderRoots) {
    TempDir allowed;
    auto file = allowed.Write("data/input.txt", "payload");
    AllowlistGuard guard({allowed.path()});

    EXPECT_TRUE(guard.enforcing());
    EXPECT_TRUE(guard.IsAllowed(file));
    EXPECT_TRUE(guard.IsAllowed(allowed.path()));
    EXPECT_TRUE(guard.IsAllowed(allowed.path() / "not-yet-created.txt"));
    EXPECT_EQ(guard.ReadFile(file), "payload");
}

TEST(AllowlistGuardTest, DeniesOutsideWithSandboxedMessage) {
    TempDir allowed;
    TempDir outside;
    auto secret = outside.Write("secret.txt", "hidden");
    AllowlistGuard guard({allowed.path()});

    EXPECT_FALSE(guard.IsAllowed(secret));
    try {
        guard.ReadFile(secret);
        FAIL() << "read outside the allow-list succeeded";
    } catch (const SecurityViolation& e) {
        EXPECT_EQ(std::string(e.what()), "Access to file " + secret.string() + " is denied (Sandboxed).");
    }
    EXPECT_THROW(guard.WriteFile(outside.path() / "new.txt", "x"), SecurityViolation);
    EXPECT_FALSE(std::filesystem::exists(outside.path() / "new.txt"));
}

TEST(AllowlistGuardTest, SiblingPrefixIsNotInside) {
    TempDir base;
    auto root = base.Mkdir("work");
    auto sibling = base.Write("work-other/file.txt", "x");
    AllowlistGuard guard({root});
    EXPECT_FALSE(guard.IsAllowed(sibling));
}

TEST(AllowlistGuardTest, DotDotEscapeIsResolved) {
    TempDir base;
    auto root = base.Mkdir("work");
    base.Write("outside.txt", "x");
    AllowlistGuard guard({root});
    EXPECT_FALSE(guard.IsAllowed(root / ".." / "outside.txt"));
}

TEST(AllowlistGuardTest, SymlinkOutOfRootIsDenied) {
    TempDir allowed;
    TempDir outside;
    auto secret = outside.Write("secret.txt", "hidden");
    std::filesystem::create_symlink(secret, allowed.path() / "link.txt");

    AllowlistGuard guard({allowed.path()});
    EXPECT_THROW(guard.ReadFile(allowed.path() / "link.txt"), SecurityViolation);
}

TEST(AllowlistGuardTest, PermissiveAllowsEverything) {
    TempDir outside;
    auto file = outside.Write("any.txt", "ok");
    auto guard = AllowlistGuard::Permissive();
    EXPECT_FALSE(guard.enforcing());
    EXPECT_TRUE(guard.IsAllowed("/etc/hostname"));
    EXPECT_EQ(guard.ReadFile(file), "ok");
}

TEST(AllowlistGuardTest, WriteAndAppendInsideRoot) {
    TempDir allowed;
    AllowlistGuard guard({allowed.path()});
    auto target = allowed.path() / "log.txt";
    guard.WriteFile(target, "a");
    guard.WriteFile(target, "b", true);
    EXPECT_EQ(warden::testing::Slurp(target), "ab");
}
