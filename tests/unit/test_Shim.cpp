#include <gtest/gtest.h>

#include "support/TestContext.hpp"
#include "shim/Shim.hpp"
#include "types/errors.hpp"

namespace fs = std::filesystem;
using namespace bob;

TEST(ShimInvocationTest, DetectedByNameOrSentinel) {
    EXPECT_TRUE(shim::isShimInvocation("/home/me/.local/share/bob/nvim-bin/nvim", {"file.txt"}));
    EXPECT_TRUE(shim::isShimInvocation("/usr/local/bin/bob", {"--&shim", "file.txt"}));
    EXPECT_FALSE(shim::isShimInvocation("/usr/local/bin/bob", {"list"}));
    EXPECT_FALSE(shim::isShimInvocation("bob", {}));
}

#ifndef _WIN32

class ShimResolveTest : public ::testing::Test {
protected:
    test::TestContext t;
    test::ScopedEnv path{"PATH", (t.tmp / "path-bin").string()};

    void SetUp() override { fs::create_directories(t.tmp / "path-bin"); }

    void placeExecutable(const fs::path& file) const {
        fs::create_directories(file.parent_path());
        util::writeFile(file, "#!/bin/sh\n");
        fs::permissions(file, fs::perms::owner_all);
    }
};

TEST_F(ShimResolveTest, InstalledLayout) {
    t.fakeInstall("v0.9.5");
    EXPECT_EQ(shim::resolveBinary(t.ctx.config, "v0.9.5"), t.root() / "v0.9.5" / "bin" / "nvim");
}

TEST_F(ShimResolveTest, FullHashResolvesToShortDirectory) {
    t.fakeInstall("abc1234");
    EXPECT_EQ(shim::resolveBinary(t.ctx.config, "abc1234def5678abc1234def5678abc1234def56"),
              t.root() / "abc1234" / "bin" / "nvim");
}

TEST_F(ShimResolveTest, NestedPlatformDirectory) {
    fs::create_directories(t.root() / "v0.4.4" / "nvim-linux64" / "bin");
    util::writeFile(t.root() / "v0.4.4" / "nvim-linux64" / "bin" / "nvim", "");

    EXPECT_EQ(shim::resolveBinary(t.ctx.config, "v0.4.4"), t.root() / "v0.4.4" / "nvim-linux64" / "bin" / "nvim");
}

TEST_F(ShimResolveTest, MissingInstallIsAnError) {
    EXPECT_THROW(shim::resolveBinary(t.ctx.config, "v0.9.5"), Error);
}

TEST_F(ShimResolveTest, SystemEditorSkipsOurOwnShim) {
    EXPECT_THROW(shim::resolveBinary(t.ctx.config, "system"), Error);

    const test::ScopedEnv both("PATH", (t.tmp / "bin").string() + ":" + (t.tmp / "path-bin").string());
    placeExecutable(t.tmp / "bin" / "nvim");
    EXPECT_FALSE(shim::findSystemEditor(t.ctx.config));

    placeExecutable(t.tmp / "path-bin" / "nvim");
    EXPECT_EQ(shim::resolveBinary(t.ctx.config, "system"), t.tmp / "path-bin" / "nvim");
}

#endif
