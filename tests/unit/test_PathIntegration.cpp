#include <gtest/gtest.h>

#include "support/TestContext.hpp"
#include "integration/PathIntegration.hpp"
#include "config/Config.hpp"

namespace fs = std::filesystem;
using namespace bob;
using namespace bob::integration;

#ifndef _WIN32

class PathIntegrationTest : public ::testing::Test {
protected:
    test::TestContext t;
    fs::path home = t.tmp / "home";
    fs::path installDir = t.tmp / "bin";

    void SetUp() override { fs::create_directories(home); }

    [[nodiscard]] ShellEnv shell(const std::string& name) const {
        return ShellEnv{home, name, std::nullopt, std::nullopt};
    }

    [[nodiscard]] static size_t count(const std::string& haystack, const std::string& needle) {
        size_t n = 0;
        for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) ++n;
        return n;
    }
};

TEST_F(PathIntegrationTest, RcFilesPerShell) {
    EXPECT_EQ(shell("bash").rcFiles(), (std::vector<fs::path>{home / ".bashrc", home / ".bash_profile"}));
    EXPECT_EQ(shell("zsh").rcFiles(), std::vector<fs::path>{home / ".zshenv"});
    EXPECT_EQ(shell("sh").rcFiles(), std::vector<fs::path>{home / ".profile"});

    ShellEnv zsh = shell("zsh");
    zsh.zdotdir = t.tmp / "zdot";
    EXPECT_EQ(zsh.rcFiles(), std::vector<fs::path>{t.tmp / "zdot" / ".zshenv"});

    ShellEnv fish = shell("fish");
    EXPECT_EQ(fish.fishConfDir(), home / ".config" / "fish" / "conf.d");
    fish.xdgConfigHome = t.tmp / "xdg";
    EXPECT_EQ(fish.fishConfDir(), t.tmp / "xdg" / "fish" / "conf.d");
}

TEST_F(PathIntegrationTest, EnvScriptGuardsAgainstDuplicates) {
    const auto script = PathIntegration::envShScript("/opt/bob/bin");
    EXPECT_NE(script.find(R"(*:"/opt/bob/bin":*))"), std::string::npos);
    EXPECT_NE(script.find(R"(export PATH="/opt/bob/bin:$PATH")"), std::string::npos);
    EXPECT_NE(script.find(":${PATH}:"), std::string::npos);

    const auto fish = PathIntegration::envFishScript("/opt/bob/bin");
    EXPECT_NE(fish.find(R"(if not contains "/opt/bob/bin" $PATH)"), std::string::npos);
}

TEST_F(PathIntegrationTest, BashAppendsToExistingRcFilesOnce) {
    util::writeFile(home / ".bashrc", "alias ll='ls -l'");
    util::writeFile(home / ".bash_profile", "");
    PathIntegration integration(t.ctx, shell("bash"));

    integration.apply(installDir);
    integration.apply(installDir);

    const auto line = integration.sourceLine();
    const auto bashrc = util::readFileToString(home / ".bashrc");
    EXPECT_EQ(bashrc, "alias ll='ls -l'\n" + line + "\n");
    EXPECT_EQ(count(util::readFileToString(home / ".bash_profile"), line), 1u);

    const auto envSh = util::readFileToString(t.root() / "env" / "env.sh");
    EXPECT_NE(envSh.find(installDir.string()), std::string::npos);
    EXPECT_TRUE(fs::exists(t.root() / "env" / "env.fish"));
}

TEST_F(PathIntegrationTest, CreatesFirstRcFileWhenNoneExist) {
    PathIntegration integration(t.ctx, shell("zsh"));

    integration.apply(installDir);

    EXPECT_EQ(util::readFileToString(home / ".zshenv"), integration.sourceLine() + "\n");
}

TEST_F(PathIntegrationTest, FishUsesConfD) {
    PathIntegration integration(t.ctx, shell("fish"));

    integration.apply(installDir);

    const auto hook = home / ".config" / "fish" / "conf.d" / "bob.fish";
    ASSERT_TRUE(fs::exists(hook));
    EXPECT_EQ(util::readFileToString(hook),
              "source \"" + (t.root() / "env" / "env.fish").string() + "\"\n");
    EXPECT_FALSE(fs::exists(home / ".profile"));
}

TEST_F(PathIntegrationTest, EraseRemovesOnlyOurLine) {
    util::writeFile(home / ".bashrc", "export EDITOR=nvim\n");
    PathIntegration bash(t.ctx, shell("bash"));
    bash.apply(installDir);
    PathIntegration(t.ctx, shell("fish")).apply(installDir);

    bash.erase(installDir);

    EXPECT_EQ(util::readFileToString(home / ".bashrc"), "export EDITOR=nvim\n");
    EXPECT_FALSE(fs::exists(home / ".config" / "fish" / "conf.d" / "bob.fish"));
}

TEST_F(PathIntegrationTest, DisabledFlagLeavesShellAlone) {
    PathIntegration integration(t.ctx, shell("bash"));

    EXPECT_FALSE(integration.ensure(installDir));
    EXPECT_FALSE(fs::exists(home / ".bashrc"));
    EXPECT_TRUE(t.io->prompts.empty());
}

TEST_F(PathIntegrationTest, NonInteractiveSessionOptsIn) {
    t.ctx.config.add_neovim_binary_to_path.reset();
    t.io->isInteractive = false;
    PathIntegration integration(t.ctx, shell("bash"));

    EXPECT_TRUE(integration.ensure(installDir));

    EXPECT_TRUE(fs::exists(home / ".bashrc"));
    EXPECT_EQ(config::loadConfig(t.ctx.configPath).add_neovim_binary_to_path, true);
    EXPECT_TRUE(t.io->prompts.empty());
}

TEST_F(PathIntegrationTest, AnswerIsPersisted) {
    t.ctx.config.add_neovim_binary_to_path.reset();
    t.io->timedConfirms.push_back(false);
    PathIntegration integration(t.ctx, shell("bash"));

    EXPECT_FALSE(integration.ensure(installDir));

    EXPECT_EQ(t.io->prompts.size(), 1u);
    EXPECT_EQ(t.ctx.config.add_neovim_binary_to_path, false);
    EXPECT_EQ(config::loadConfig(t.ctx.configPath).add_neovim_binary_to_path, false);
    EXPECT_FALSE(fs::exists(home / ".bashrc"));
}

TEST_F(PathIntegrationTest, UnansweredPromptAsksAgainNextTime) {
    t.ctx.config.add_neovim_binary_to_path.reset();
    PathIntegration integration(t.ctx, shell("bash"));

    EXPECT_FALSE(integration.ensure(installDir));

    EXPECT_FALSE(t.ctx.config.add_neovim_binary_to_path.has_value());
    EXPECT_FALSE(fs::exists(t.ctx.configPath));
}

#endif
