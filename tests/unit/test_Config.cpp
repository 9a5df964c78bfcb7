#include <gtest/gtest.h>

#include "support/TempDir.hpp"
#include "config/Config.hpp"
#include "config/toml.hpp"
#include "config/util.hpp"
#include "util/files.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

using namespace bob;
using namespace bob::config;

TEST(ConfigTest, EmptyJsonIsDefaults) {
    const auto cfg = parseConfig("  \n", Format::Json);
    EXPECT_FALSE(cfg.downloads_location);
    EXPECT_EQ(cfg.rollbackLimit(), DEFAULT_ROLLBACK_LIMIT);
    EXPECT_EQ(cfg.githubMirror(), "https://github.com");
    EXPECT_TRUE(cfg.nightlyInfo());
    EXPECT_FALSE(cfg.releaseBuild());
    EXPECT_TRUE(cfg.ignoreRunningInstances());
}

TEST(ConfigTest, ParsesJson) {
    const auto cfg = parseConfig(R"({
        "enable_nightly_info": false,
        "enable_release_build": true,
        "downloads_location": "/opt/bob",
        "github_mirror": "https://mirror.example",
        "rollback_limit": 5,
        "add_neovim_binary_to_path": true
    })", Format::Json);

    EXPECT_FALSE(cfg.nightlyInfo());
    EXPECT_TRUE(cfg.releaseBuild());
    EXPECT_EQ(cfg.downloads_location, "/opt/bob");
    EXPECT_EQ(cfg.githubMirror(), "https://mirror.example");
    EXPECT_EQ(cfg.rollbackLimit(), 5);
    EXPECT_EQ(cfg.add_neovim_binary_to_path, true);
}

TEST(ConfigTest, RollbackLimitMustFitInAByte) {
    EXPECT_THROW(parseConfig(R"({"rollback_limit": 256})", Format::Json), std::runtime_error);
    EXPECT_THROW(parseConfig(R"({"rollback_limit": -1})", Format::Json), std::runtime_error);
    EXPECT_EQ(parseConfig(R"({"rollback_limit": 0})", Format::Json).rollbackLimit(), 0);
}

TEST(ConfigTest, ParsesToml) {
    const auto cfg = parseConfig(
        "# bob settings\n"
        "enable_release_build = true\n"
        "downloads_location = '/data/bob'\n"
        "rollback_limit = 2 # keep two\n",
        Format::Toml);

    EXPECT_TRUE(cfg.releaseBuild());
    EXPECT_EQ(cfg.downloads_location, "/data/bob");
    EXPECT_EQ(cfg.rollbackLimit(), 2);
}

TEST(ConfigTest, ParsesYaml) {
    const auto cfg = parseConfig("enable_nightly_info: false\nrollback_limit: 1\nlog_level: debug\n", Format::Yaml);
    EXPECT_FALSE(cfg.nightlyInfo());
    EXPECT_EQ(cfg.rollbackLimit(), 1);
    EXPECT_EQ(cfg.log_level, "debug");
}

TEST(ConfigTest, ExpandsEnvironmentVariablesInPaths) {
    const test::ScopedEnv home("BOB_TEST_ROOT", std::string("/home/tester"));
    const auto cfg = parseConfig(R"({"downloads_location": "$BOB_TEST_ROOT/.bob"})", Format::Json);
    EXPECT_EQ(cfg.downloads_location, "/home/tester/.bob");
}

TEST(ConfigTest, ExpandsEnvironmentVariablesInEveryString) {
    const test::ScopedEnv mirror("BOB_TEST_MIRROR", std::string("https://mirror.example"));
    const test::ScopedEnv level("BOB_TEST_LEVEL", std::string("debug"));
    const auto cfg = parseConfig(R"({"github_mirror": "$BOB_TEST_MIRROR", "log_level": "$BOB_TEST_LEVEL"})",
                                 Format::Json);
    EXPECT_EQ(cfg.github_mirror, "https://mirror.example");
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.githubMirror(), "https://mirror.example");
}

TEST(ConfigTest, ExpandOnlyMatchesUppercaseNames) {
    const auto lookup = [](const std::string& name) -> std::optional<std::string> {
        if (name == "HOME") return std::string("/h");
        return std::nullopt;
    };
    std::vector<std::string> missing;
    const auto out = expandEnvironmentVariables("$HOME/x/$home/$NOPE", lookup,
                                                [&](const std::string& n) { missing.push_back(n); });
    EXPECT_EQ(out, "/h/x/$home/");
    EXPECT_EQ(missing, std::vector<std::string>{"NOPE"});
}

TEST(ConfigTest, FormatFollowsExtension) {
    EXPECT_EQ(formatFor("config.toml"), Format::Toml);
    EXPECT_EQ(formatFor("config.YAML"), Format::Yaml);
    EXPECT_EQ(formatFor("config.yml"), Format::Yaml);
    EXPECT_EQ(formatFor("config.json"), Format::Json);
    EXPECT_EQ(formatFor("config"), Format::Json);
}

TEST(ConfigTest, MissingFileYieldsDefaults) {
    const test::TempDir tmp;
    const auto cfg = loadConfig(tmp / "nope.json");
    EXPECT_FALSE(cfg.downloads_location);
}

TEST(ConfigTest, MalformedFileNamesThePath) {
    const test::TempDir tmp;
    const auto path = tmp / "config.json";
    util::writeFile(path, "{ not json");
    try {
        (void)loadConfig(path);
        FAIL() << "expected a parse error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find(path.string()), std::string::npos);
    }
}

TEST(ConfigTest, PersistFlagKeepsOtherJsonKeys) {
    const test::TempDir tmp;
    const auto path = tmp / "config.json";
    util::writeFile(path, R"({"rollback_limit": 4})");

    persistFlag(path, "add_neovim_binary_to_path", false);

    const auto j = nlohmann::json::parse(util::readFileToString(path));
    EXPECT_EQ(j.at("rollback_limit"), 4);
    EXPECT_EQ(j.at("add_neovim_binary_to_path"), false);
    EXPECT_EQ(loadConfig(path).add_neovim_binary_to_path, false);
}

TEST(ConfigTest, PersistFlagCreatesMissingFile) {
    const test::TempDir tmp;
    const auto path = tmp / "nested" / "config.json";
    persistFlag(path, "add_neovim_binary_to_path", true);
    EXPECT_EQ(loadConfig(path).add_neovim_binary_to_path, true);
}

TEST(ConfigTest, PersistFlagRewritesToml) {
    const test::TempDir tmp;
    const auto path = tmp / "config.toml";
    util::writeFile(path, "rollback_limit = 1\nadd_neovim_binary_to_path = true\n");

    persistFlag(path, "add_neovim_binary_to_path", false);

    const auto cfg = loadConfig(path);
    EXPECT_EQ(cfg.add_neovim_binary_to_path, false);
    EXPECT_EQ(cfg.rollbackLimit(), 1);
}

TEST(ConfigTest, PersistFlagRewritesYaml) {
    const test::TempDir tmp;
    const auto path = tmp / "config.yaml";
    util::writeFile(path, "rollback_limit: 2\n");

    persistFlag(path, "add_neovim_binary_to_path", true);

    const auto cfg = loadConfig(path);
    EXPECT_EQ(cfg.add_neovim_binary_to_path, true);
    EXPECT_EQ(cfg.rollbackLimit(), 2);
}

TEST(TomlTest, ParsesScalars) {
    const auto j = toml::parse(
        "name = \"a \\\"quoted\\\" value\"\n"
        "literal = 'C:\\path'\n"
        "big = 1_000\n"
        "flag = false\n");
    EXPECT_EQ(j.at("name"), "a \"quoted\" value");
    EXPECT_EQ(j.at("literal"), "C:\\path");
    EXPECT_EQ(j.at("big"), 1000);
    EXPECT_EQ(j.at("flag"), false);
}

TEST(TomlTest, HashInsideStringIsNotAComment) {
    const auto j = toml::parse("url = \"https://example.com/#anchor\" # trailing\n");
    EXPECT_EQ(j.at("url"), "https://example.com/#anchor");
}

TEST(TomlTest, RejectsTablesAndDuplicates) {
    EXPECT_THROW(toml::parse("[section]\nkey = 1\n"), std::runtime_error);
    EXPECT_THROW(toml::parse("a = 1\na = 2\n"), std::runtime_error);
    EXPECT_THROW(toml::parse("just words\n"), std::runtime_error);
    EXPECT_THROW(toml::parse("a = [1, 2]\n"), std::runtime_error);
}

TEST(TomlTest, SetBoolReplacesOrAppends) {
    EXPECT_EQ(toml::setBool("a = 1\nflag = true\n", "flag", false), "a = 1\nflag = false\n");
    EXPECT_EQ(toml::setBool("a = 1\n", "flag", true), "a = 1\nflag = true\n");
    // A key that merely shares the prefix is left alone
    EXPECT_EQ(toml::setBool("flag_other = 1\n", "flag", true), "flag_other = 1\nflag = true\n");
}
