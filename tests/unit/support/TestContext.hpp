#pragma once

#include "support/Fakes.hpp"
#include "support/TempDir.hpp"

#include "runtime/Context.hpp"
#include "runtime/BuildInfo.hpp"
#include "net/GitHub.hpp"
#include "concurrency/ThreadPool.hpp"
#include "util/files.hpp"

#include <fmt/core.h>
#include <memory>

namespace bob::test {

// A Context over a private temp tree: <tmp>/downloads is the downloads root, <tmp>/bin the
// shim directory. Network, processes and prompts are faked.
struct TestContext {
    TempDir tmp;
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
    std::shared_ptr<RecordingRunner> runner = std::make_shared<RecordingRunner>();
    std::shared_ptr<ScriptedIO> io = std::make_shared<ScriptedIO>();
    runtime::Context ctx;

    TestContext() {
        std::filesystem::create_directories(root());

        ctx.config.downloads_location = root().string();
        ctx.config.installation_location = (tmp / "bin").string();
        ctx.config.add_neovim_binary_to_path = false;
        ctx.configPath = tmp / "config.json";
        ctx.selfExe = tmp / "bob-self";
        util::writeFile(ctx.selfExe, "bob binary");

        ctx.http = http;
        ctx.github = std::make_shared<net::GitHub>(http);
        ctx.runner = runner;
        ctx.pool = std::make_shared<concurrency::ThreadPool>(1);
        ctx.io = io;

        // The freshly copied shim answers the version probe with our own version.
        runner->handler = [](const process::Command& cmd) -> std::optional<process::ExecResult> {
            if (!cmd.args.empty() && cmd.args.front() == "--&bob") return process::ExecResult{0, runtime::toolVersion() + "\n"};
            return std::nullopt;
        };
    }

    [[nodiscard]] std::filesystem::path root() const { return tmp / "downloads"; }

    // A finished install at <root>/<dir>/bin/nvim.
    void fakeInstall(const std::string& dir) const {
        std::filesystem::create_directories(root() / dir / "bin");
        util::writeFile(root() / dir / "bin" / "nvim", "#!/bin/sh\n");
    }

    void fakeNightly(const std::string& dir, const std::string& tag, const std::string& commit,
                     const std::string& publishedAt) const {
        fakeInstall(dir);
        util::writeFile(root() / dir / "bob.json", releaseJson(tag, commit, publishedAt));
    }

    static std::string releaseJson(const std::string& tag, const std::string& commit, const std::string& publishedAt) {
        return fmt::format(R"({{"tag_name":"{}","target_commitish":"{}","published_at":"{}","assets":[]}})",
                           tag, commit, publishedAt);
    }
};

}
