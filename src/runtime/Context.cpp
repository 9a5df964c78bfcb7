#include "runtime/Context.hpp"
#include "net/CurlHttpClient.hpp"
#include "net/GitHub.hpp"
#include "process/Runner.hpp"
#include "concurrency/ThreadPool.hpp"
#include "cli/IO.hpp"
#include "log/Registry.hpp"

namespace bob::runtime {

std::unique_ptr<Context> Context::system(config::Config cfg, std::filesystem::path configPath,
                                         std::filesystem::path selfExe) {
    auto ctx = std::make_unique<Context>();
    ctx->config = std::move(cfg);
    ctx->configPath = std::move(configPath);
    ctx->selfExe = std::move(selfExe);
    ctx->http = std::make_shared<net::CurlHttpClient>();
    ctx->github = std::make_shared<net::GitHub>(ctx->http);
    ctx->runner = std::make_shared<process::SystemRunner>();
    ctx->pool = std::make_shared<concurrency::ThreadPool>(1);
    ctx->io = std::make_shared<cli::TerminalIO>();

    log::Registry::bob()->debug("[Context] Initialized (config: {})", ctx->configPath.string());
    return ctx;
}

}
