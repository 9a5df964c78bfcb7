#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <memory>

namespace bob::net { class HttpClient; class GitHub; }
namespace bob::process { class Runner; }
namespace bob::concurrency { class ThreadPool; }
namespace bob::cli { struct IO; }

namespace bob::runtime {

// Everything a command needs, built once in main and passed by reference.
struct Context {
    config::Config config;
    std::filesystem::path configPath;
    std::filesystem::path selfExe;

    std::shared_ptr<net::HttpClient> http;
    std::shared_ptr<net::GitHub> github;
    std::shared_ptr<process::Runner> runner;
    std::shared_ptr<concurrency::ThreadPool> pool;
    std::shared_ptr<cli::IO> io;

    // curl, fork/exec, a one-worker pool and the terminal.
    static std::unique_ptr<Context> system(config::Config cfg, std::filesystem::path configPath,
                                           std::filesystem::path selfExe);
};

}
