#include "log/Registry.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <array>
#include <cstdlib>
#include <mutex>
#include <stdexcept>

namespace bob::log {

namespace {

constexpr std::array<const char*, 7> LOGGER_NAMES = {"bob", "net", "install", "fs", "shim", "path", "cli"};

std::recursive_mutex& registryMutex() {
    static std::recursive_mutex m;
    return m;
}

}

void Registry::init() {
    std::scoped_lock lock(registryMutex());
    if (initialized_) return;

    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(CONSOLE_FORMAT);
    console_sink_->set_level(spdlog::level::trace);

    for (const auto* name : LOGGER_NAMES) {
        if (spdlog::get(name)) spdlog::drop(name);
        const auto logger = std::make_shared<spdlog::logger>(name, console_sink_);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
}

void Registry::configure(const std::optional<std::string>& level,
                         const std::optional<std::filesystem::path>& logFile) {
    std::scoped_lock lock(registryMutex());
    init();

    auto lvl = spdlog::level::info;
    if (level) lvl = parseLevel(*level);
    if (const char* env = std::getenv("BOB_LOG"); env && *env) lvl = parseLevel(env);

    if (logFile && !file_sink_) {
        namespace fs = std::filesystem;
        if (logFile->has_parent_path()) fs::create_directories(logFile->parent_path());
        file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile->string(), file_max_bytes_, file_max_files_);
        file_sink_->set_pattern(FILE_FORMAT);
        file_sink_->set_level(spdlog::level::trace);
    }

    for (const auto* name : LOGGER_NAMES) {
        const auto logger = get(name);
        logger->set_level(lvl);
        if (file_sink_ && logger->sinks().size() == 1) logger->sinks().push_back(file_sink_);
    }
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    if (!initialized_) init();
    auto logger = spdlog::get(name);
    if (!logger) throw std::runtime_error("[log::Registry] Logger not found: " + name);
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

spdlog::level::level_enum Registry::parseLevel(const std::string& level) {
    auto normalized = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(level));
    if (normalized == "warning") normalized = "warn";
    if (normalized == "error") normalized = "err";

    const auto parsed = spdlog::level::from_str(normalized);
    if (parsed == spdlog::level::off && normalized != "off")
        throw std::runtime_error("Unknown log level: " + level);
    return parsed;
}

}
