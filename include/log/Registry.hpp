#pragma once

#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace bob::log {

class Registry {
public:
    // Console-only loggers at info level. Safe to call more than once.
    static void init();

    // Applies log_level (overridden by $BOB_LOG) and attaches a rotating file sink when a path is given.
    static void configure(const std::optional<std::string>& level,
                          const std::optional<std::filesystem::path>& logFile);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> bob()     { return get("bob"); }
    static std::shared_ptr<spdlog::logger> net()     { return get("net"); }
    static std::shared_ptr<spdlog::logger> install() { return get("install"); }
    static std::shared_ptr<spdlog::logger> fs()      { return get("fs"); }
    static std::shared_ptr<spdlog::logger> shim()    { return get("shim"); }
    static std::shared_ptr<spdlog::logger> path()    { return get("path"); }
    static std::shared_ptr<spdlog::logger> cli()     { return get("cli"); }

    [[nodiscard]] static bool isInitialized();

    static spdlog::level::level_enum parseLevel(const std::string& level);

private:
    static constexpr const auto* CONSOLE_FORMAT = "[%^%l%$] %v";
    static constexpr const auto* FILE_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> file_sink_;

    static inline size_t file_max_bytes_ = 1024 * 1024; // 1 MiB
    static inline size_t file_max_files_ = 3;
};

}
