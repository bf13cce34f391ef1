#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace hs::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cnf);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> histsync() { return get("histsync"); }
    static std::shared_ptr<spdlog::logger> sync()     { return get("sync"); }
    static std::shared_ptr<spdlog::logger> scan()     { return get("scan"); }
    static std::shared_ptr<spdlog::logger> state()    { return get("state"); }
    static std::shared_ptr<spdlog::logger> http()     { return get("http"); }
    static std::shared_ptr<spdlog::logger> auth()     { return get("auth"); }
    static std::shared_ptr<spdlog::logger> config()   { return get("config"); }

    [[nodiscard]] static bool isInitialized();

    // Drops every registered logger; init() may be called again afterwards.
    static void shutdown();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
