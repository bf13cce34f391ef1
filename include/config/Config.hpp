#pragma once

#include "config/Environment.hpp"

#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace hs::config {

inline constexpr auto DEFAULT_API_ENDPOINT = "https://claude-history-mcp.devrel.hny.wtf";
inline constexpr auto CONFIG_DIR_NAME = ".claude-history-sync";

struct HttpConfig {
    unsigned int timeout_seconds = 30;
    unsigned int max_retries = 3;
    unsigned int backoff_base_ms = 1000; // doubles per retry: 1s, 2s, 4s
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum histsync = spdlog::level::info;   // Run start/finish and the summary
    spdlog::level::level_enum sync     = spdlog::level::info;   // Per-session decisions and failures
    spdlog::level::level_enum scan     = spdlog::level::warn;   // Unreadable directories
    spdlog::level::level_enum state    = spdlog::level::warn;
    spdlog::level::level_enum http     = spdlog::level::warn;   // Retries, non-2xx responses
    spdlog::level::level_enum auth     = spdlog::level::warn;
    spdlog::level::level_enum config   = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;
    LogLevelsConfig levels;
};

struct Config {
    std::string api_endpoint = DEFAULT_API_ENDPOINT;
    std::string machine_id;
    std::filesystem::path claude_data_dir;
    std::vector<std::string> exclude_patterns;
    std::filesystem::path state_path;
    std::filesystem::path token_path;

    HttpConfig http;
    LoggingConfig logging;
};

std::filesystem::path defaultConfigPath(const Environment& env);

// Defaults derived from the captured environment; nothing else reads $HOME.
Config defaultConfig(const Environment& env);

// Missing file yields defaultConfig(env); a malformed one throws.
Config loadConfig(const std::filesystem::path& path, const Environment& env);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const HttpConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);

} // namespace hs::config
