#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace hs::config {

namespace {

std::filesystem::path expandHome(const std::string& raw, const Environment& env) {
    if (raw == "~") return env.home;
    if (raw.starts_with("~/")) return env.home / raw.substr(2);
    return raw;
}

}

std::filesystem::path defaultConfigPath(const Environment& env) {
    return env.home / CONFIG_DIR_NAME / "config.yaml";
}

Config defaultConfig(const Environment& env) {
    const auto base = env.home / CONFIG_DIR_NAME;

    Config cfg;
    cfg.machine_id = env.hostname;
    cfg.claude_data_dir = env.home / ".claude" / "projects";
    cfg.state_path = base / "state.json";
    cfg.token_path = base / "tokens.json";
    cfg.logging.log_dir = base / "logs";
    return cfg;
}

Config loadConfig(const std::filesystem::path& path, const Environment& env) {
    Config cfg = defaultConfig(env);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return cfg;

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse config file " + path.string() + ": " + e.what());
    }

    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config file " + path.string() + " is not a YAML mapping");

    try {
        if (auto n = root["api_endpoint"]) cfg.api_endpoint = n.as<std::string>();
        if (auto n = root["machine_id"]) cfg.machine_id = n.as<std::string>();
        if (auto n = root["claude_data_dir"]) cfg.claude_data_dir = expandHome(n.as<std::string>(), env);
        if (auto n = root["exclude_patterns"]) cfg.exclude_patterns = n.as<std::vector<std::string>>();
        if (auto n = root["state_path"]) cfg.state_path = expandHome(n.as<std::string>(), env);
        if (auto n = root["token_path"]) cfg.token_path = expandHome(n.as<std::string>(), env);
        if (auto n = root["http"]; n && !YAML::convert<HttpConfig>::decode(n, cfg.http))
            throw std::runtime_error("Invalid value in config file " + path.string() + ": http must be a mapping");
        if (auto n = root["logging"]) {
            if (!YAML::convert<LoggingConfig>::decode(n, cfg.logging))
                throw std::runtime_error("Invalid value in config file " + path.string()
                                         + ": logging and its levels must be mappings");
            cfg.logging.log_dir = expandHome(cfg.logging.log_dir.string(), env);
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid value in config file " + path.string() + ": " + e.what());
    }

    while (!cfg.api_endpoint.empty() && cfg.api_endpoint.back() == '/') cfg.api_endpoint.pop_back();
    if (cfg.api_endpoint.empty()) throw std::runtime_error("Config: api_endpoint must not be empty");
    if (cfg.machine_id.empty()) cfg.machine_id = env.hostname;

    return cfg;
}

void to_json(nlohmann::json& j, const HttpConfig& c) {
    j = {
        {"timeout_seconds", c.timeout_seconds},
        {"max_retries", c.max_retries},
        {"backoff_base_ms", c.backoff_base_ms}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    const auto level = [](const spdlog::level::level_enum l) {
        const auto sv = spdlog::level::to_string_view(l);
        return std::string(sv.data(), sv.size());
    };

    j = {
        {"log_dir", c.log_dir.string()},
        {"console_log_level", level(c.levels.console_log_level)},
        {"file_log_level", level(c.levels.file_log_level)}
    };
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"api_endpoint", c.api_endpoint},
        {"machine_id", c.machine_id},
        {"claude_data_dir", c.claude_data_dir.string()},
        {"exclude_patterns", c.exclude_patterns},
        {"state_path", c.state_path.string()},
        {"token_path", c.token_path.string()},
        {"http", c.http},
        {"logging", c.logging}
    };
}

} // namespace hs::config
