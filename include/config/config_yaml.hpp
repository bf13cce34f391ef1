#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace hs::config;

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

inline spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    return spdlog::level::from_str(node.as<std::string>());
}

template<>
struct convert<HttpConfig> {
    static Node encode(const HttpConfig& rhs) {
        Node node;
        node["timeout_seconds"] = rhs.timeout_seconds;
        node["max_retries"] = rhs.max_retries;
        node["backoff_base_ms"] = rhs.backoff_base_ms;
        return node;
    }

    static bool decode(const Node& node, HttpConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.timeout_seconds = node["timeout_seconds"].as<unsigned int>(30);
        rhs.max_retries = node["max_retries"].as<unsigned int>(3);
        rhs.backoff_base_ms = node["backoff_base_ms"].as<unsigned int>(1000);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["histsync"] = to_std_string(spdlog::level::to_string_view(rhs.histsync));
        node["sync"]     = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["scan"]     = to_std_string(spdlog::level::to_string_view(rhs.scan));
        node["state"]    = to_std_string(spdlog::level::to_string_view(rhs.state));
        node["http"]     = to_std_string(spdlog::level::to_string_view(rhs.http));
        node["auth"]     = to_std_string(spdlog::level::to_string_view(rhs.auth));
        node["config"]   = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.histsync = levelOr(node["histsync"], rhs.histsync);
        rhs.sync = levelOr(node["sync"], rhs.sync);
        rhs.scan = levelOr(node["scan"], rhs.scan);
        rhs.state = levelOr(node["state"], rhs.state);
        rhs.http = levelOr(node["http"], rhs.http);
        rhs.auth = levelOr(node["auth"], rhs.auth);
        rhs.config = levelOr(node["config"], rhs.config);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = levelOr(node["console_log_level"], rhs.console_log_level);
        rhs.file_log_level = levelOr(node["file_log_level"], rhs.file_log_level);
        if (const auto sub = node["subsystem_levels"])
            return convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["log_dir"]) rhs.log_dir = node["log_dir"].as<std::string>();
        if (const auto levels = node["levels"]) return convert<LogLevelsConfig>::decode(levels, rhs.levels);
        return true;
    }
};

}
