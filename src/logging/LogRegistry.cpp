#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <stdexcept>

namespace hs::logging {

void LogRegistry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    util::createPrivateDirectories(cnf.log_dir);

    main_log_path_ = cnf.log_dir / "histsync.log";

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern("%^%v%$");

    // main file sink (rotating)
    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cnf.levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, main_file_sink_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("histsync", sub_levels.histsync);
    makeLogger("sync",     sub_levels.sync);
    makeLogger("scan",     sub_levels.scan);
    makeLogger("state",    sub_levels.state);
    makeLogger("http",     sub_levels.http);
    makeLogger("auth",     sub_levels.auth);
    makeLogger("config",   sub_levels.config);

    initialized_ = true;
    get("histsync")->debug("[LogRegistry] Initialized, writing to {}", main_log_path_.string());
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

void LogRegistry::shutdown() {
    if (!initialized_) return;
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) { lg->flush(); });
    spdlog::drop_all();
    console_sink_.reset();
    main_file_sink_.reset();
    initialized_ = false;
}

}
