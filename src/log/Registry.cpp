#include "hashmirror/log/Registry.hpp"
#include "hashmirror/config/ConfigRegistry.hpp"

#include <stdexcept>

namespace hm::log {

void Registry::init(const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[Registry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = logDir;
    app_log_path_ = log_dir_ / "hashmirror.log";

    namespace fs = std::filesystem;
    if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

    const auto cnf = config::ConfigRegistry::isInitialized()
        ? config::ConfigRegistry::get().logging
        : config::LoggingConfig{};

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    // application file sink (rotating); the hash log is a separate artifact
    app_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        app_log_path_.string(), cnf.app_log_max_bytes, cnf.app_log_max_files);
    app_file_sink_->set_level(cnf.levels.file_log_level);
    app_file_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name,
                          const spdlog::level::level_enum lvl = spdlog::level::debug) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, app_file_sink_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("hashmirror", sub_levels.hashmirror);
    makeLogger("mirror",     sub_levels.mirror);
    makeLogger("index",      sub_levels.index);
    makeLogger("checkpoint", sub_levels.checkpoint);
    makeLogger("verify",     sub_levels.verify);

    initialized_ = true;
    hashmirror()->debug("[Registry] Initialized, application log at {}", app_log_path_.string());
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

}
