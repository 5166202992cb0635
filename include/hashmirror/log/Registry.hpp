#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace hm::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels. Levels come from ConfigRegistry
    // when it is initialized, otherwise from the built-in defaults.
    static void init(const std::filesystem::path& logDir);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> hashmirror()  { return get("hashmirror"); }
    static std::shared_ptr<spdlog::logger> mirror()      { return get("mirror"); }
    static std::shared_ptr<spdlog::logger> index()       { return get("index"); }
    static std::shared_ptr<spdlog::logger> checkpoint()  { return get("checkpoint"); }
    static std::shared_ptr<spdlog::logger> verify()      { return get("verify"); }

    [[nodiscard]] static bool isInitialized();
    [[nodiscard]] static const std::filesystem::path& appLogPath() { return app_log_path_; }

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path app_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> app_file_sink_;
};

}
