#pragma once

#include "hashmirror/crypto/hash.hpp"
#include "hashmirror/mirror/Invoker.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace hm::config {

constexpr static std::uintmax_t DEFAULT_MAX_LOG_SIZE_BYTES = 50 * 1024 * 1024; // 50MB

struct MirrorConfig {
    mirror::Settings tool;          // program, flavor, retries, success threshold
    std::string log_name = "mirror_log.txt";
    std::uintmax_t max_log_size_bytes = DEFAULT_MAX_LOG_SIZE_BYTES;
};

struct VerifyConfig {
    crypto::hash::Algorithm algorithm = crypto::hash::Algorithm::SHA256;
    std::uintmax_t max_log_size_bytes = DEFAULT_MAX_LOG_SIZE_BYTES;
    std::string log_name = "hash_verification_log.txt";
    std::string checkpoint_name = "hash_checkpoint.txt";
    bool parallel_index = false;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum hashmirror = spdlog::level::info;   // Startup, phase transitions, exit status
    spdlog::level::level_enum mirror     = spdlog::level::info;   // Copy tool invocation and its classified result
    spdlog::level::level_enum index      = spdlog::level::warn;   // Per-file hashing failures only
    spdlog::level::level_enum checkpoint = spdlog::level::warn;   // Append failures
    spdlog::level::level_enum verify     = spdlog::level::info;   // Outcome summary, rotation notices
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
    std::size_t app_log_max_bytes = 10 * 1024 * 1024; // 10MB
    std::size_t app_log_max_files = 5;
};

struct Config {
    MirrorConfig mirror;
    VerifyConfig verify;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const MirrorConfig& c);
void to_json(nlohmann::json& j, const VerifyConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);

} // namespace hm::config
