#include "hashmirror/config/Config.hpp"
#include "hashmirror/config/config_yaml.hpp"
#include "hashmirror/util/errors.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace hm::config {

template <typename T>
static void decodeSection(const YAML::Node& root, const char* key, T& out) {
    const auto node = root[key];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, out))
        throw ConfigError(std::string("Config section '") + key + "' must be a mapping");
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;

    try {
        const YAML::Node root = YAML::LoadFile(path.string());
        if (root.IsNull()) return cfg;
        if (!root.IsMap()) throw ConfigError("Config file " + path.string() + " is not a YAML mapping");

        decodeSection(root, "mirror", cfg.mirror);
        decodeSection(root, "verify", cfg.verify);
        decodeSection(root, "logging", cfg.logging);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse config " + path.string() + ": " + e.what());
    }

    return cfg;
}

static std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

void to_json(nlohmann::json& j, const MirrorConfig& c) {
    j = {
        {"program", c.tool.program},
        {"flavor", std::string(mirror::toString(c.tool.flavor))},
        {"retries", c.tool.retries},
        {"retry_wait_seconds", c.tool.retry_wait_seconds},
        {"inter_packet_gap_ms", c.tool.inter_packet_gap_ms},
        {"success_threshold", c.tool.success_threshold},
        {"log_name", c.log_name},
        {"max_log_size_bytes", c.max_log_size_bytes}
    };
}

void to_json(nlohmann::json& j, const VerifyConfig& c) {
    j = {
        {"algorithm", std::string(crypto::hash::toString(c.algorithm))},
        {"max_log_size_bytes", c.max_log_size_bytes},
        {"log_name", c.log_name},
        {"checkpoint_name", c.checkpoint_name},
        {"parallel_index", c.parallel_index}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"hashmirror", levelName(c.hashmirror)},
        {"mirror", levelName(c.mirror)},
        {"index", levelName(c.index)},
        {"checkpoint", levelName(c.checkpoint)},
        {"verify", levelName(c.verify)}
    };
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_levels", c.levels},
        {"app_log_max_bytes", c.app_log_max_bytes},
        {"app_log_max_files", c.app_log_max_files}
    };
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"mirror", c.mirror},
        {"verify", c.verify},
        {"logging", c.logging}
    };
}

} // namespace hm::config
