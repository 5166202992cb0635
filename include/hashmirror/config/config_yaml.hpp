#pragma once

#include "hashmirror/config/Config.hpp"
#include "hashmirror/util/errors.hpp"

#include <cstdint>
#include <string>
#include <yaml-cpp/yaml.h>

namespace hm::config {

// Unlike as<T>(fallback), a present key of the wrong type throws.
template <typename T>
T getOrDefault(const YAML::Node& node, const std::string& key, const T& def) {
    return node[key] ? node[key].as<T>() : def;
}

// Size keys are whole megabytes; 0 would rotate on every write.
inline std::uintmax_t megabytesOrDefault(const YAML::Node& node, const std::string& section,
                                         const std::string& key, const std::uintmax_t defMb) {
    const auto mb = getOrDefault<std::uintmax_t>(node, key, defMb);
    if (mb == 0) throw hm::ConfigError(section + "." + key + " must be at least 1");
    return mb * 1024 * 1024;
}

}

namespace YAML {

using namespace hm::config;

template<>
struct convert<MirrorConfig> {
    static bool decode(const Node& node, MirrorConfig& rhs) {
        if (!node.IsMap()) return false;
        const auto flavorName = getOrDefault<std::string>(node, "flavor", "robocopy");
        const auto flavor = hm::mirror::parseFlavor(flavorName);
        if (!flavor) throw hm::ConfigError("mirror.flavor: unknown copy tool flavor '" + flavorName + "'");

        rhs.tool.flavor = *flavor;
        rhs.tool.program = getOrDefault<std::string>(node, "program", std::string(hm::mirror::toString(*flavor)));
        rhs.tool.retries = getOrDefault<unsigned int>(node, "retries", 5);
        rhs.tool.retry_wait_seconds = getOrDefault<unsigned int>(node, "retry_wait_seconds", 5);
        rhs.tool.inter_packet_gap_ms = getOrDefault<unsigned int>(node, "inter_packet_gap_ms", 0);
        rhs.tool.success_threshold = getOrDefault<int>(node, "success_threshold", 3);
        rhs.log_name = getOrDefault<std::string>(node, "log_name", "mirror_log.txt");
        rhs.max_log_size_bytes = megabytesOrDefault(node, "mirror", "max_log_size_mb", 50);
        return true;
    }
};

template<>
struct convert<VerifyConfig> {
    static bool decode(const Node& node, VerifyConfig& rhs) {
        if (!node.IsMap()) return false;
        const auto algoName = getOrDefault<std::string>(node, "algorithm", "sha256");
        const auto algo = hm::crypto::hash::parseAlgorithm(algoName);
        if (!algo) throw hm::ConfigError("verify.algorithm: unsupported hash algorithm '" + algoName + "'");

        rhs.algorithm = *algo;
        rhs.max_log_size_bytes = megabytesOrDefault(node, "verify", "max_log_size_mb", 50);
        rhs.log_name = getOrDefault<std::string>(node, "log_name", "hash_verification_log.txt");
        rhs.checkpoint_name = getOrDefault<std::string>(node, "checkpoint_name", "hash_checkpoint.txt");
        rhs.parallel_index = getOrDefault<bool>(node, "parallel_index", false);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.hashmirror = spdlog::level::from_str(getOrDefault<std::string>(node, "hashmirror", "info"));
        rhs.mirror = spdlog::level::from_str(getOrDefault<std::string>(node, "mirror", "info"));
        rhs.index = spdlog::level::from_str(getOrDefault<std::string>(node, "index", "warn"));
        rhs.checkpoint = spdlog::level::from_str(getOrDefault<std::string>(node, "checkpoint", "warn"));
        rhs.verify = spdlog::level::from_str(getOrDefault<std::string>(node, "verify", "info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(getOrDefault<std::string>(node, "console_log_level", "info"));
        rhs.file_log_level = spdlog::level::from_str(getOrDefault<std::string>(node, "file_log_level", "debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.app_log_max_bytes = megabytesOrDefault(node, "logging", "app_log_max_size_mb", 10);
        rhs.app_log_max_files = getOrDefault<std::size_t>(node, "app_log_max_files", 5);
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
