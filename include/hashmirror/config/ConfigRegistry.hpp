#pragma once

#include "hashmirror/config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace hm::config {

inline const std::filesystem::path DEFAULT_CONFIG_PATH = "/etc/hashmirror/config.yaml";

// Resolves HASHMIRROR_CONFIG, falling back to DEFAULT_CONFIG_PATH.
std::filesystem::path getConfigPath();

// Loads path. When it does not exist, a required file throws ConfigError and an
// optional one yields the built-in defaults. A malformed file always throws.
Config resolveConfig(const std::filesystem::path& path, bool required);

class ConfigRegistry {
public:
    // HASHMIRROR_CONFIG must name an existing file; DEFAULT_CONFIG_PATH may be absent.
    static void init();
    // Explicitly chosen file (--config); it must exist.
    static void init(const std::filesystem::path& path);
    static void init(Config config);
    static const Config& get();
    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace hm::config
