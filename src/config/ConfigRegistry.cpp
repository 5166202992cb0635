#include "hashmirror/config/ConfigRegistry.hpp"
#include "hashmirror/util/errors.hpp"

#include <cstdlib>
#include <stdexcept>

namespace hm::config {

std::filesystem::path getConfigPath() {
    if (const char* env = std::getenv("HASHMIRROR_CONFIG"); env && *env) return env;
    return DEFAULT_CONFIG_PATH;
}

Config resolveConfig(const std::filesystem::path& path, const bool required) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) return loadConfig(path);
    if (required) throw ConfigError("Config file not found: " + path.string());
    return {};
}

void ConfigRegistry::init() {
    const char* env = std::getenv("HASHMIRROR_CONFIG");
    const bool fromEnv = env && *env;
    std::call_once(init_flag_, [&]() {
        config_ = resolveConfig(fromEnv ? std::filesystem::path(env) : DEFAULT_CONFIG_PATH, fromEnv);
        initialized_ = true;
    });
}

void ConfigRegistry::init(const std::filesystem::path& path) {
    std::call_once(init_flag_, [&]() {
        config_ = resolveConfig(path, true);
        initialized_ = true;
    });
}

void ConfigRegistry::init(Config config) {
    config_ = std::move(config);
    initialized_ = true;
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

bool ConfigRegistry::isInitialized() { return initialized_; }

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace hm::config
