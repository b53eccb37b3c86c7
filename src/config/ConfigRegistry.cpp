#include "config/ConfigRegistry.hpp"

#include <cstdlib>
#include <stdexcept>

namespace mvx::config {

namespace fs = std::filesystem;

std::optional<fs::path> ConfigRegistry::defaultConfigPath() {
    if (const char* env = std::getenv("MVX_CONFIG"); env && *env) return fs::path(env);
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) return fs::path(xdg) / "mvx" / "config.yaml";
    if (const char* home = std::getenv("HOME"); home && *home) return fs::path(home) / ".config" / "mvx" / "config.yaml";
    return std::nullopt;
}

void ConfigRegistry::init(const std::optional<fs::path>& path) {
    if (path) {
        if (!fs::exists(*path)) throw std::runtime_error("Config file '" + path->string() + "' does not exist");
        set(loadConfig(*path));
        return;
    }

    const auto fallback = defaultConfigPath();
    if (fallback && fs::exists(*fallback)) set(loadConfig(*fallback));
    else initDefaults();
}

void ConfigRegistry::initDefaults() { set(Config{}); }

void ConfigRegistry::set(Config config) {
    std::lock_guard lock(mutex_);
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

} // namespace mvx::config
