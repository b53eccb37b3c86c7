#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>
#include <optional>

namespace mvx::config {

class ConfigRegistry {
public:
    // Loads the file at `path`, or the first default location that exists.
    // An explicitly named file that does not exist is an error.
    static void init(const std::optional<std::filesystem::path>& path = std::nullopt);
    static void initDefaults();
    static void set(Config config);
    static const Config& get();

    [[nodiscard]] static bool isInitialized();
    [[nodiscard]] static std::optional<std::filesystem::path> defaultConfigPath();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::mutex mutex_;
};

} // namespace mvx::config
