#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <spdlog/spdlog.h>

namespace mvx::config {

constexpr static uintmax_t DEFAULT_CHUNK_SIZE_BYTES = 256 * 1024; // 256 KiB
constexpr static uintmax_t MIN_CHUNK_SIZE_BYTES = 4 * 1024;
constexpr static uintmax_t MAX_CHUNK_SIZE_BYTES = 64 * 1024 * 1024;
constexpr static double MIN_SMOOTHING = 0.01;

struct TransferConfig {
    uintmax_t chunk_size = DEFAULT_CHUNK_SIZE_BYTES;
    bool rename = true;          // same-device move via rename(2)
    bool reflink = true;         // same-filesystem copy via FICLONE
    bool fsync = true;           // flush streamed destination before a move deletes the source
    bool preserve_mode = true;   // copy permission bits on streaming copy
};

struct ProgressConfig {
    std::chrono::milliseconds refresh_interval{200};
    double smoothing = 0.3;      // EMA decay constant, (0, 1]
    std::chrono::milliseconds min_elapsed{500};
};

struct LoggingConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    std::filesystem::path file;  // empty = console only
    std::map<std::string, spdlog::level::level_enum> subsystem_levels;
};

struct Config {
    TransferConfig transfer;
    ProgressConfig progress;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromString(const std::string& yaml);

uintmax_t parseByteSize(const std::string& str);

} // namespace mvx::config
