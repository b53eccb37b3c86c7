#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace mvx::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels. `consoleLevel` overrides the
    // configured level (the CLI derives it from -q/-v).
    static void init(std::optional<spdlog::level::level_enum> consoleLevel = std::nullopt);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> mvx()       { return get("mvx"); }
    static std::shared_ptr<spdlog::logger> transfer()  { return get("transfer"); }
    static std::shared_ptr<spdlog::logger> merge()     { return get("merge"); }
    static std::shared_ptr<spdlog::logger> progress()  { return get("progress"); }
    static std::shared_ptr<spdlog::logger> runtime()   { return get("runtime"); }
    static std::shared_ptr<spdlog::logger> cli()       { return get("cli"); }

    [[nodiscard]] static bool isInitialized();

    static void setConsoleLevel(spdlog::level::level_enum level);

    // Flushes every registered logger; safe to call right before _exit().
    static void flush();

    static void shutdown();

private:
    static constexpr const auto* LOG_FORMAT = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> file_sink_;

    static inline size_t file_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t file_max_files_ = 3;
};

} // namespace mvx::logging
