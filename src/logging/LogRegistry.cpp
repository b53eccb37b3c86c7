#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <stdexcept>
#include <vector>

namespace mvx::logging {

namespace {
constexpr std::array SUBSYSTEMS = {"mvx", "transfer", "merge", "progress", "runtime", "cli"};
}

void LogRegistry::init(const std::optional<spdlog::level::level_enum> consoleLevel) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    const auto& cnf = config::ConfigRegistry::get().logging;
    const auto level = consoleLevel.value_or(cnf.level);

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    // optional file sink (rotating), always at least as verbose as the console
    if (!cnf.file.empty()) {
        namespace fs = std::filesystem;
        if (cnf.file.has_parent_path() && !fs::exists(cnf.file.parent_path()))
            fs::create_directories(cnf.file.parent_path());

        file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            cnf.file.string(), file_max_bytes_, file_max_files_);
        file_sink_->set_level(std::min(level, cnf.level));
        file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(file_sink_);
    }

    for (const auto* name : SUBSYSTEMS) {
        const auto it = cnf.subsystem_levels.find(name);
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(it != cnf.subsystem_levels.end() ? it->second : spdlog::level::trace);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
    get("mvx")->trace("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

void LogRegistry::setConsoleLevel(const spdlog::level::level_enum level) {
    if (!initialized_) return;
    console_sink_->set_level(level);
}

void LogRegistry::flush() {
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) { logger->flush(); });
}

void LogRegistry::shutdown() {
    if (!initialized_) return;
    for (const auto* name : SUBSYSTEMS) spdlog::drop(name);
    console_sink_.reset();
    file_sink_.reset();
    initialized_ = false;
}

} // namespace mvx::logging
