#pragma once

#include "config/Config.hpp"

#include <algorithm>
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace mvx::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<TransferConfig> {
    static Node encode(const TransferConfig& rhs) {
        Node node;
        node["chunk_size"] = rhs.chunk_size;
        node["rename"] = rhs.rename;
        node["reflink"] = rhs.reflink;
        node["fsync"] = rhs.fsync;
        node["preserve_mode"] = rhs.preserve_mode;
        return node;
    }

    static bool decode(const Node& node, TransferConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["chunk_size"]) {
            const auto bytes = parseByteSize(node["chunk_size"].as<std::string>());
            rhs.chunk_size = std::clamp(bytes, MIN_CHUNK_SIZE_BYTES, MAX_CHUNK_SIZE_BYTES);
        }
        rhs.rename = node["rename"].as<bool>(true);
        rhs.reflink = node["reflink"].as<bool>(true);
        rhs.fsync = node["fsync"].as<bool>(true);
        rhs.preserve_mode = node["preserve_mode"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<ProgressConfig> {
    static Node encode(const ProgressConfig& rhs) {
        Node node;
        node["refresh_interval_ms"] = rhs.refresh_interval.count();
        node["smoothing"] = rhs.smoothing;
        node["min_elapsed_ms"] = rhs.min_elapsed.count();
        return node;
    }

    static bool decode(const Node& node, ProgressConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.refresh_interval = std::chrono::milliseconds(node["refresh_interval_ms"].as<long>(200));
        rhs.min_elapsed = std::chrono::milliseconds(node["min_elapsed_ms"].as<long>(500));

        // Clamped into (0, 1]; the floor keeps the average moving.
        rhs.smoothing = std::clamp(node["smoothing"].as<double>(0.3), MIN_SMOOTHING, 1.0);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["level"] = to_std_string(spdlog::level::to_string_view(rhs.level));
        node["file"] = rhs.file.string();
        for (const auto& [name, lvl] : rhs.subsystem_levels)
            node["subsystems"][name] = to_std_string(spdlog::level::to_string_view(lvl));
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.level = spdlog::level::from_str(node["level"].as<std::string>("info"));
        rhs.file = node["file"].as<std::string>("");

        rhs.subsystem_levels.clear();
        if (const auto subs = node["subsystems"]) {
            if (!subs.IsMap()) return false;
            for (const auto& kv : subs)
                rhs.subsystem_levels[kv.first.as<std::string>()] = spdlog::level::from_str(kv.second.as<std::string>());
        }
        return true;
    }
};

} // namespace YAML
