#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <fmt/format.h>

namespace mvx::util {

inline std::string bytesToString(const uint64_t bytes) {
    const auto b = static_cast<double>(bytes);
    if (b >= 1024.0 * 1024.0 * 1024.0) return fmt::format("{:.1f} GiB", b / (1024.0 * 1024.0 * 1024.0));
    if (b >= 1024.0 * 1024.0) return fmt::format("{:.1f} MiB", b / (1024.0 * 1024.0));
    if (b >= 1024.0) return fmt::format("{:.1f} KiB", b / 1024.0);
    return fmt::format("{} B", bytes);
}

inline std::string rateToString(const std::optional<double>& bps) {
    if (!bps) return "--- B/s";
    const auto r = *bps;
    if (r >= 1024.0 * 1024.0 * 1024.0) return fmt::format("{:.1f} GiB/s", r / (1024.0 * 1024.0 * 1024.0));
    if (r >= 1024.0 * 1024.0) return fmt::format("{:.1f} MiB/s", r / (1024.0 * 1024.0));
    if (r >= 1024.0) return fmt::format("{:.1f} KiB/s", r / 1024.0);
    return fmt::format("{:.0f} B/s", r);
}

// "m:ss", or "h:mm:ss" past an hour; "--:--" when unknown.
inline std::string etaToString(const std::optional<std::chrono::seconds>& eta) {
    if (!eta) return "--:--";
    const auto total = eta->count();
    const auto hours = total / 3600, minutes = (total % 3600) / 60, seconds = total % 60;
    if (hours > 0) return fmt::format("{}:{:02}:{:02}", hours, minutes, seconds);
    return fmt::format("{}:{:02}", minutes, seconds);
}

inline std::string durationToString(const std::chrono::steady_clock::duration d) {
    using namespace std::chrono;
    const auto secs = duration<double>(d).count();
    if (secs < 60.0) return fmt::format("{:.2f}s", secs);

    const auto whole = static_cast<long long>(secs);
    const auto hours = whole / 3600, minutes = (whole % 3600) / 60;
    const auto rest = secs - static_cast<double>(hours * 3600 + minutes * 60);
    if (hours > 0) return fmt::format("{}h {}m {:.0f}s", hours, minutes, rest);
    return fmt::format("{}m {:.0f}s", minutes, rest);
}

}
