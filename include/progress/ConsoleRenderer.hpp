#pragma once

#include "progress/Event.hpp"
#include "progress/RateEstimator.hpp"
#include "config/Config.hpp"

#include <chrono>
#include <cstdio>
#include <string>

namespace mvx::progress {

// Single-line progress bar on a terminal. Draws nothing when the stream is
// not a tty; events are still consumed.
class ConsoleRenderer : public Sink {
public:
    explicit ConsoleRenderer(const config::ProgressConfig& config, std::FILE* out = stderr);

    void onItemStart(const std::filesystem::path& label, uint64_t bytesTotal) override;
    void onItemEnd() override;
    void onEvent(const Event& event) override;

    [[nodiscard]] bool isInteractive() const { return interactive_; }

    static std::string renderLine(const Event& event, const RateEstimator& estimator, const std::string& label);

private:
    void clear();

    std::FILE* out_;
    bool interactive_;
    std::chrono::milliseconds refresh_interval_;
    RateEstimator estimator_;
    std::chrono::steady_clock::time_point started_at_{};
    std::chrono::steady_clock::time_point last_draw_{};
    std::string label_;
    bool drawn_{false};
};

}
