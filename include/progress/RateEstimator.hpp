#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace mvx::progress {

// Reader-side throughput estimate: exponentially smoothed bytes/second.
// A sample without new bytes decays the rate instead of zeroing it.
class RateEstimator {
public:
    using Duration = std::chrono::steady_clock::duration;

    RateEstimator(double smoothing, Duration minElapsed);

    void sample(Duration elapsed, uint64_t bytesDone);
    void reset();

    // Unknown until `minElapsed` has passed and some throughput was seen.
    [[nodiscard]] std::optional<double> rate() const;
    [[nodiscard]] std::optional<std::chrono::seconds> eta(uint64_t bytesRemaining) const;

    [[nodiscard]] double smoothing() const { return alpha_; }

private:
    double alpha_;
    Duration min_elapsed_;

    std::optional<double> rate_;
    Duration last_elapsed_{};
    uint64_t last_bytes_{0};
};

}
