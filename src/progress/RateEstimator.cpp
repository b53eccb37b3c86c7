#include "progress/RateEstimator.hpp"
#include "config/Config.hpp"

#include <algorithm>
#include <cmath>

using namespace mvx::progress;
using namespace std::chrono;

RateEstimator::RateEstimator(const double smoothing, const Duration minElapsed)
    : alpha_(std::clamp(smoothing, mvx::config::MIN_SMOOTHING, 1.0)), min_elapsed_(minElapsed) {}

void RateEstimator::sample(const Duration elapsed, const uint64_t bytesDone) {
    const auto dt = duration<double>(elapsed - last_elapsed_).count();
    if (dt <= 0.0) return;

    const auto delta = bytesDone >= last_bytes_ ? bytesDone - last_bytes_ : 0;
    const auto instant = static_cast<double>(delta) / dt;

    rate_ = rate_ ? alpha_ * instant + (1.0 - alpha_) * *rate_ : instant;
    last_elapsed_ = elapsed;
    last_bytes_ = bytesDone;
}

void RateEstimator::reset() {
    rate_.reset();
    last_elapsed_ = {};
    last_bytes_ = 0;
}

std::optional<double> RateEstimator::rate() const {
    if (last_elapsed_ < min_elapsed_) return std::nullopt;
    if (!rate_ || *rate_ <= 0.0) return std::nullopt;
    return rate_;
}

std::optional<seconds> RateEstimator::eta(const uint64_t bytesRemaining) const {
    const auto r = rate();
    if (!r) return std::nullopt;
    if (bytesRemaining == 0) return seconds{0};
    return seconds{static_cast<seconds::rep>(std::ceil(static_cast<double>(bytesRemaining) / *r))};
}
