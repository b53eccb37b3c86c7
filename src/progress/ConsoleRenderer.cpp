#include "progress/ConsoleRenderer.hpp"
#include "util/humanize.hpp"

#include <algorithm>
#include <unistd.h>

using namespace mvx::progress;
using namespace mvx::util;
using namespace std::chrono;

namespace {
constexpr int BAR_WIDTH = 30;
constexpr size_t MAX_LABEL_WIDTH = 40;
}

ConsoleRenderer::ConsoleRenderer(const config::ProgressConfig& config, std::FILE* out)
    : out_(out),
      interactive_(out && isatty(fileno(out)) == 1),
      refresh_interval_(config.refresh_interval),
      estimator_(config.smoothing, config.min_elapsed) {}

void ConsoleRenderer::onItemStart(const std::filesystem::path& label, uint64_t) {
    estimator_.reset();
    started_at_ = steady_clock::now();
    last_draw_ = {};
    label_ = label.filename().string();
}

void ConsoleRenderer::onItemEnd() { clear(); }

void ConsoleRenderer::onEvent(const Event& event) {
    const auto now = steady_clock::now();
    estimator_.sample(now - started_at_, event.bytes_done);

    if (!interactive_) return;

    const bool due = now - last_draw_ >= refresh_interval_;
    const bool boundary = event.kind != Event::Kind::Advanced;
    if (!due && !boundary) return;

    last_draw_ = now;
    const auto unit = event.path.filename().string();
    fmt::print(out_, "\r{}\033[K", renderLine(event, estimator_, unit.empty() ? label_ : unit));
    std::fflush(out_);
    drawn_ = true;
}

void ConsoleRenderer::clear() {
    if (!interactive_ || !drawn_) return;
    fmt::print(out_, "\r\033[K");
    std::fflush(out_);
    drawn_ = false;
}

std::string ConsoleRenderer::renderLine(const Event& event, const RateEstimator& estimator, const std::string& label) {
    const auto total = event.bytes_total;
    const auto done = std::min(event.bytes_done, total);
    const double pct = total > 0 ? static_cast<double>(done) / static_cast<double>(total) * 100.0 : 100.0;

    const int filled = std::clamp(static_cast<int>(pct / 100.0 * BAR_WIDTH), 0, BAR_WIDTH);
    std::string bar(static_cast<size_t>(filled), '=');
    if (filled < BAR_WIDTH) {
        bar += '>';
        bar.append(static_cast<size_t>(BAR_WIDTH - filled - 1), '-');
    }

    auto name = label;
    if (name.size() > MAX_LABEL_WIDTH) name = "..." + name.substr(name.size() - (MAX_LABEL_WIDTH - 3));

    return fmt::format("[{}] {}/{} {:3.0f}% [{}] (ETA: {}) {}",
                       bar, bytesToString(done), bytesToString(total), pct,
                       rateToString(estimator.rate()), etaToString(estimator.eta(total - done)), name);
}
