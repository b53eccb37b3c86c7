#include "progress/Tracker.hpp"

using namespace mvx::progress;

std::string mvx::progress::to_string(const Event::Kind kind) {
    switch (kind) {
    case Event::Kind::Started: return "started";
    case Event::Kind::Advanced: return "advanced";
    case Event::Kind::Finished: return "finished";
    case Event::Kind::Failed: return "failed";
    case Event::Kind::Planned: return "planned";
    default: return "unknown";
    }
}

Tracker::Tracker(const std::filesystem::path& label, const uint64_t bytesTotal, Sink* sink)
    : state_(bytesTotal), sink_(sink) {
    if (sink_) sink_->onItemStart(label, bytesTotal);
}

Tracker::~Tracker() {
    if (sink_) sink_->onItemEnd();
}

void Tracker::begin(const std::filesystem::path& unit, const uint64_t unitBytes) {
    unit_bytes_ = unitBytes;
    unit_done_ = 0;
    emit(unit, Event::Kind::Started);
}

void Tracker::advance(const std::filesystem::path& unit, const uint64_t n) {
    if (n == 0) return;
    state_.add(n);
    unit_done_ += n;
    emit(unit, Event::Kind::Advanced);
}

void Tracker::finish(const std::filesystem::path& unit) {
    // A file may have grown or shrunk since it was sized.
    if (unit_done_ < unit_bytes_) drop(unit_bytes_ - unit_done_);
    else if (unit_done_ > unit_bytes_) state_.bytes_total.fetch_add(unit_done_ - unit_bytes_, std::memory_order_relaxed);
    unit_bytes_ = unit_done_;
    emit(unit, Event::Kind::Finished);
}

void Tracker::fail(const std::filesystem::path& unit) {
    if (unit_done_ < unit_bytes_) drop(unit_bytes_ - unit_done_);
    unit_bytes_ = unit_done_;
    emit(unit, Event::Kind::Failed);
}

void Tracker::plan(const std::filesystem::path& unit, const uint64_t unitBytes) {
    // planned bytes count as accounted for, so a dry run still completes the bar
    unit_bytes_ = unitBytes;
    unit_done_ = unitBytes;
    state_.add(unitBytes);
    emit(unit, Event::Kind::Planned);
}

void Tracker::drop(const uint64_t bytes) {
    const auto total = state_.bytes_total.load(std::memory_order_relaxed);
    state_.bytes_total.store(total > bytes ? total - bytes : 0, std::memory_order_relaxed);
}

void Tracker::emit(const std::filesystem::path& unit, const Event::Kind kind) const {
    if (!sink_) return;
    sink_->onEvent(Event{
        .path = unit,
        .bytes_total = state_.total(),
        .bytes_done = state_.done(),
        .kind = kind,
        .timestamp = std::chrono::system_clock::now(),
    });
}
