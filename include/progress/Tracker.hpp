#pragma once

#include "progress/Event.hpp"
#include "progress/State.hpp"

#include <filesystem>

namespace mvx::progress {

// Owns the ProgressState of one batch item and forwards events to the
// optional sink. Only the transfer worker writes through it.
class Tracker {
public:
    Tracker(const std::filesystem::path& label, uint64_t bytesTotal, Sink* sink = nullptr);
    ~Tracker();

    Tracker(const Tracker&) = delete;
    Tracker& operator=(const Tracker&) = delete;

    void begin(const std::filesystem::path& unit, uint64_t unitBytes);
    void advance(const std::filesystem::path& unit, uint64_t n);
    void finish(const std::filesystem::path& unit);
    void fail(const std::filesystem::path& unit);
    void plan(const std::filesystem::path& unit, uint64_t unitBytes);

    // Removes bytes that will never be transferred (conflicts, failures) from the total.
    void drop(uint64_t bytes);

    [[nodiscard]] const State& state() const { return state_; }
    [[nodiscard]] uint64_t unitDone() const { return unit_done_; }
    [[nodiscard]] bool hasSink() const { return sink_ != nullptr; }

private:
    void emit(const std::filesystem::path& unit, Event::Kind kind) const;

    State state_;
    Sink* sink_;
    uint64_t unit_bytes_{0};
    uint64_t unit_done_{0};
};

}
