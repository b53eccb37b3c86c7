#pragma once

#include <atomic>
#include <string>

namespace mvx::runtime {

// Running -> Requested -> Forced. Transitions only move forward.
class Cancellation {
public:
    enum class State : int { Running = 0, Requested = 1, Forced = 2 };

    Cancellation() = default;
    Cancellation(const Cancellation&) = delete;
    Cancellation& operator=(const Cancellation&) = delete;

    // One interrupt signal: the first requests, any later one forces.
    State onSignal();

    void request();
    void force();

    [[nodiscard]] State state() const { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] bool isRunning() const { return state() == State::Running; }
    [[nodiscard]] bool isRequested() const { return state() != State::Running; }
    [[nodiscard]] bool isForced() const { return state() == State::Forced; }

private:
    void advanceTo(State target);

    std::atomic<State> state_{State::Running};
};

std::string to_string(Cancellation::State state);

}
