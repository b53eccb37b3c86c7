#include "runtime/Cancellation.hpp"

using namespace mvx::runtime;

Cancellation::State Cancellation::onSignal() {
    const auto current = state_.load(std::memory_order_acquire);
    const auto target = current == State::Running ? State::Requested : State::Forced;
    advanceTo(target);
    return state();
}

void Cancellation::request() { advanceTo(State::Requested); }

void Cancellation::force() { advanceTo(State::Forced); }

void Cancellation::advanceTo(const State target) {
    auto current = state_.load(std::memory_order_acquire);
    while (static_cast<int>(current) < static_cast<int>(target)) {
        if (state_.compare_exchange_weak(current, target, std::memory_order_acq_rel)) return;
    }
}

std::string mvx::runtime::to_string(const Cancellation::State state) {
    switch (state) {
    case Cancellation::State::Running: return "running";
    case Cancellation::State::Requested: return "requested";
    case Cancellation::State::Forced: return "forced";
    default: return "unknown";
    }
}
