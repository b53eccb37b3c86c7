#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace mvx::progress {

// Single writer (the transfer worker), any number of readers.
struct State {
    std::atomic<uint64_t> bytes_done{0};
    std::atomic<uint64_t> bytes_total{0};
    const std::chrono::steady_clock::time_point started_at{std::chrono::steady_clock::now()};

    State() = default;
    explicit State(const uint64_t total) : bytes_total(total) {}

    State(const State&) = delete;
    State& operator=(const State&) = delete;

    void add(const uint64_t n) { bytes_done.fetch_add(n, std::memory_order_relaxed); }

    [[nodiscard]] uint64_t done() const { return bytes_done.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t total() const { return bytes_total.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t remaining() const {
        const auto d = done(), t = total();
        return t > d ? t - d : 0;
    }

    [[nodiscard]] std::chrono::steady_clock::duration elapsed() const {
        return std::chrono::steady_clock::now() - started_at;
    }
};

}
