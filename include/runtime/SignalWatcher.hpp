#pragma once

#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>
#include <vector>

namespace mvx::runtime {

class Cancellation;

// Observes interrupt signals on a dedicated thread (sigtimedwait) and feeds
// them into a Cancellation. The signals must be blocked in every other
// thread, so start() has to run before the process spawns any.
//
// Once the cancellation is Forced the worker gets `forcedGrace` to unwind.
// If the watcher is still running after that (the worker is stuck in a
// blocking syscall), logs are flushed and the process exits with
// FORCED_EXIT_CODE.
class SignalWatcher {
public:
    static constexpr int FORCED_EXIT_CODE = 130;
    static constexpr std::chrono::milliseconds DEFAULT_FORCED_GRACE{2000};

    explicit SignalWatcher(Cancellation& cancellation, std::vector<int> signals = {SIGINT, SIGTERM},
                           std::chrono::milliseconds forcedGrace = DEFAULT_FORCED_GRACE);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    void start();
    void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

private:
    void runLoop();
    [[noreturn]] void abortProcess() const;

    Cancellation& cancellation_;
    std::vector<int> signals_;
    std::chrono::milliseconds forced_grace_;
    sigset_t set_{};
    std::atomic<bool> running_{false};
    std::thread worker_;
};

}
