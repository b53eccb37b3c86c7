#include "runtime/SignalWatcher.hpp"
#include "runtime/Cancellation.hpp"
#include "logging/LogRegistry.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <optional>
#include <pthread.h>
#include <stdexcept>
#include <string>
#include <unistd.h>

using namespace mvx::runtime;
using namespace mvx::logging;

namespace {
constexpr long POLL_INTERVAL_NS = 100L * 1000 * 1000; // 100ms
}

SignalWatcher::SignalWatcher(Cancellation& cancellation, std::vector<int> signals,
                             const std::chrono::milliseconds forcedGrace)
    : cancellation_(cancellation), signals_(std::move(signals)), forced_grace_(forcedGrace) {
    sigemptyset(&set_);
    for (const auto sig : signals_) sigaddset(&set_, sig);
}

SignalWatcher::~SignalWatcher() { stop(); }

void SignalWatcher::start() {
    if (running_.exchange(true)) return;

    if (const int rc = pthread_sigmask(SIG_BLOCK, &set_, nullptr); rc != 0) {
        running_ = false;
        throw std::runtime_error(std::string("[SignalWatcher] pthread_sigmask failed: ") + std::strerror(rc));
    }

    worker_ = std::thread(&SignalWatcher::runLoop, this);
    LogRegistry::runtime()->debug("[SignalWatcher] Watching {} signal(s)", signals_.size());
}

void SignalWatcher::stop() {
    if (!running_.exchange(false)) return;
    if (worker_.joinable()) worker_.join();
}

void SignalWatcher::runLoop() {
    const timespec timeout{0, POLL_INTERVAL_NS};
    std::optional<std::chrono::steady_clock::time_point> forcedAt;

    while (running_.load()) {
        if (cancellation_.isForced()) {
            const auto now = std::chrono::steady_clock::now();
            if (!forcedAt) forcedAt = now;
            else if (now - *forcedAt >= forced_grace_) abortProcess();
        }

        siginfo_t info{};
        const int sig = sigtimedwait(&set_, &info, &timeout);
        if (sig < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            LogRegistry::runtime()->error("[SignalWatcher] sigtimedwait failed: {}", std::strerror(errno));
            break;
        }

        const auto state = cancellation_.onSignal();
        if (state == Cancellation::State::Requested)
            LogRegistry::runtime()->warn("[!] Signal {} received. Finishing the current file, then stopping "
                                         "(interrupt again to abort immediately)", sig);
        else
            LogRegistry::runtime()->warn("[!] Signal {} received again. Aborting in-flight transfer", sig);
    }
}

void SignalWatcher::abortProcess() const {
    LogRegistry::runtime()->error("[SignalWatcher] ✗ Transfer did not stop within {}ms of the abort, exiting",
                                  forced_grace_.count());
    LogRegistry::flush();
    ::_exit(FORCED_EXIT_CODE);
}
