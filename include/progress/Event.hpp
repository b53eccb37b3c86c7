#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace mvx::progress {

struct Event {
    enum class Kind { Started, Advanced, Finished, Failed, Planned };

    std::filesystem::path path;
    uint64_t bytes_total{};
    uint64_t bytes_done{};
    Kind kind{Kind::Advanced};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

std::string to_string(Event::Kind kind);

// Rendering/logging collaborator. Absence of a sink means quiet.
class Sink {
public:
    virtual ~Sink() = default;

    // Brackets one batch item (a single file or a whole merge).
    virtual void onItemStart(const std::filesystem::path& /*label*/, uint64_t /*bytesTotal*/) {}
    virtual void onItemEnd() {}

    virtual void onEvent(const Event& event) = 0;
};

}
