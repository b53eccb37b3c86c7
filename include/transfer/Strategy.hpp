#pragma once

#include "config/Config.hpp"
#include "transfer/Mode.hpp"
#include "transfer/FileUnit.hpp"
#include "transfer/Outcome.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace mvx::runtime { class Cancellation; }
namespace mvx::progress { class Tracker; }

namespace mvx::transfer {

// Moves one FileUnit by the cheapest means available: rename(2) for a
// same-device move, FICLONE for a same-device copy, a chunked stream
// otherwise. Fast-path refusals never surface; the stream is the fallback.
class Strategy {
public:
    struct Result {
        Method method{Method::None};
        std::optional<std::string> warning{};   // set when a move could not remove its source
    };

    Strategy(const config::TransferConfig& config, const runtime::Cancellation& cancellation);

    // `overwrite` allows replacing an existing destination; otherwise the
    // destination is created exclusively.
    Result execute(Mode mode, const FileUnit& unit, progress::Tracker& tracker, bool overwrite) const;

    // false = fast path unavailable here, fall through. Other errors throw.
    bool tryRename(const FileUnit& unit) const;
    bool tryReflink(const FileUnit& unit, bool overwrite) const;

    void stream(Mode mode, const FileUnit& unit, progress::Tracker& tracker, bool overwrite) const;

    [[nodiscard]] const config::TransferConfig& config() const { return config_; }

    static bool sameDevice(const std::filesystem::path& source, const std::filesystem::path& destination);
    static bool isUnsupported(int err);

private:
    std::optional<std::string> removeSource(const FileUnit& unit) const;

    config::TransferConfig config_;
    const runtime::Cancellation& cancellation_;
};

}
