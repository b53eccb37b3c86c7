#pragma once

#include <cstdint>
#include <filesystem>

namespace mvx::transfer {

// One concrete file transfer: absolute source, absolute destination, size.
struct FileUnit {
    std::filesystem::path source;
    std::filesystem::path destination;
    uint64_t size{};

    // Path relative to the merge root; empty for a single-file request.
    std::filesystem::path relative{};

    [[nodiscard]] const std::filesystem::path& label() const { return relative.empty() ? source : relative; }
};

}
