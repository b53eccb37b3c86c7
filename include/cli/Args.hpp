#pragma once

#include "transfer/Mode.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace mvx::cli {

struct Args {
    transfer::Options options;
    int verbosity = 0;                          // count of -v
    std::optional<std::filesystem::path> config;
    std::vector<std::filesystem::path> sources;
    std::filesystem::path destination;
    bool help = false;
    bool version = false;
};

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// argv without the program name. Throws UsageError.
Args parseArgs(const std::vector<std::string>& argv);

// MODE_DRY_RUN: anything but "", 0, false, no, off, n, f (any case) is true.
bool isTruthy(const std::string& value);
void applyEnvironment(Args& args);

spdlog::level::level_enum consoleLevel(const Args& args);

std::string usage(transfer::Mode mode, const std::string& program);

}
