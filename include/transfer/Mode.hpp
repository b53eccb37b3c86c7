#pragma once

#include <filesystem>
#include <string>

namespace mvx::transfer {

// Selected once per invocation and carried by value; decides whether a
// successful transfer removes the source.
enum class Mode { Move, Copy };

struct Options {
    bool force = false;     // allow overwriting existing destination files
    bool dry_run = false;   // plan only, no mutation
    bool quiet = false;     // no progress/informational output
    bool verbose = false;   // per-file detail
};

struct Request {
    std::filesystem::path source;
    std::filesystem::path destination;
    Mode mode{Mode::Move};
    Options options;
};

std::string to_string(Mode mode);

// "Moved"/"Copied", "move"/"copy"
std::string pastTense(Mode mode);
std::string verb(Mode mode);

}
