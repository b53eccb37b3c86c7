#include "transfer/Mode.hpp"

std::string mvx::transfer::to_string(const Mode mode) {
    return mode == Mode::Move ? "move" : "copy";
}

std::string mvx::transfer::verb(const Mode mode) { return to_string(mode); }

std::string mvx::transfer::pastTense(const Mode mode) {
    return mode == Mode::Move ? "Moved" : "Copied";
}
