#pragma once

#include "cli/Args.hpp"
#include "transfer/Mode.hpp"
#include "transfer/Outcome.hpp"

#include <string>
#include <vector>

namespace mvx::cli {

// Shared driver of the mvx and cpx binaries; they differ only in the mode.
class App {
public:
    static constexpr int EXIT_USAGE = 2;

    explicit App(transfer::Mode mode);

    int run(int argc, char** argv);
    int run(const std::string& program, const std::vector<std::string>& argv);

    // One line per source: "Moved in 1.24s: 'a' => 'b'", failures and interruptions.
    static std::vector<std::string> summarize(const transfer::BatchReport& report, transfer::Mode mode, bool dryRun);

private:
    int execute(const Args& args);

    transfer::Mode mode_;
};

}
