#pragma once

#include "transfer/DestinationPlan.hpp"
#include "transfer/Mode.hpp"
#include "transfer/Outcome.hpp"

namespace mvx::runtime { class Cancellation; }
namespace mvx::progress { class Sink; class Tracker; }

namespace mvx::transfer {

class Strategy;

// One source file to one destination: plan, conflict policy, dry run, then
// the strategy. Never throws; every unit ends in an Outcome.
class FileTransfer {
public:
    FileTransfer(const Strategy& strategy, const runtime::Cancellation& cancellation);

    // Resolves the destination and owns the progress state for this file.
    Outcome run(const Request& request, progress::Sink* sink = nullptr) const;

    // Shared with DirectoryMerger, which owns the tracker for the whole tree.
    Outcome transferUnit(const FileUnit& unit, const DestinationPlan& plan, Mode mode, const Options& options,
                         progress::Tracker& tracker) const;

private:
    const Strategy& strategy_;
    const runtime::Cancellation& cancellation_;
};

}
