#pragma once

#include "config/Config.hpp"
#include "transfer/DirectoryMerger.hpp"
#include "transfer/FileTransfer.hpp"
#include "transfer/Mode.hpp"
#include "transfer/Outcome.hpp"
#include "transfer/Strategy.hpp"

#include <filesystem>
#include <vector>

namespace mvx::runtime { class Cancellation; }
namespace mvx::progress { class Sink; }

namespace mvx::transfer {

// Top of one invocation: validates every source before any work, then runs
// them in order, one at a time, stopping early only on cancellation.
class BatchRunner {
public:
    BatchRunner(const config::TransferConfig& config, const runtime::Cancellation& cancellation,
                progress::Sink* sink = nullptr);

    BatchRunner(const BatchRunner&) = delete;
    BatchRunner& operator=(const BatchRunner&) = delete;

    BatchReport run(const std::vector<std::filesystem::path>& sources, const std::filesystem::path& destination,
                    Mode mode, const Options& options) const;

private:
    SourceReport runOne(const std::filesystem::path& source, const std::filesystem::path& destination, bool container,
                        Mode mode, const Options& options) const;

    bool validate(const std::vector<std::filesystem::path>& sources, const std::filesystem::path& destination,
                  bool container, const Options& options, BatchReport& report) const;

    const runtime::Cancellation& cancellation_;
    progress::Sink* sink_;
    Strategy strategy_;
    FileTransfer files_;
    DirectoryMerger merger_;
};

}
