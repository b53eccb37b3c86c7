#include "transfer/BatchRunner.hpp"
#include "transfer/DestinationPlan.hpp"
#include "transfer/Error.hpp"
#include "runtime/Cancellation.hpp"
#include "logging/LogRegistry.hpp"

#include <chrono>

using namespace mvx::transfer;
using namespace mvx::logging;
namespace fs = std::filesystem;

BatchRunner::BatchRunner(const config::TransferConfig& config, const runtime::Cancellation& cancellation,
                         progress::Sink* sink)
    : cancellation_(cancellation),
      sink_(sink),
      strategy_(config, cancellation),
      files_(strategy_, cancellation),
      merger_(files_, cancellation) {}

BatchReport BatchRunner::run(const std::vector<fs::path>& sources, const fs::path& destination, const Mode mode,
                             const Options& options) const {
    const auto log = LogRegistry::mvx();
    BatchReport report;

    // With several sources DEST is a container for all of them.
    const bool container = sources.size() > 1;

    if (!validate(sources, destination, container, options, report)) {
        report.validation_failed = true;
        return report;
    }

    for (const auto& source : sources) {
        if (cancellation_.isRequested()) {
            log->warn("[BatchRunner] Cancelled, not starting '{}'", source.string());
            report.sources.push_back({source, destination, SourceReport::Kind::File, {}, {}, ErrorKind::Cancelled,
                                      "Not started", true, false});
            continue;
        }

        report.sources.push_back(runOne(source, destination, container, mode, options));
    }

    // Any interrupt, even one that let the batch finish, is reported as such.
    report.cancelled = !cancellation_.isRunning();
    log->debug("[BatchRunner] Finished {} source(s), exit code {}", report.sources.size(), report.exitCode());
    return report;
}

bool BatchRunner::validate(const std::vector<fs::path>& sources, const fs::path& destination, const bool container,
                           const Options& options, BatchReport& report) const {
    const auto log = LogRegistry::mvx();
    bool ok = true;

    for (const auto& source : sources) {
        std::error_code ec;
        if (fs::exists(fs::symlink_status(source, ec))) continue;

        const auto e = TransferError::sourceNotFound(source);
        log->error("✗ {}", e.what());
        report.sources.push_back({source, destination, SourceReport::Kind::File, {}, {}, e.kind(), e.what(), false,
                                  false});
        ok = false;
    }
    if (!ok || !container) return ok;

    std::error_code ec;
    if (fs::exists(destination, ec)) {
        if (fs::is_directory(destination, ec)) return true;
        const auto e = TransferError::destinationNotADirectory(destination);
        log->error("✗ {}", e.what());
        report.sources.push_back({destination, destination, SourceReport::Kind::Directory, {}, {}, e.kind(), e.what(),
                                  false, false});
        return false;
    }

    if (options.dry_run) return true;

    fs::create_directories(destination, ec);
    if (ec) {
        const TransferError e(ErrorKind::DirectoryCreation, destination,
                              "Cannot create directory '" + destination.string() + "'", ec);
        log->error("✗ {}", e.what());
        report.sources.push_back({destination, destination, SourceReport::Kind::Directory, {}, {}, e.kind(), e.what(),
                                  false, false});
        return false;
    }
    return true;
}

SourceReport BatchRunner::runOne(const fs::path& source, const fs::path& destination, const bool container,
                                 const Mode mode, const Options& options) const {
    const auto log = LogRegistry::mvx();
    const auto started = std::chrono::steady_clock::now();

    SourceReport sr{source, destination};
    // A symlink to a directory is merged like the directory itself.
    std::error_code ec;
    const bool isDir = fs::is_directory(source, ec);

    try {
        if (isDir) {
            sr.kind = SourceReport::Kind::Directory;
            sr.destination = container ? destination / baseName(source) : destination;

            auto merged = merger_.merge({source, sr.destination, mode, options}, sink_);
            sr.outcomes = std::move(merged.outcomes);
            sr.warnings = std::move(merged.warnings);
            sr.cancelled = merged.cancelled;
        } else {
            // A trailing separator makes DestinationPlan treat DEST as a directory even in a dry run.
            const auto target = container ? destination / "" : destination;
            auto outcome = files_.run({source, target, mode, options}, sink_);
            sr.destination = outcome.unit.destination;
            sr.cancelled = outcome.status == Outcome::Status::Cancelled;
            if (outcome.status == Outcome::Status::DoneWithWarning) sr.warnings.push_back(outcome.message);
            sr.outcomes.push_back(std::move(outcome));
        }
    } catch (const TransferError& e) {
        log->error("✗ {}", e.what());
        sr.error = e.kind();
        sr.message = e.what();
    } catch (const fs::filesystem_error& e) {
        log->error("✗ Cannot {} '{}': {}", verb(mode), source.string(), e.what());
        sr.error = ErrorKind::StreamingIO;
        sr.message = e.what();
    }

    sr.elapsed = std::chrono::steady_clock::now() - started;
    return sr;
}
