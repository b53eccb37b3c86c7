#include "transfer/FileTransfer.hpp"
#include "transfer/Strategy.hpp"
#include "transfer/Error.hpp"
#include "progress/Tracker.hpp"
#include "runtime/Cancellation.hpp"
#include "logging/LogRegistry.hpp"

using namespace mvx::transfer;
using namespace mvx::logging;
namespace fs = std::filesystem;

namespace {

uint64_t sizeOf(const fs::path& p) {
    std::error_code ec;
    const auto size = fs::file_size(p, ec);
    return ec ? 0 : static_cast<uint64_t>(size);
}

Outcome failed(FileUnit unit, const DestinationPlan::Action action, const ErrorKind kind, const std::string& message) {
    return {std::move(unit), action, Method::None, Outcome::Status::Failed, kind, message};
}

}

FileTransfer::FileTransfer(const Strategy& strategy, const runtime::Cancellation& cancellation)
    : strategy_(strategy), cancellation_(cancellation) {}

Outcome FileTransfer::run(const Request& request, progress::Sink* sink) const {
    FileUnit unit{absoluteNormal(request.source), {}, 0};

    std::error_code ec;
    const auto st = fs::symlink_status(unit.source, ec);
    if (!fs::exists(st)) {
        const auto e = TransferError::sourceNotFound(request.source);
        LogRegistry::transfer()->error("[FileTransfer] ✗ {}", e.what());
        return failed(unit, DestinationPlan::Action::Create, e.kind(), e.what());
    }

    // Symlinks are followed for the type check; a dangling one is still moved as a link.
    const auto target = fs::status(unit.source, ec);
    if (fs::is_directory(target)) {
        const auto msg = "Source '" + request.source.string() + "' is a directory";
        LogRegistry::transfer()->error("[FileTransfer] ✗ {}", msg);
        return failed(unit, DestinationPlan::Action::Create, ErrorKind::InvalidRequest, msg);
    }
    if (fs::exists(target) && !fs::is_regular_file(target)) {
        const auto msg = "Source '" + request.source.string() + "' is not a regular file";
        LogRegistry::transfer()->error("[FileTransfer] ✗ {}", msg);
        return failed(unit, DestinationPlan::Action::Create, ErrorKind::SourceNotSupported, msg);
    }

    unit.size = sizeOf(unit.source);

    DestinationPlan plan;
    try {
        plan = DestinationPlan::resolve(unit.source, request.destination);
    } catch (const TransferError& e) {
        LogRegistry::transfer()->error("[FileTransfer] ✗ {}", e.what());
        unit.destination = request.destination;
        return failed(unit, DestinationPlan::Action::Create, e.kind(), e.what());
    }
    unit.destination = plan.target;

    progress::Tracker tracker(unit.source, unit.size, sink);
    return transferUnit(unit, plan, request.mode, request.options, tracker);
}

Outcome FileTransfer::transferUnit(const FileUnit& unit, const DestinationPlan& plan, const Mode mode,
                                   const Options& options, progress::Tracker& tracker) const {
    const auto log = LogRegistry::transfer();
    Outcome outcome{unit, plan.action};

    tracker.begin(unit.label(), unit.size);

    try {
        if (cancellation_.isForced()) throw TransferError::cancelled(unit.source);

        if (plan.action == DestinationPlan::Action::Noop) {
            tracker.finish(unit.label());
            outcome.message = "'" + unit.source.string() + "' and '" + plan.target.string() + "' are the same file";
            log->debug("[FileTransfer] {}, nothing to do", outcome.message);
            return outcome;
        }

        if (plan.exists() && !options.force) throw TransferError::destinationExists(plan.target);

        if (options.dry_run) {
            tracker.plan(unit.label(), unit.size);
            outcome.status = Outcome::Status::Planned;
            outcome.message = "Would " + verb(mode) + " '" + unit.source.string() + "' => '" + plan.target.string() +
                              "' (" + to_string(plan.action) + ")";
            if (options.verbose) log->info("[FileTransfer] {}", outcome.message);
            else log->debug("[FileTransfer] {}", outcome.message);
            return outcome;
        }

        plan.ensureParents();

        const auto result = strategy_.execute(mode, unit, tracker, plan.action == DestinationPlan::Action::Overwrite);
        tracker.finish(unit.label());

        outcome.method = result.method;
        if (result.warning) {
            outcome.status = Outcome::Status::DoneWithWarning;
            outcome.message = *result.warning;
        }

        if (options.verbose)
            log->info("[FileTransfer] {} '{}' => '{}' ({})", pastTense(mode), unit.source.string(),
                      plan.target.string(), to_string(result.method));
        return outcome;
    } catch (const TransferError& e) {
        tracker.fail(unit.label());
        outcome.error = e.kind();
        outcome.message = e.what();
        if (e.isCancelled()) {
            outcome.status = Outcome::Status::Cancelled;
            log->warn("[FileTransfer] {}", e.what());
        } else {
            outcome.status = Outcome::Status::Failed;
            log->error("[FileTransfer] ✗ {}", e.what());
        }
    } catch (const fs::filesystem_error& e) {
        tracker.fail(unit.label());
        outcome.status = Outcome::Status::Failed;
        outcome.error = ErrorKind::StreamingIO;
        outcome.message = e.what();
        log->error("[FileTransfer] ✗ Cannot {} '{}': {}", verb(mode), unit.source.string(), e.what());
    }

    return outcome;
}
