#include "transfer/DirectoryMerger.hpp"
#include "transfer/DestinationPlan.hpp"
#include "transfer/Error.hpp"
#include "transfer/FileTransfer.hpp"
#include "progress/Tracker.hpp"
#include "runtime/Cancellation.hpp"
#include "logging/LogRegistry.hpp"

#include <cerrno>

using namespace mvx::transfer;
using namespace mvx::logging;
using mvx::tree::DirectoryWalker;
namespace fs = std::filesystem;

DirectoryMerger::DirectoryMerger(const FileTransfer& files, const runtime::Cancellation& cancellation)
    : files_(files), cancellation_(cancellation) {}

bool DirectoryMerger::isWithin(const fs::path& path, const fs::path& root) {
    std::error_code ec;
    const auto p = fs::weakly_canonical(path, ec);
    const auto r = fs::weakly_canonical(root, ec);
    const auto rel = p.lexically_relative(r);
    return !rel.empty() && *rel.begin() != "..";
}

void DirectoryMerger::validate(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(source, ec))) throw TransferError::sourceNotFound(source);
    if (!fs::is_directory(source, ec))
        throw TransferError(ErrorKind::InvalidRequest, source, "Source '" + source.string() + "' is not a directory");

    if (fs::exists(destination, ec) && !fs::is_directory(destination, ec))
        throw TransferError::destinationNotADirectory(destination);

    if (isWithin(destination, source))
        throw TransferError(ErrorKind::InvalidRequest, destination,
                            "Cannot merge '" + source.string() + "' into itself ('" + destination.string() + "')");
}

MergeReport DirectoryMerger::merge(const Request& request, progress::Sink* sink) const {
    const auto log = LogRegistry::merge();
    const auto source = absoluteNormal(request.source);
    const auto destination = absoluteNormal(request.destination);

    validate(source, destination);

    if (!request.options.dry_run) {
        std::error_code ec;
        fs::create_directories(destination, ec);
        if (ec)
            throw TransferError(ErrorKind::DirectoryCreation, destination,
                                "Cannot create directory '" + destination.string() + "'", ec);
    }

    // A symlinked source merges the directory it points to; the walk and the prune run on that.
    std::error_code ec;
    const bool viaLink = fs::is_symlink(source, ec);
    const auto root = viaLink ? fs::canonical(source) : source;

    MergeReport report{source, destination};
    const auto listing = DirectoryWalker().walk(root);

    for (const auto& other : listing.others) {
        auto warning = "Skipping '" + other.path.string() + "': not a regular file";
        log->warn("[Merger] {}", warning);
        report.warnings.push_back(std::move(warning));
    }

    log->debug("[Merger] {} '{}' => '{}': {} files, {} directories, {} bytes", verb(request.mode), source.string(),
               destination.string(), listing.files.size(), listing.directories.size(), listing.totalBytes());

    progress::Tracker tracker(source, listing.totalBytes(), sink);

    for (const auto& entry : listing.files) {
        FileUnit unit{entry.path, destination / entry.relative, entry.size, entry.relative};

        // Requested: the in-flight file has finished, the rest of the tree waits for a re-run.
        if (cancellation_.isRequested()) {
            tracker.drop(unit.size);
            report.cancelled = true;
            report.outcomes.push_back({std::move(unit), DestinationPlan::Action::Create, Method::None,
                                       Outcome::Status::Skipped, ErrorKind::Cancelled, "Skipped after cancellation"});
            continue;
        }

        DestinationPlan plan;
        try {
            plan = DestinationPlan::forTarget(unit.source, unit.destination);
        } catch (const TransferError& e) {
            log->error("[Merger] ✗ {}", e.what());
            tracker.drop(unit.size);
            report.outcomes.push_back({std::move(unit), DestinationPlan::Action::Overwrite, Method::None,
                                       Outcome::Status::Failed, e.kind(), e.what()});
            continue;
        }

        auto outcome = files_.transferUnit(unit, plan, request.mode, request.options, tracker);
        if (outcome.status == Outcome::Status::Cancelled) report.cancelled = true;
        report.outcomes.push_back(std::move(outcome));
    }

    if (request.mode == Mode::Move && !request.options.dry_run && !cancellation_.isForced())
        prune(listing, root, report);

    // The link goes once the directory behind it has been emptied and removed.
    if (viaLink && request.mode == Mode::Move && !request.options.dry_run && !fs::exists(root, ec)) {
        if (!fs::remove(source, ec) && ec) {
            auto warning = TransferError(ErrorKind::DirectoryCleanup, source, "Cannot remove link '" + source.string() + "'", ec);
            log->warn("[Merger] {}", warning.what());
            report.warnings.emplace_back(warning.what());
        }
    }

    log->debug("[Merger] Finished '{}': {} done, {} failed, {} skipped", source.string(),
               report.count(Outcome::Status::Done) + report.count(Outcome::Status::DoneWithWarning),
               report.failures(), report.count(Outcome::Status::Skipped));
    return report;
}

void DirectoryMerger::prune(const DirectoryWalker::Listing& listing, const fs::path& root, MergeReport& report) const {
    const auto log = LogRegistry::merge();

    const auto removeIfEmpty = [&](const fs::path& dir) {
        std::error_code ec;
        if (fs::remove(dir, ec)) {
            log->trace("[Merger] Removed empty directory '{}'", dir.string());
            return;
        }
        // Still holds something that was not moved; leave it.
        if (ec == std::errc::directory_not_empty || ec.value() == EEXIST) return;
        if (!ec) return;

        auto warning = TransferError(ErrorKind::DirectoryCleanup, dir, "Cannot remove directory '" + dir.string() + "'", ec);
        log->warn("[Merger] {}", warning.what());
        report.warnings.emplace_back(warning.what());
    };

    for (const auto& dir : listing.directories) removeIfEmpty(dir.path);
    removeIfEmpty(root);
}
