#include "transfer/Outcome.hpp"

#include <algorithm>

using namespace mvx::transfer;

size_t MergeReport::count(const Outcome::Status status) const {
    return static_cast<size_t>(std::ranges::count_if(outcomes, [status](const Outcome& o) { return o.status == status; }));
}

bool SourceReport::ok() const {
    if (!attempted || cancelled || error) return false;
    return std::ranges::all_of(outcomes, [](const Outcome& o) { return o.ok(); });
}

bool BatchReport::ok() const {
    if (validation_failed || cancelled) return false;
    return std::ranges::all_of(sources, [](const SourceReport& s) { return s.ok(); });
}

int BatchReport::exitCode() const {
    if (cancelled) return EXIT_CODE_INTERRUPTED;
    return ok() ? EXIT_CODE_OK : EXIT_CODE_FAILURE;
}

std::string mvx::transfer::to_string(const Method method) {
    switch (method) {
    case Method::None: return "none";
    case Method::Rename: return "rename";
    case Method::Reflink: return "reflink";
    case Method::Stream: return "stream";
    default: return "unknown";
    }
}

std::string mvx::transfer::to_string(const Outcome::Status status) {
    switch (status) {
    case Outcome::Status::Done: return "done";
    case Outcome::Status::DoneWithWarning: return "done with warning";
    case Outcome::Status::Planned: return "planned";
    case Outcome::Status::Failed: return "failed";
    case Outcome::Status::Cancelled: return "cancelled";
    case Outcome::Status::Skipped: return "skipped";
    default: return "unknown";
    }
}
