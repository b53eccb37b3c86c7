#include "transfer/DestinationPlan.hpp"
#include "transfer/Error.hpp"
#include "logging/LogRegistry.hpp"

using namespace mvx::transfer;
using namespace mvx::logging;
namespace fs = std::filesystem;

bool mvx::transfer::hasTrailingSeparator(const fs::path& p) {
    const auto& s = p.native();
    return !s.empty() && s.back() == fs::path::preferred_separator;
}

fs::path mvx::transfer::absoluteNormal(const fs::path& p) {
    auto out = fs::absolute(p).lexically_normal();
    // lexically_normal keeps "dir/" as "dir/"; drop the empty last element
    if (out.has_relative_path() && out.filename().empty()) out = out.parent_path();
    return out;
}

fs::path mvx::transfer::baseName(const fs::path& p) {
    const auto abs = absoluteNormal(p);
    auto name = abs.filename();
    if (name.empty()) throw TransferError(ErrorKind::InvalidRequest, p, "Cannot get file name from '" + p.string() + "'");
    return name;
}

DestinationPlan DestinationPlan::resolve(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    auto target = destination;
    if (fs::is_directory(destination, ec) || hasTrailingSeparator(destination))
        target = destination / baseName(source);

    return forTarget(source, target);
}

DestinationPlan DestinationPlan::forTarget(const fs::path& source, const fs::path& target) {
    DestinationPlan plan{absoluteNormal(target)};

    std::error_code ec;
    const auto st = fs::symlink_status(plan.target, ec);
    if (!fs::exists(st)) {
        plan.action = Action::Create;
        return plan;
    }

    if (fs::is_directory(st)) throw TransferError::destinationNotAFile(plan.target);

    plan.action = fs::equivalent(source, plan.target, ec) ? Action::Noop : Action::Overwrite;
    return plan;
}

void DestinationPlan::ensureParents() const {
    const auto parent = target.parent_path();
    if (parent.empty()) return;

    std::error_code ec;
    if (fs::is_directory(parent, ec)) return;

    fs::create_directories(parent, ec);
    if (ec) throw TransferError(ErrorKind::DirectoryCreation, parent, "Cannot create directory '" + parent.string() + "'", ec);
    LogRegistry::transfer()->trace("[DestinationPlan] Created directory '{}'", parent.string());
}

std::string mvx::transfer::to_string(const DestinationPlan::Action action) {
    switch (action) {
    case DestinationPlan::Action::Create: return "create";
    case DestinationPlan::Action::Overwrite: return "overwrite";
    case DestinationPlan::Action::Noop: return "noop";
    default: return "unknown";
    }
}
