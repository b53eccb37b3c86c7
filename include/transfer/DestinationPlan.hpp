#pragma once

#include <filesystem>
#include <string>

namespace mvx::transfer {

// Where a single source file lands. resolve() only inspects the filesystem;
// ensureParents() is the one mutation and is skipped in dry run.
struct DestinationPlan {
    enum class Action { Create, Overwrite, Noop };

    std::filesystem::path target;
    Action action{Action::Create};

    static DestinationPlan resolve(const std::filesystem::path& source, const std::filesystem::path& destination);

    // Target for a file found in an existing tree (destination used verbatim).
    static DestinationPlan forTarget(const std::filesystem::path& source, const std::filesystem::path& target);

    void ensureParents() const;

    [[nodiscard]] bool exists() const { return action != Action::Create; }
};

std::string to_string(DestinationPlan::Action action);

bool hasTrailingSeparator(const std::filesystem::path& p);

std::filesystem::path absoluteNormal(const std::filesystem::path& p);

// Last meaningful component: "a/b/" -> "b", "./x" -> "x".
std::filesystem::path baseName(const std::filesystem::path& p);

}
