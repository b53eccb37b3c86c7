#pragma once

#include "transfer/DestinationPlan.hpp"
#include "transfer/Error.hpp"
#include "transfer/FileUnit.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace mvx::transfer {

enum class Method { None, Rename, Reflink, Stream };

struct Outcome {
    enum class Status { Done, DoneWithWarning, Planned, Failed, Cancelled, Skipped };

    FileUnit unit;
    DestinationPlan::Action action{DestinationPlan::Action::Create};
    Method method{Method::None};
    Status status{Status::Done};
    std::optional<ErrorKind> error{};
    std::string message{};

    [[nodiscard]] bool ok() const {
        return status == Status::Done || status == Status::DoneWithWarning || status == Status::Planned;
    }
};

struct MergeReport {
    std::filesystem::path source;
    std::filesystem::path destination;
    std::vector<Outcome> outcomes;
    std::vector<std::string> warnings;   // cleanup failures; never fail the merge
    bool cancelled = false;

    [[nodiscard]] size_t count(Outcome::Status status) const;
    [[nodiscard]] size_t failures() const { return count(Outcome::Status::Failed); }
    [[nodiscard]] bool ok() const { return !cancelled && failures() == 0; }
};

struct SourceReport {
    enum class Kind { File, Directory };

    std::filesystem::path source;
    std::filesystem::path destination;
    Kind kind{Kind::File};
    std::vector<Outcome> outcomes;
    std::vector<std::string> warnings;
    std::optional<ErrorKind> error{};   // failure before any unit ran
    std::string message{};
    bool cancelled = false;
    bool attempted = true;
    std::chrono::steady_clock::duration elapsed{};

    [[nodiscard]] bool ok() const;
};

struct BatchReport {
    std::vector<SourceReport> sources;
    bool validation_failed = false;
    bool cancelled = false;

    static constexpr int EXIT_CODE_OK = 0;
    static constexpr int EXIT_CODE_FAILURE = 1;
    static constexpr int EXIT_CODE_INTERRUPTED = 130;

    [[nodiscard]] bool ok() const;
    [[nodiscard]] int exitCode() const;
};

std::string to_string(Method method);
std::string to_string(Outcome::Status status);

}
