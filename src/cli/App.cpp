#include "cli/App.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "progress/ConsoleRenderer.hpp"
#include "runtime/Cancellation.hpp"
#include "runtime/SignalWatcher.hpp"
#include "transfer/BatchRunner.hpp"
#include "util/humanize.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <memory>

#ifndef MVX_VERSION
#define MVX_VERSION "0.0.0"
#endif

using namespace mvx::cli;
using namespace mvx::config;
using namespace mvx::logging;
using namespace mvx::transfer;
namespace fs = std::filesystem;

App::App(const Mode mode) : mode_(mode) {}

int App::run(const int argc, char** argv) {
    const std::string program = argc > 0 ? fs::path(argv[0]).filename().string() : to_string(mode_);
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return run(program, args);
}

int App::run(const std::string& program, const std::vector<std::string>& argv) {
    Args args;
    try {
        args = parseArgs(argv);
    } catch (const UsageError& e) {
        fmt::print(stderr, "{}: {}\n\n{}", program, e.what(), usage(mode_, program));
        return EXIT_USAGE;
    }

    if (args.help) {
        fmt::print("{}", usage(mode_, program));
        return BatchReport::EXIT_CODE_OK;
    }
    if (args.version) {
        fmt::print("{} {}\n", program, MVX_VERSION);
        return BatchReport::EXIT_CODE_OK;
    }

    applyEnvironment(args);

    try {
        ConfigRegistry::init(args.config);
        LogRegistry::init(consoleLevel(args));
    } catch (const std::exception& e) {
        fmt::print(stderr, "{}: {}\n", program, e.what());
        return BatchReport::EXIT_CODE_FAILURE;
    }

    return execute(args);
}

int App::execute(const Args& args) {
    const auto log = LogRegistry::mvx();
    const auto& cfg = ConfigRegistry::get();

    runtime::Cancellation cancellation;
    runtime::SignalWatcher watcher(cancellation);
    try {
        watcher.start();
    } catch (const std::exception& e) {
        log->warn("[App] Interrupts will not be handled gracefully: {}", e.what());
    }

    // Quiet means no renderer at all.
    std::unique_ptr<progress::ConsoleRenderer> renderer;
    if (!args.options.quiet) renderer = std::make_unique<progress::ConsoleRenderer>(cfg.progress);

    log->debug("[App] {} {} source(s) => '{}'{}", to_string(mode_), args.sources.size(), args.destination.string(),
               args.options.dry_run ? " (dry run)" : "");

    const BatchRunner runner(cfg.transfer, cancellation, renderer.get());
    const auto report = runner.run(args.sources, args.destination, mode_, args.options);

    watcher.stop();

    for (const auto& line : summarize(report, mode_, args.options.dry_run)) {
        if (line.starts_with("✗")) log->error("{}", line);
        else if (report.cancelled) log->warn("{}", line);
        else log->info("{}", line);
    }

    return report.exitCode();
}

std::vector<std::string> App::summarize(const BatchReport& report, const Mode mode, const bool dryRun) {
    std::vector<std::string> lines;

    for (const auto& sr : report.sources) {
        const auto src = sr.source.string(), dst = sr.destination.string();
        const bool dir = sr.kind == SourceReport::Kind::Directory;

        if (!sr.attempted) {
            if (sr.error == ErrorKind::Cancelled) lines.push_back(fmt::format("Not started: '{}'", src));
            continue;
        }

        // failed before any unit ran; already reported
        if (sr.error) continue;

        if (sr.cancelled) {
            lines.push_back(fmt::format("Interrupted: '{}' => '{}'", src, dst));
            continue;
        }

        if (!sr.ok()) {
            const auto failed = std::ranges::count_if(sr.outcomes, [](const Outcome& o) { return !o.ok(); });
            if (dir)
                lines.push_back(fmt::format("✗ Merged with {} of {} file(s) failed: '{}' => '{}'", failed,
                                            sr.outcomes.size(), src, dst));
            continue;
        }

        if (dryRun) {
            lines.push_back(fmt::format("Would {} '{}' => '{}'", dir ? "merge" : verb(mode), src, dst));
            continue;
        }

        const auto verbPast = dir ? std::string("Merged") : pastTense(mode);
        lines.push_back(fmt::format("{} in {}: '{}' => '{}'", verbPast, util::durationToString(sr.elapsed), src, dst));
    }

    return lines;
}
