#include "cli/Args.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <fmt/format.h>

using namespace mvx::cli;

namespace {

void setFlag(Args& args, const char flag) {
    switch (flag) {
    case 'f': args.options.force = true; break;
    case 'n': args.options.dry_run = true; break;
    case 'q': args.options.quiet = true; break;
    case 'v': ++args.verbosity; args.options.verbose = true; break;
    case 'h': args.help = true; break;
    case 'V': args.version = true; break;
    default: throw UsageError(fmt::format("unknown option '-{}'", flag));
    }
}

void setLongFlag(Args& args, const std::string& name) {
    if (name == "force") args.options.force = true;
    else if (name == "dry-run") args.options.dry_run = true;
    else if (name == "quiet") args.options.quiet = true;
    else if (name == "verbose") { ++args.verbosity; args.options.verbose = true; }
    else if (name == "help") args.help = true;
    else if (name == "version") args.version = true;
    else throw UsageError(fmt::format("unknown option '--{}'", name));
}

}

Args mvx::cli::parseArgs(const std::vector<std::string>& argv) {
    Args args;
    std::vector<std::string> positionals;
    bool stopFlags = false;

    for (size_t i = 0; i < argv.size(); ++i) {
        const auto& tok = argv[i];

        if (stopFlags || tok.size() < 2 || tok[0] != '-') {
            positionals.push_back(tok);
            continue;
        }

        if (tok == "--") {
            stopFlags = true;
            continue;
        }

        if (tok.starts_with("--")) {
            auto name = tok.substr(2);
            std::optional<std::string> value;
            if (const auto eq = name.find('='); eq != std::string::npos) {
                value = name.substr(eq + 1);
                name.resize(eq);
            }

            if (name == "config") {
                if (!value) {
                    if (i + 1 >= argv.size()) throw UsageError("option '--config' requires a path");
                    value = argv[++i];
                }
                if (value->empty()) throw UsageError("option '--config' requires a path");
                args.config = *value;
                continue;
            }

            if (value) throw UsageError(fmt::format("option '--{}' takes no value", name));
            setLongFlag(args, name);
            continue;
        }

        // bundled short flags: -fv
        for (size_t j = 1; j < tok.size(); ++j) setFlag(args, tok[j]);
    }

    if (args.help || args.version) return args;

    if (positionals.size() < 2) throw UsageError("expected at least one source and a destination");

    args.destination = positionals.back();
    positionals.pop_back();
    for (auto& p : positionals) args.sources.emplace_back(std::move(p));

    if (args.options.quiet) args.options.verbose = false;
    return args;
}

bool mvx::cli::isTruthy(const std::string& value) {
    auto lower = value;
    std::ranges::transform(lower, lower.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static constexpr std::array FALSY = {"", "0", "false", "no", "off", "n", "f"};
    return std::ranges::none_of(FALSY, [&lower](const char* f) { return lower == f; });
}

void mvx::cli::applyEnvironment(Args& args) {
    if (const char* env = std::getenv("MODE_DRY_RUN"); env && isTruthy(env)) args.options.dry_run = true;
}

spdlog::level::level_enum mvx::cli::consoleLevel(const Args& args) {
    if (args.options.quiet) return spdlog::level::warn;
    if (args.verbosity >= 2) return spdlog::level::trace;
    if (args.verbosity == 1) return spdlog::level::debug;
    return spdlog::level::info;
}

std::string mvx::cli::usage(const transfer::Mode mode, const std::string& program) {
    const auto what = mode == transfer::Mode::Move ? "Move" : "Copy";
    return fmt::format(
        "Usage: {0} [OPTIONS] <SOURCES>... <DEST>\n"
        "\n"
        "{1} files and merge directories into DEST.\n"
        "\n"
        "Options:\n"
        "  -f, --force          Overwrite existing destination files\n"
        "  -n, --dry-run        Show what would be done without changing anything\n"
        "  -q, --quiet          Only report warnings and errors, no progress bar\n"
        "  -v, --verbose        Report every file; repeat for trace output\n"
        "      --config <PATH>  Read configuration from PATH\n"
        "  -h, --help           Print this help\n"
        "  -V, --version        Print version\n"
        "\n"
        "Environment:\n"
        "  MODE_DRY_RUN         Any value but '', 0, false, no, off, n, f enables --dry-run\n"
        "  MVX_CONFIG           Configuration file when --config is not given\n",
        program, what);
}
