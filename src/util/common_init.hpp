#pragma once

#include "core/error.hpp"
#include "util/cli_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <thread>

// VBI_VERSION is defined in the generated core/version.hpp.
// Callers must include core/version.hpp before using check_version().

namespace vbi {

// Process exit codes shared by the command-line tools.
inline constexpr int EXIT_USAGE = 1;
inline constexpr int EXIT_IO = 2;

// Print "<cmd_name> <version>" to stderr if --version is present.
// Returns true if --version was handled (caller should return 0).
inline bool check_version(const CliParser& cli, const char* cmd_name) {
    if (cli.has("--version")) {
        std::fprintf(stderr, "%s %s\n", cmd_name, VBI_VERSION);
        return true;
    }
    return false;
}

// Create a Logger from -v / --verbose and -q / --quiet flags.
inline Logger make_logger(const CliParser& cli) {
    if (cli.has("-q") || cli.has("--quiet")) return Logger(Logger::kError);
    bool verbose = cli.has("-v") || cli.has("--verbose");
    return Logger(verbose ? Logger::kDebug : Logger::kInfo);
}

// Resolve thread count from CLI (0 or negative -> hardware_concurrency).
inline int resolve_threads(const CliParser& cli,
                           const std::string& key = "-threads",
                           int default_val = 1) {
    int n = cli.get_int(key, default_val);
    if (n <= 0) {
        n = static_cast<int>(std::thread::hardware_concurrency());
        if (n <= 0) n = 1;
    }
    return n;
}

// Log a failed operation and map its kind to the process exit code.
inline int report_error(const Logger& logger, const Error& err) {
    logger.error("%s: %s", error_kind_name(err.kind), err.message.c_str());
    return err.kind == ErrorKind::kArgument ? EXIT_USAGE : EXIT_IO;
}

} // namespace vbi
