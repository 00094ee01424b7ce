#include "args_parser.hpp"
#include <CLI/CLI.hpp>
#include <fmt/core.h>

namespace xferacct::cli {

std::optional<CLIArgs> parse_args(int argc, char const* const* argv)
{
    CLIArgs args;
    CLI::App app{"xferacct: sync a directory tree and report transfer statistics"};

    app.add_option("source", args.source, "Source directory");
    app.add_option("destination", args.destination, "Destination directory");

    app.add_option("--checkers", args.checkers, "Number of parallel checkers")
        ->check(CLI::PositiveNumber);
    app.add_option("--transfers", args.transfers, "Number of parallel transfers")
        ->check(CLI::PositiveNumber);
    app.add_option("--stats", args.stats_interval_ms, "Stats logging interval in ms, 0 to disable")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--stats-unit", args.stats_unit, "Show data rate in bytes or bits")
        ->check(CLI::IsMember({"bytes", "bits"}, CLI::ignore_case));
    app.add_option("--stats-log-level", args.stats_log_level, "Log level for periodic stats")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "warning", "error"}, CLI::ignore_case));
    app.add_option("--buffer-size", args.buffer_size, "Copy buffer size in bytes")
        ->check(CLI::PositiveNumber);
    app.add_option("--retries", args.retries, "Attempts per file for transient errors")
        ->check(CLI::PositiveNumber);

    app.add_flag("--delete", args.delete_extra, "Delete destination files missing from source");
    app.add_flag("-q,--quiet", args.quiet, "Only log errors");
    app.add_flag("-v,--verbose", args.verbose, "Debug logging");
    app.add_flag("--version", args.version, "Print build information and exit");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        app.exit(e);
        return std::nullopt;
    }

    if (!args.version && (args.source.empty() || args.destination.empty())) {
        fmt::print(stderr, "source and destination are required\n{}", app.help());
        return std::nullopt;
    }
    return args;
}

} // namespace xferacct::cli
