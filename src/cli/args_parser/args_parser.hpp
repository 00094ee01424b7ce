#pragma once

#include <string>
#include <cstdint>
#include <optional>

namespace xferacct::cli {

struct CLIArgs
{
    std::string source;                              // первый позиционный аргумент
    std::string destination;                         // второй позиционный аргумент
    std::optional<std::uint32_t> checkers;           // --checkers=N
    std::optional<std::uint32_t> transfers;          // --transfers=N
    std::optional<std::uint32_t> stats_interval_ms;  // --stats=MS
    std::optional<std::string> stats_unit;           // --stats-unit=bytes|bits
    std::optional<std::string> stats_log_level;      // --stats-log-level=LEVEL
    std::optional<std::size_t> buffer_size;          // --buffer-size=BYTES
    std::optional<int> retries;                      // --retries=N
    bool delete_extra{false};                        // --delete
    bool quiet{false};                               // -q, --quiet
    bool verbose{false};                             // -v, --verbose
    bool version{false};                             // --version
};

/// Parses command-line arguments. Returns nullopt after --help or a parse
/// error (CLI11 has already printed the message).
std::optional<CLIArgs> parse_args(int argc, char const* const* argv);

} // namespace xferacct::cli
