/**
 * @file command_line.hpp
 * @brief Option parsing, configuration layering and exit codes of codecell-run
 *
 * The executable's main() only installs the stderr logger and calls
 * RunCli(); everything else lives here so it can be driven from tests with
 * a scripted environment and in-memory streams.
 *
 * @date 2025
 */

#pragma once

#include "codecell/core/config.hpp"

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>

namespace codecell {
namespace cli {

constexpr int kExitOk = 0;         ///< Report produced (or healthy host)
constexpr int kExitHostError = 1;  ///< Host not ready or report not written
constexpr int kExitUsage = 2;      ///< Usage, configuration or request error

/**
 * @struct CommandLineOptions
 * @brief Everything codecell-run accepts on its command line
 */
struct CommandLineOptions {
    std::string config_path;
    std::string request_path{"-"};  ///< '-' reads the request from stdin
    std::string limits_path;
    std::string output_path;        ///< Empty: report on stdout
    std::string log_level;
    std::string workspace_root;
    std::string report_format;

    double wall_clock{0.0};
    double cpu_time{0.0};
    std::uint64_t memory_bytes{0};
    std::uint64_t max_processes{0};
    bool wall_clock_set{false};     ///< The numeric limits only apply when given
    bool cpu_time_set{false};
    bool memory_bytes_set{false};
    bool max_processes_set{false};

    bool allow_network{false};
    bool no_pool{false};
    bool preserve_workspace{false};
    bool pretty{false};
    bool verbose{false};
    bool health{false};
};

/**
 * @brief Parse argv into options
 * @return std::nullopt to go on, otherwise the exit code to return
 *         (kExitOk after --help, kExitUsage on a parse error)
 */
std::optional<int> ParseCommandLine(int argc, const char* const* argv, CommandLineOptions& options);

/**
 * @brief Layer the configuration: defaults, then the JSON file, then the
 *        CODECELL_* environment, then the flags
 * @throws std::runtime_error if any layer is malformed
 */
core::SandboxConfig BuildConfig(const CommandLineOptions& options,
                                const std::map<std::string, std::string>& env);

/**
 * @brief The whole codecell-run program
 *
 * Reads the request from `in` (or the --request file), writes the report
 * or the health document to `out` (or the --output file).
 *
 * @return kExitOk, kExitHostError or kExitUsage
 */
int RunCli(int argc, const char* const* argv,
           const std::map<std::string, std::string>& env,
           std::istream& in, std::ostream& out);

} // namespace cli
} // namespace codecell
