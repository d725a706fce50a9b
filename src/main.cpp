/**
 * @file main.cpp
 * @brief codecell-run - Command-line host of the sandboxed test-execution core
 *
 * Loads the configuration (defaults, JSON file, CODECELL_* environment,
 * flags), reads one ExecutionRequest as JSON, runs it through the
 * Orchestrator and writes the ExecutionReport as JSON. Logs go to stderr so
 * stdout carries nothing but the report.
 *
 * Exit codes: 0 report produced, 1 host not ready or report not written,
 * 2 usage or configuration error.
 *
 * @date 2025
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "codecell/cli/command_line.hpp"

#include <iostream>

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    // Logs on stderr, the report on stdout
    spdlog::set_default_logger(spdlog::stderr_color_mt("codecell"));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    return codecell::cli::RunCli(argc, argv, codecell::core::CurrentEnvironment(),
                                 std::cin, std::cout);
}
