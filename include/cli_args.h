// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for tether-wifid
 */

#include <string>

namespace tether {

/**
 * @brief Parsed command-line arguments
 *
 * Empty strings and -1 mean "not given on the command line"; the config file
 * value (or built-in default) applies instead.
 */
struct CliArgs {
    std::string config_path; // -c/--config
    std::string interface;   // -i/--interface: overrides /wifi/interface

    bool mock = false; // --mock: simulated NetworkManager
    int clients = -1;  // --clients N: initial dashboard client count

    // Logging
    std::string log_dest; // --log-dest: auto, journal, syslog, file, console
    std::string log_file; // --log-file
    int verbosity = 0;

    bool help = false;
};

/**
 * @brief Parse command-line arguments
 *
 * Errors are reported on stdout.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true to continue startup, false on error or after --help
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

void print_usage(const char* program_name);

} // namespace tether
