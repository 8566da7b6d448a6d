// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file cli_application.h
 * @brief Command-line front end for the theming engine
 *
 * Commands print JSON on stdout; logs go to stderr.
 *
 *   cardforge palette [SEED]
 *   cardforge analyze FILE
 *   cardforge apply FILE SEED [-o OUT]
 *   cardforge variations FILE [-o DIR] [--seed BASE]
 *   cardforge presets
 *
 * Global options: -c CONFIG, -v / -vv, --version, -h / --help
 */

#pragma once

#include "logo_catalog.h"

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace cardforge {

/// Exit codes
constexpr int CLI_EXIT_OK = 0;
constexpr int CLI_EXIT_RUNTIME_ERROR = 1;
constexpr int CLI_EXIT_USAGE_ERROR = 2;

struct CliOptions {
    std::string command;
    std::vector<std::string> positionals;
    std::string config_path;
    std::optional<std::string> output; ///< -o
    std::optional<std::string> seed;   ///< --seed
    int verbosity = 0;
    bool show_version = false;
    bool show_help = false;
};

/**
 * @brief Parse arguments (without argv[0])
 * @throws std::invalid_argument on unknown options, missing option values or
 *         a wrong number of positional arguments
 */
CliOptions parse_cli_args(const std::vector<std::string>& args);

class CliApplication {
  public:
    CliApplication(std::ostream& out, std::ostream& err);

    /// Parse, configure logging and config, dispatch. Returns the exit code.
    int run(int argc, char** argv);
    int run(const std::vector<std::string>& args);

  private:
    void init_logging_and_config(const CliOptions& options);
    void load_logo_catalog();

    int cmd_palette(const CliOptions& options);
    int cmd_analyze(const CliOptions& options);
    int cmd_apply(const CliOptions& options);
    int cmd_variations(const CliOptions& options);
    int cmd_presets();

    void print_usage(std::ostream& os) const;

    std::ostream& out_;
    std::ostream& err_;
    std::unique_ptr<LogoCatalog> logo_catalog_;
};

} // namespace cardforge
