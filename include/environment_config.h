// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file environment_config.h
 * @brief CARDFORGE_* environment overrides
 *
 * Environment variables override the config file for a single run. Values
 * that fail validation are ignored, never reported as errors.
 */

#pragma once

#include <optional>
#include <string>

namespace cardforge::config {

/**
 * @brief Static readers for environment variables
 *
 * No state is kept; every call reads the environment again.
 */
class EnvironmentConfig {
  public:
    /**
     * @brief Read a base-10 integer within [min, max]
     *
     * Unset, empty, partly numeric ("5abc") and out-of-range values all
     * give nullopt.
     */
    static std::optional<int> get_int(const char* name, int min, int max);

    /// True only for the exact value "1"
    static bool get_bool(const char* name);

    /// True if the variable is set, even to an empty string
    static bool exists(const char* name);

    /// Raw value; an empty string is returned as is
    static std::optional<std::string> get_string(const char* name);

    // CARDFORGE_LOG_LEVEL, e.g. "debug". Empty counts as unset.
    static std::optional<std::string> get_log_level();

    /**
     * @brief Seed base from CARDFORGE_SEED
     *
     * Used by commands that were not given a seed on the command line.
     * Empty counts as unset.
     */
    static std::optional<std::string> get_fixed_seed();

    /// CARDFORGE_MAX_ATTEMPTS, accepted in 1-100
    static std::optional<int> get_max_attempts();
};

} // namespace cardforge::config
