// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <optional>
#include <string>

namespace cardforge::logging {

struct LogSettings {
    spdlog::level::level_enum level = spdlog::level::warn;
    std::string file_path; ///< Empty: stderr only
};

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "off")
 * @return Level, or nullopt if @p name is not a known level
 */
std::optional<spdlog::level::level_enum> parse_level(const std::string& name);

/**
 * @brief Level for a count of -v flags: 0 keeps @p base, 1 is debug, 2+ is trace
 */
spdlog::level::level_enum level_for_verbosity(int verbosity, spdlog::level::level_enum base);

/**
 * @brief Install the default logger
 *
 * Logs go to a colored stderr sink so stdout stays free for command output.
 * A file sink is added when @p settings names a file; failure to open it is
 * logged and otherwise ignored.
 */
void init_logging(const LogSettings& settings);

} // namespace cardforge::logging
