// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace cardforge::logging {

namespace {

constexpr const char* CONSOLE_PATTERN = "[%H:%M:%S] [%^%l%$] %v";
constexpr const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

} // namespace

std::optional<spdlog::level::level_enum> parse_level(const std::string& name) {
    if (name == "trace")
        return spdlog::level::trace;
    if (name == "debug")
        return spdlog::level::debug;
    if (name == "info")
        return spdlog::level::info;
    if (name == "warn" || name == "warning")
        return spdlog::level::warn;
    if (name == "error" || name == "err")
        return spdlog::level::err;
    if (name == "critical")
        return spdlog::level::critical;
    if (name == "off")
        return spdlog::level::off;
    return std::nullopt;
}

spdlog::level::level_enum level_for_verbosity(int verbosity, spdlog::level::level_enum base) {
    if (verbosity >= 2)
        return spdlog::level::trace;
    if (verbosity == 1)
        return spdlog::level::debug;
    return base;
}

void init_logging(const LogSettings& settings) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(console);

    std::string file_error;
    if (!settings.file_path.empty()) {
        try {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.file_path);
            file->set_pattern(FILE_PATTERN);
            sinks.push_back(file);
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("cardforge", sinks.begin(), sinks.end());
    logger->set_level(settings.level);
    spdlog::set_default_logger(logger);

    if (!file_error.empty()) {
        spdlog::warn("[Logging] Cannot open log file {}: {}", settings.file_path, file_error);
    }
    spdlog::debug("[Logging] Level set to {}", spdlog::level::to_string_view(settings.level));
}

} // namespace cardforge::logging
