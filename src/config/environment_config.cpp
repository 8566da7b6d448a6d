// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "environment_config.h"

#include <cstdlib>
#include <cstring>

namespace cardforge::config {

std::optional<int> EnvironmentConfig::get_int(const char* name, int min, int max) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }

    char* endptr = nullptr;
    long parsed = strtol(value, &endptr, 10);

    // No digits, or trailing garbage
    if (endptr == value || *endptr != '\0') {
        return std::nullopt;
    }

    if (parsed < min || parsed > max) {
        return std::nullopt;
    }

    return static_cast<int>(parsed);
}

bool EnvironmentConfig::get_bool(const char* name) {
    const char* value = std::getenv(name);
    return value != nullptr && strcmp(value, "1") == 0;
}

bool EnvironmentConfig::exists(const char* name) {
    return std::getenv(name) != nullptr;
}

std::optional<std::string> EnvironmentConfig::get_string(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

// ============================================================================
// Application-specific helpers
// ============================================================================

namespace {

std::optional<std::string> non_empty(std::optional<std::string> value) {
    if (value && value->empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::optional<std::string> EnvironmentConfig::get_log_level() {
    return non_empty(get_string("CARDFORGE_LOG_LEVEL"));
}

std::optional<std::string> EnvironmentConfig::get_fixed_seed() {
    return non_empty(get_string("CARDFORGE_SEED"));
}

std::optional<int> EnvironmentConfig::get_max_attempts() {
    return get_int("CARDFORGE_MAX_ATTEMPTS", 1, 100);
}

} // namespace cardforge::config
