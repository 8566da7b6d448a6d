// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace cardforge {

Config* Config::instance{nullptr};

namespace {

/// Default configuration - shared between init() and reset_to_defaults()
json get_default_config() {
    return {{"log_level", "warn"},
            {"log_path", ""},
            {"templates_dir", "templates"},
            {"logo_catalog", ""},
            {"variations",
             {{"max_attempts", DEFAULT_MAX_ATTEMPTS}, {"target_count", DEFAULT_TARGET_VARIANTS}}},
            {"analysis", {{"containment_ratio", DEFAULT_CONTAINMENT_RATIO}}}};
}

} // namespace

Config::Config() : data(get_default_config()) {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        try {
            std::ifstream in(config_path);
            data = json::parse(in);
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}, using defaults", config_path,
                          e.what());
            data = get_default_config();
        }
    } else {
        spdlog::debug("[Config] No config at {}, using defaults", config_path);
        data = get_default_config();
    }

    if (!data.is_object()) {
        spdlog::warn("[Config] {} is not a JSON object, using defaults", config_path);
        data = get_default_config();
    }

    // Fill in any settings the file does not mention
    const json defaults = get_default_config();
    for (const auto& [key, value] : defaults.items()) {
        if (!data.contains(key) || data[key].is_null()) {
            data[key] = value;
        } else if (value.is_object() && data[key].is_object()) {
            for (const auto& [sub_key, sub_value] : value.items()) {
                if (!data[key].contains(sub_key)) {
                    data[key][sub_key] = sub_value;
                }
            }
        }
    }

    spdlog::debug("[Config] initialized: log_level={} templates_dir={}",
                  get<std::string>("/log_level"), get<std::string>("/templates_dir"));
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::debug("[Config] Saving config to {}", path);

    std::ofstream o(path);
    if (!o.is_open()) {
        spdlog::error("[Config] Failed to open config file for writing: {}", path);
        return false;
    }

    o << std::setw(2) << data << std::endl;

    if (!o.good()) {
        spdlog::error("[Config] Error writing to config file: {}", path);
        return false;
    }

    spdlog::debug("[Config] saved successfully to {}", path);
    return true;
}

void Config::reset_to_defaults() {
    spdlog::info("[Config] Resetting configuration to defaults");
    data = get_default_config();
}

VariationOptions Config::get_variation_options() {
    VariationOptions options;
    try {
        options.max_attempts =
            std::clamp(get<int>("/variations/max_attempts", DEFAULT_MAX_ATTEMPTS), 1, 100);
        options.target_variants =
            std::clamp(get<int>("/variations/target_count", DEFAULT_TARGET_VARIANTS), 0, 50);
    } catch (const json::exception& e) {
        spdlog::warn("[Config] Invalid /variations settings: {}, using defaults", e.what());
        options = VariationOptions{};
    }
    options.analysis = get_analysis_options();
    return options;
}

AnalysisOptions Config::get_analysis_options() {
    AnalysisOptions options;
    try {
        options.containment_ratio = std::clamp(
            get<double>("/analysis/containment_ratio", DEFAULT_CONTAINMENT_RATIO), 0.01, 1.0);
    } catch (const json::exception& e) {
        spdlog::warn("[Config] Invalid /analysis settings: {}, using defaults", e.what());
    }
    return options;
}

} // namespace cardforge
