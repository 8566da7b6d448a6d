// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __CARDFORGE_CONFIG_H__
#define __CARDFORGE_CONFIG_H__

#include "spatial_context.h"
#include "variation_generator.h"

#include <string>

#include <nlohmann/json.hpp>

namespace cardforge {

using json = nlohmann::json;

/// Default config file location, relative to the working directory
constexpr const char* DEFAULT_CONFIG_PATH = "config/cardforge.json";

class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    // Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config();
    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    // Load config from file path; a missing or unreadable file yields defaults
    void init(const std::string& config_path);

    // Template get/set with JSON pointer syntax
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (data.contains(ptr)) {
            return data[ptr].template get<T>();
        }
        return default_value;
    };

    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    // Get JSON sub-object
    json& get_json(const std::string& json_path);

    // Save current config to file
    bool save();

    // Get config file path
    std::string get_path();

    // Replace all settings with defaults (in memory)
    void reset_to_defaults();

    // Variation settings from /variations, clamped to sane ranges
    VariationOptions get_variation_options();

    // Spatial analysis settings from /analysis
    AnalysisOptions get_analysis_options();

    // Singleton accessor
    static Config* get_instance();
};

} // namespace cardforge

#endif // __CARDFORGE_CONFIG_H__
