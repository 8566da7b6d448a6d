// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "card_template.h"

#include <optional>
#include <string_view>
#include <vector>

/**
 * @file background_presets.h
 * @brief Static catalog of card background presets
 *
 * Solid fills, two-stop gradients and seamless SVG patterns. Pattern images
 * are inline data URIs so they render without any asset lookup.
 */

namespace cardforge::backgrounds {

/**
 * @brief One named background preset
 */
struct BackgroundPreset {
    const char* id;                ///< Stable id, e.g. "grad-sunset"
    const char* name;              ///< Display name
    BackgroundType type;           ///< solid / gradient / pattern
    const char* color1;            ///< Base color
    const char* color2;            ///< Gradient end color, nullptr otherwise
    const char* pattern_image_url; ///< Pattern data URI, nullptr otherwise
    double rotation;               ///< Gradient angle in degrees
    double scale;                  ///< Pattern scale

    /// Expand to a BackgroundPattern with opacity 1
    BackgroundPattern to_pattern() const {
        BackgroundPattern pattern;
        pattern.type = type;
        pattern.type_name = background_type_name(type);
        pattern.color1 = color1;
        if (color2) {
            pattern.color2 = std::string(color2);
        }
        if (pattern_image_url) {
            pattern.pattern_image_url = std::string(pattern_image_url);
            pattern.scale = scale;
        }
        if (type == BackgroundType::GRADIENT) {
            pattern.rotation = rotation;
        }
        pattern.opacity = 1.0;
        return pattern;
    }
};

// clang-format off
inline constexpr const char* DOT_PATTERN_URI =
    "data:image/svg+xml,%3Csvg width='20' height='20' viewBox='0 0 20 20' xmlns='http://www.w3.org/2000/svg'%3E"
    "%3Cg fill='%239C92AC' fill-opacity='0.2' fill-rule='evenodd'%3E%3Ccircle cx='3' cy='3' r='3'/%3E"
    "%3Ccircle cx='13' cy='13' r='3'/%3E%3C/g%3E%3C/svg%3E";

inline constexpr const char* DIAGONAL_PATTERN_URI =
    "data:image/svg+xml,%3Csvg width='40' height='40' viewBox='0 0 40 40' xmlns='http://www.w3.org/2000/svg'%3E"
    "%3Cg fill-rule='evenodd'%3E%3Cg fill='%239C92AC' fill-opacity='0.1'%3E"
    "%3Cpath d='M0 40L40 0H20L0 20M40 40V20L20 40'/%3E%3C/g%3E%3C/g%3E%3C/svg%3E";

inline constexpr const char* GRID_PATTERN_URI =
    "data:image/svg+xml,%3Csvg width='40' height='40' viewBox='0 0 40 40' xmlns='http://www.w3.org/2000/svg'%3E"
    "%3Cpath d='M0 0h40v40H0V0zm1 1h38v38H1V1z' fill='%23cccccc' fill-opacity='0.2' fill-rule='evenodd'/%3E"
    "%3C/svg%3E";

inline constexpr BackgroundPreset PRESETS[] = {
    // === Solid ===
    {"bg-white",      "Pure White",     BackgroundType::SOLID,    "#FFFFFF", nullptr,   nullptr,              0,   1},
    {"bg-slate-50",   "Soft Gray",      BackgroundType::SOLID,    "#F8FAFC", nullptr,   nullptr,              0,   1},
    {"bg-slate-900",  "Dark Mode",      BackgroundType::SOLID,    "#0F172A", nullptr,   nullptr,              0,   1},
    {"bg-blue-100",   "Pale Blue",      BackgroundType::SOLID,    "#DBEAFE", nullptr,   nullptr,              0,   1},

    // === Gradient ===
    {"grad-sunset",   "Sunset",         BackgroundType::GRADIENT, "#F59E0B", "#EF4444", nullptr,              45,  1},
    {"grad-ocean",    "Ocean Breeze",   BackgroundType::GRADIENT, "#06B6D4", "#3B82F6", nullptr,              90,  1},
    {"grad-purple",   "Mystic Purple",  BackgroundType::GRADIENT, "#8B5CF6", "#EC4899", nullptr,              135, 1},
    {"grad-midnight", "Midnight",       BackgroundType::GRADIENT, "#1E293B", "#0F172A", nullptr,              180, 1},

    // === Pattern ===
    {"pat-dots",      "Dot Grid",       BackgroundType::PATTERN,  "#FFFFFF", nullptr,   DOT_PATTERN_URI,      0,   1},
    {"pat-diagonal",  "Diagonal Lines", BackgroundType::PATTERN,  "#F8FAFC", nullptr,   DIAGONAL_PATTERN_URI, 0,   1},
    {"pat-grid",      "Technical Grid", BackgroundType::PATTERN,  "#FFFFFF", nullptr,   GRID_PATTERN_URI,     0,   1},
};
// clang-format on

/// Number of presets in the catalog
inline constexpr size_t PRESET_COUNT = sizeof(PRESETS) / sizeof(PRESETS[0]);

/**
 * @brief Find a preset by id
 * @return Preset if found, std::nullopt otherwise
 */
inline std::optional<BackgroundPreset> find_preset(std::string_view id) {
    for (const auto& preset : PRESETS) {
        if (id == preset.id) {
            return preset;
        }
    }
    return std::nullopt;
}

/**
 * @brief All presets of one background type, in catalog order
 */
inline std::vector<BackgroundPreset> presets_by_type(BackgroundType type) {
    std::vector<BackgroundPreset> result;
    for (const auto& preset : PRESETS) {
        if (preset.type == type) {
            result.push_back(preset);
        }
    }
    return result;
}

/// Background of a freshly created card: solid white
inline BackgroundPattern default_background() {
    return PRESETS[0].to_pattern();
}

} // namespace cardforge::backgrounds
