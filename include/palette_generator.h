// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file palette_generator.h
 * @brief Seeded, tone-constrained procedural palette generation
 *
 * A palette is drawn from one of three tone envelopes (Corporate, Modern,
 * Creative) and one of three background modes (Light, Dark, Bold). Text colors
 * are then chosen for contrast against the generated background.
 *
 * @threading Pure functions; safe to call concurrently
 */

#pragma once

#include <array>
#include <optional>
#include <string>

namespace cardforge {

/**
 * @brief Seven role-bound colors plus a dark/light flag
 *
 * Every color is an uppercase "#RRGGBB" string.
 */
struct ColorPalette {
    std::string id;   // "gen_<seed>"
    std::string name; // e.g. "Corporate Dark"
    std::string primary;
    std::string secondary;
    std::string accent;
    std::string background;
    std::string text;
    std::string subtext;
    bool is_dark = false;

    /** @brief Check all colors are "#RRGGBB" and id is set */
    bool is_valid() const;

    bool operator==(const ColorPalette& other) const;
    bool operator!=(const ColorPalette& other) const {
        return !(*this == other);
    }
};

enum class Tone { CORPORATE, MODERN, CREATIVE };

enum class BackgroundMode { LIGHT, DARK, BOLD };

/**
 * @brief HSL envelope a tone samples its base color from
 */
struct ToneRange {
    Tone tone;
    const char* name;
    double weight; // Probability of selection
    double hue_min;
    double hue_max;
    double sat_min;
    double sat_max;
    double light_min;
    double light_max;
};

/// Tone envelopes in draw order
const std::array<ToneRange, 3>& tone_ranges();

const ToneRange& tone_range(Tone tone);

const char* tone_name(Tone tone);
const char* background_mode_name(BackgroundMode mode);

/// Subtext gray used on dark backgrounds
constexpr const char* SUBTEXT_ON_DARK = "#CBD5E1";
/// Subtext gray used on light backgrounds
constexpr const char* SUBTEXT_ON_LIGHT = "#64748B";

/**
 * @brief Palette plus the draws that produced it
 *
 * Exposes the intermediate choices for tests and diagnostics.
 */
struct PaletteGeneration {
    ColorPalette palette;
    std::string seed;
    Tone tone = Tone::CORPORATE;
    BackgroundMode mode = BackgroundMode::LIGHT;
    double base_hue = 0.0;
};

/**
 * @brief Generate a palette and report the intermediate draws
 * @param seed Seed string; a random 7-character base36 seed if nullopt
 */
PaletteGeneration generate_palette_detailed(const std::optional<std::string>& seed = std::nullopt);

/**
 * @brief Generate a palette from a seed
 *
 * Identical seeds always give identical palettes.
 *
 * @param seed Seed string; a random 7-character base36 seed if nullopt
 */
ColorPalette generate_palette(const std::optional<std::string>& seed = std::nullopt);

} // namespace cardforge
