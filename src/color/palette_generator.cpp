// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "palette_generator.h"

#include "color_space.h"
#include "contrast.h"
#include "seeded_random.h"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace cardforge {

namespace {

// clang-format off
const std::array<ToneRange, 3> TONE_RANGES = {{
    // tone              name         weight  hue         sat       light
    {Tone::CORPORATE, "Corporate", 0.40,  180, 270,   30, 60,   40, 60},  // Blue / cyan / teal
    {Tone::MODERN,    "Modern",    0.40,  240, 320,   50, 80,   30, 50},  // Purple / violet
    {Tone::CREATIVE,  "Creative",  0.20,    0,  60,   60, 80,   50, 75},  // Warm
}};
// clang-format on

constexpr double LIGHT_MODE_WEIGHT = 0.30;
constexpr double DARK_MODE_WEIGHT = 0.40;

constexpr double DARK_HUE_JITTER = 15.0;

Tone draw_tone(SeededRandom& rng) {
    const double roll = rng.next();
    double cumulative = 0.0;
    for (const auto& range : TONE_RANGES) {
        cumulative += range.weight;
        if (roll < cumulative) {
            return range.tone;
        }
    }
    return TONE_RANGES.back().tone;
}

BackgroundMode draw_background_mode(SeededRandom& rng) {
    const double roll = rng.next();
    if (roll < LIGHT_MODE_WEIGHT) {
        return BackgroundMode::LIGHT;
    }
    if (roll < LIGHT_MODE_WEIGHT + DARK_MODE_WEIGHT) {
        return BackgroundMode::DARK;
    }
    return BackgroundMode::BOLD;
}

color::Hsl draw_background(SeededRandom& rng, BackgroundMode mode, double base_hue) {
    switch (mode) {
    case BackgroundMode::LIGHT: {
        // Near-white, tinted with the brand hue
        double s = rng.range(5, 20);
        double l = rng.range(92, 98);
        return color::Hsl{base_hue, s, l};
    }
    case BackgroundMode::DARK: {
        // Near-black with a slight hue drift
        double offset = rng.range(-DARK_HUE_JITTER, DARK_HUE_JITTER);
        double s = rng.range(10, 30);
        double l = rng.range(5, 15);
        return color::Hsl{base_hue, s, l}.rotate(offset);
    }
    case BackgroundMode::BOLD:
    default: {
        // The background is the brand color itself
        double s = rng.range(60, 90);
        double l = rng.range(25, 45);
        return color::Hsl{base_hue, s, l};
    }
    }
}

void choose_text_colors(ColorPalette& palette) {
    const double white_contrast = contrast::contrast_ratio(palette.background, contrast::WHITE);
    const double black_contrast = contrast::contrast_ratio(palette.background, contrast::BLACK);

    if (white_contrast > black_contrast) {
        const bool soft_ok = contrast::contrast_ratio(palette.background, contrast::SOFT_WHITE) >=
                             contrast::AA_NORMAL_TEXT;
        palette.text = soft_ok ? contrast::SOFT_WHITE : contrast::WHITE;
        palette.subtext = SUBTEXT_ON_DARK;
    } else {
        const bool soft_ok = contrast::contrast_ratio(palette.background, contrast::SOFT_BLACK) >=
                             contrast::AA_NORMAL_TEXT;
        palette.text = soft_ok ? contrast::SOFT_BLACK : contrast::BLACK;
        palette.subtext = SUBTEXT_ON_LIGHT;
    }
}

} // namespace

bool ColorPalette::is_valid() const {
    if (id.empty()) {
        return false;
    }
    for (const auto* c : {&primary, &secondary, &accent, &background, &text, &subtext}) {
        if (!color::is_valid_hex(*c)) {
            return false;
        }
    }
    return true;
}

bool ColorPalette::operator==(const ColorPalette& other) const {
    return id == other.id && name == other.name && primary == other.primary &&
           secondary == other.secondary && accent == other.accent &&
           background == other.background && text == other.text && subtext == other.subtext &&
           is_dark == other.is_dark;
}

const std::array<ToneRange, 3>& tone_ranges() {
    return TONE_RANGES;
}

const ToneRange& tone_range(Tone tone) {
    for (const auto& range : TONE_RANGES) {
        if (range.tone == tone) {
            return range;
        }
    }
    throw std::out_of_range("Unknown tone");
}

const char* tone_name(Tone tone) {
    return tone_range(tone).name;
}

const char* background_mode_name(BackgroundMode mode) {
    switch (mode) {
    case BackgroundMode::LIGHT:
        return "Light";
    case BackgroundMode::DARK:
        return "Dark";
    case BackgroundMode::BOLD:
        return "Bold";
    }
    return "Light";
}

PaletteGeneration generate_palette_detailed(const std::optional<std::string>& seed) {
    PaletteGeneration result;
    result.seed = seed ? *seed : SeededRandom::random_seed();

    SeededRandom rng(result.seed);

    // 1. Tone envelope
    result.tone = draw_tone(rng);
    const ToneRange& range = tone_range(result.tone);

    // 2. Base hue
    result.base_hue = rng.range(range.hue_min, range.hue_max);

    // 3. Monochromatic high-saturation accent; primary is the accent
    const double accent_s = rng.range(70, 95);
    const double accent_l = rng.range(45, 60);
    const color::Hsl accent{result.base_hue, accent_s, accent_l};

    // 4. Background
    result.mode = draw_background_mode(rng);
    const color::Hsl surface = draw_background(rng, result.mode, result.base_hue);

    ColorPalette& palette = result.palette;
    palette.id = "gen_" + result.seed;
    palette.accent = accent.to_hex();
    palette.primary = palette.accent;
    // 5. Complementary secondary
    palette.secondary = accent.rotate(180).to_hex();
    palette.background = surface.to_hex();
    palette.is_dark = result.mode != BackgroundMode::LIGHT;

    // 6. Text polarity
    choose_text_colors(palette);

    // 7. Name
    palette.name = std::string(range.name) + (palette.is_dark ? " Dark" : " Light");

    spdlog::trace("[PaletteGenerator] seed='{}' tone={} mode={} hue={:.1f} -> bg={} primary={} "
                  "secondary={} text={}",
                  result.seed, range.name, background_mode_name(result.mode), result.base_hue,
                  palette.background, palette.primary, palette.secondary, palette.text);

    return result;
}

ColorPalette generate_palette(const std::optional<std::string>& seed) {
    return generate_palette_detailed(seed).palette;
}

} // namespace cardforge
