// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <optional>
#include <string>

/**
 * @file color_space.h
 * @brief HSL / RGB / hex conversions used by palette generation and theming
 *
 * All hex strings produced here are uppercase "#RRGGBB". Parsing accepts
 * "#RGB" and "#RRGGBB" in any case. Malformed input never throws.
 */

namespace cardforge::color {

/**
 * @brief 8-bit RGB triple
 */
struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Rgb& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
};

/**
 * @brief HSL color: hue in [0,360), saturation and lightness in [0,100]
 */
struct Hsl {
    double h = 0.0;
    double s = 0.0;
    double l = 0.0;

    /// Returns a copy with hue rotated by @p degrees, wrapped into [0,360)
    Hsl rotate(double degrees) const;

    std::string to_hex() const;
};

/// Black, returned whenever a color cannot be parsed
constexpr Rgb FALLBACK_RGB{0, 0, 0};
constexpr const char* FALLBACK_HEX = "#000000";

/**
 * @brief Parse "#RGB" / "#RRGGBB"
 * @return Parsed color, or nullopt if the string is not a hex color
 */
std::optional<Rgb> parse_hex(const std::string& hex);

/**
 * @brief Parse a hex color, substituting black for malformed input
 */
Rgb parse_hex_or_black(const std::string& hex);

/// True for well-formed "#RRGGBB" strings
bool is_valid_hex(const std::string& hex);

std::string rgb_to_hex(const Rgb& rgb);

/**
 * @brief Convert HSL to "#RRGGBB"
 *
 * Standard chroma / intermediate / match construction. Each channel is
 * rounded after adding m and clamped to [0,255].
 *
 * @param h Hue in degrees, [0,360)
 * @param s Saturation, [0,100]
 * @param l Lightness, [0,100]
 */
std::string hsl_to_hex(double h, double s, double l);

Hsl rgb_to_hsl(const Rgb& rgb);

/// Hex -> HSL; malformed input converts as black
Hsl hex_to_hsl(const std::string& hex);

/**
 * @brief Rotate the hue of a hex color, keeping saturation and lightness
 * @param hex Color in "#RRGGBB" format
 * @param degrees Rotation, may be negative
 */
std::string rotate_hue(const std::string& hex, double degrees);

/**
 * @brief Shift every channel by round(2.55 * percent), clamped to [0,255]
 * @param hex Color in "#RRGGBB" format
 * @param percent Positive to brighten, negative to darken
 */
std::string adjust_brightness(const std::string& hex, double percent);

} // namespace cardforge::color
