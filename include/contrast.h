// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

/**
 * @file contrast.h
 * @brief Luminance and contrast-ratio evaluation with WCAG-style thresholds
 *
 * Luminance is BT.709 luma on raw 0-255 channels, without gamma
 * linearisation. The ratio keeps the WCAG shape, (L1 + 0.05) / (L2 + 0.05)
 * on luma normalised to [0,1], so identical colors give 1.0 and black/white
 * give 21.0.
 */

namespace cardforge::contrast {

/// AA for normal-size text
constexpr double AA_NORMAL_TEXT = 4.5;
/// AA for large text
constexpr double AA_LARGE_TEXT = 3.0;
/// Large titles may use the brand color above this ratio
constexpr double BRAND_TITLE = 3.5;
/// Below this ratio two colors are visually indistinguishable
constexpr double COLLISION = 1.6;

/// Backgrounds with luma below this count as dark (0-255 scale)
constexpr double DARK_LUMA_THRESHOLD = 128.0;

constexpr const char* WHITE = "#FFFFFF";
constexpr const char* BLACK = "#000000";
constexpr const char* SOFT_WHITE = "#F8FAFC";
constexpr const char* SOFT_BLACK = "#0F172A";

/**
 * @brief BT.709 luma: 0.2126 R + 0.7152 G + 0.0722 B
 * @param hex Color string; malformed input counts as black
 * @return Luma in [0,255]
 */
double luminance(const std::string& hex);

/**
 * @brief Contrast ratio between two colors, in [1, 21]
 *
 * Symmetric in its arguments. Malformed input counts as black.
 */
double contrast_ratio(const std::string& a, const std::string& b);

/// Luma below DARK_LUMA_THRESHOLD
bool is_dark(const std::string& hex);

/// True when contrast_ratio(a, b) < COLLISION
bool collides(const std::string& a, const std::string& b);

/**
 * @brief True if white text reads better than black text on @p background
 */
bool prefers_light_text(const std::string& background);

} // namespace cardforge::contrast
