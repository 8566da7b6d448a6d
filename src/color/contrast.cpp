// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "contrast.h"

#include "color_space.h"

#include <algorithm>

namespace cardforge::contrast {

double luminance(const std::string& hex) {
    color::Rgb rgb = color::parse_hex_or_black(hex);
    return 0.2126 * rgb.r + 0.7152 * rgb.g + 0.0722 * rgb.b;
}

double contrast_ratio(const std::string& a, const std::string& b) {
    const double la = luminance(a) / 255.0;
    const double lb = luminance(b) / 255.0;
    const double lighter = std::max(la, lb);
    const double darker = std::min(la, lb);
    return (lighter + 0.05) / (darker + 0.05);
}

bool is_dark(const std::string& hex) {
    return luminance(hex) < DARK_LUMA_THRESHOLD;
}

bool collides(const std::string& a, const std::string& b) {
    return contrast_ratio(a, b) < COLLISION;
}

bool prefers_light_text(const std::string& background) {
    return contrast_ratio(background, WHITE) > contrast_ratio(background, BLACK);
}

} // namespace cardforge::contrast
