// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "color_space.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace cardforge::color {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f')
        return 10 + (c - 'a');
    return -1;
}

uint8_t clamp_channel(double value) {
    return static_cast<uint8_t>(std::clamp(value, 0.0, 255.0));
}

double wrap_hue(double h) {
    h = std::fmod(h, 360.0);
    if (h < 0.0)
        h += 360.0;
    return h;
}

} // namespace

Hsl Hsl::rotate(double degrees) const {
    return Hsl{wrap_hue(h + degrees + 360.0), s, l};
}

std::string Hsl::to_hex() const {
    return hsl_to_hex(h, s, l);
}

std::optional<Rgb> parse_hex(const std::string& hex) {
    if (hex.empty() || hex[0] != '#') {
        return std::nullopt;
    }

    const size_t digits = hex.size() - 1;
    if (digits != 3 && digits != 6) {
        return std::nullopt;
    }

    int values[6] = {0, 0, 0, 0, 0, 0};
    for (size_t i = 0; i < digits; ++i) {
        values[i] = hex_digit(hex[i + 1]);
        if (values[i] < 0) {
            return std::nullopt;
        }
    }

    if (digits == 3) {
        // #RGB expands each nibble: #abc -> #aabbcc
        return Rgb{static_cast<uint8_t>(values[0] * 17), static_cast<uint8_t>(values[1] * 17),
                   static_cast<uint8_t>(values[2] * 17)};
    }
    return Rgb{static_cast<uint8_t>(values[0] * 16 + values[1]),
               static_cast<uint8_t>(values[2] * 16 + values[3]),
               static_cast<uint8_t>(values[4] * 16 + values[5])};
}

Rgb parse_hex_or_black(const std::string& hex) {
    auto rgb = parse_hex(hex);
    if (!rgb) {
        spdlog::debug("[ColorSpace] Invalid hex color '{}', treating as black", hex);
        return FALLBACK_RGB;
    }
    return *rgb;
}

bool is_valid_hex(const std::string& hex) {
    return hex.size() == 7 && parse_hex(hex).has_value();
}

std::string rgb_to_hex(const Rgb& rgb) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", rgb.r, rgb.g, rgb.b);
    return buf;
}

std::string hsl_to_hex(double h, double s, double l) {
    h = wrap_hue(h);
    const double sat = std::clamp(s, 0.0, 100.0) / 100.0;
    const double light = std::clamp(l, 0.0, 100.0) / 100.0;

    const double c = (1.0 - std::fabs(2.0 * light - 1.0)) * sat;
    const double x = c * (1.0 - std::fabs(std::fmod(h / 60.0, 2.0) - 1.0));
    const double m = light - c / 2.0;

    double r = 0.0, g = 0.0, b = 0.0;
    if (h < 60.0) {
        r = c;
        g = x;
    } else if (h < 120.0) {
        r = x;
        g = c;
    } else if (h < 180.0) {
        g = c;
        b = x;
    } else if (h < 240.0) {
        g = x;
        b = c;
    } else if (h < 300.0) {
        r = x;
        b = c;
    } else {
        r = c;
        b = x;
    }

    return rgb_to_hex(Rgb{clamp_channel(std::round((r + m) * 255.0)),
                          clamp_channel(std::round((g + m) * 255.0)),
                          clamp_channel(std::round((b + m) * 255.0))});
}

Hsl rgb_to_hsl(const Rgb& rgb) {
    const double r = rgb.r / 255.0;
    const double g = rgb.g / 255.0;
    const double b = rgb.b / 255.0;

    const double max = std::max({r, g, b});
    const double min = std::min({r, g, b});
    const double delta = max - min;
    const double l = (max + min) / 2.0;

    if (delta == 0.0) {
        return Hsl{0.0, 0.0, l * 100.0};
    }

    const double s = delta / (1.0 - std::fabs(2.0 * l - 1.0));

    double h;
    if (max == r) {
        h = 60.0 * std::fmod((g - b) / delta, 6.0);
    } else if (max == g) {
        h = 60.0 * ((b - r) / delta + 2.0);
    } else {
        h = 60.0 * ((r - g) / delta + 4.0);
    }

    return Hsl{wrap_hue(h), std::clamp(s * 100.0, 0.0, 100.0), l * 100.0};
}

Hsl hex_to_hsl(const std::string& hex) {
    return rgb_to_hsl(parse_hex_or_black(hex));
}

std::string rotate_hue(const std::string& hex, double degrees) {
    return hex_to_hsl(hex).rotate(degrees).to_hex();
}

std::string adjust_brightness(const std::string& hex, double percent) {
    Rgb rgb = parse_hex_or_black(hex);
    const double amount = std::round(2.55 * percent);
    return rgb_to_hex(Rgb{clamp_channel(rgb.r + amount), clamp_channel(rgb.g + amount),
                          clamp_channel(rgb.b + amount)});
}

} // namespace cardforge::color
