// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "card_template.h"
#include "logo_resolver.h"
#include "palette_generator.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @file card_test_utils.h
 * @brief Builders for templates, layers and palettes used across unit tests
 */

namespace cardforge::test {

inline Layer make_layer(const std::string& id, LayerType type, double x, double y, double w,
                        double h, std::optional<std::string> fill = std::nullopt) {
    Layer layer;
    layer.id = id;
    layer.type = type;
    layer.type_name = layer_type_name(type);
    layer.geometry = Geometry{x, y, w, h, 0.0};
    layer.paint.fill = std::move(fill);
    return layer;
}

inline Layer make_rect(const std::string& id, double x, double y, double w, double h,
                       const std::string& fill = "#3B82F6") {
    return make_layer(id, LayerType::RECT, x, y, w, h, fill);
}

inline Layer make_text(const std::string& id, double x, double y, double w, double h,
                       double font_size = 16.0) {
    Layer layer = make_layer(id, LayerType::TEXT, x, y, w, h, std::string("#000000"));
    layer.font_size = font_size;
    layer.text = "Jane Doe";
    return layer;
}

inline CardTemplate make_template(const std::string& id, std::vector<Layer> layers) {
    CardTemplate templ;
    templ.id = id;
    templ.name = "Template " + id;
    templ.category = "Business";
    templ.tone = "Corporate";
    templ.layers = std::move(layers);
    return templ;
}

/// Business card with a header band, a text block on it, and free text
inline CardTemplate make_business_card() {
    return make_template("business", {
                                         make_rect("header", 0, 0, 600, 120),
                                         make_text("title", 40, 30, 300, 50, 32),
                                         make_text("tagline", 40, 200, 300, 24),
                                         make_rect("badge", 480, 220, 80, 80, "#F59E0B"),
                                         make_text("badge_label", 490, 245, 60, 20, 12),
                                     });
}

inline ColorPalette make_palette(const std::string& id, const std::string& primary,
                                 const std::string& secondary, const std::string& background,
                                 bool is_dark) {
    ColorPalette palette;
    palette.id = id;
    palette.name = id;
    palette.primary = primary;
    palette.secondary = secondary;
    palette.accent = primary;
    palette.background = background;
    palette.text = is_dark ? "#F8FAFC" : "#0F172A";
    palette.subtext = is_dark ? "#CBD5E1" : "#64748B";
    palette.is_dark = is_dark;
    return palette;
}

/// Resolver that records every request and answers with a fixed asset
class RecordingLogoResolver : public LogoResolver {
  public:
    explicit RecordingLogoResolver(std::optional<std::string> path) : path_(std::move(path)) {}

    std::optional<LogoAsset> resolve_logo(const std::string& template_id,
                                          const std::string& background_hex) const override {
        calls.emplace_back(template_id, background_hex);
        if (!path_) {
            return std::nullopt;
        }
        return LogoAsset{*path_};
    }

    mutable std::vector<std::pair<std::string, std::string>> calls;

  private:
    std::optional<std::string> path_;
};

} // namespace cardforge::test
