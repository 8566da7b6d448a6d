// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file theme_applier.h
 * @brief Applies a ColorPalette to a CardTemplate with contrast guarantees
 *
 * Layers are colored in paint order so every layer knows the color actually
 * behind it:
 * - Shapes take the primary color, or the secondary when the primary would
 *   vanish into what is behind them
 * - Text takes the higher-contrast polarity, or the brand color for large
 *   titles that still read well
 * - Lines and arrows take the primary color
 * - Logos are swapped for the variant that suits their background
 *
 * The input template is never modified.
 *
 * @threading apply() is const and keeps no state; safe to call concurrently
 */

#pragma once

#include "card_template.h"
#include "logo_resolver.h"
#include "palette_generator.h"
#include "spatial_context.h"

#include <map>
#include <optional>
#include <string>

namespace cardforge {

/// Default font size assumed for text layers without one
constexpr double DEFAULT_FONT_SIZE = 16.0;
/// Text above this size may use the brand color
constexpr double LARGE_TEXT_FONT_SIZE = 18.0;

constexpr const char* PATTERN_COLOR_ON_DARK = "rgba(255,255,255,0.07)";
constexpr const char* PATTERN_COLOR_ON_LIGHT = "rgba(0,0,0,0.05)";

/**
 * @brief Color decision for one layer
 */
struct LayerColorAssignment {
    /// Color painted directly behind the layer
    std::string effective_background;
    /// Fill after theming; nullopt or "transparent" for unfilled layers
    std::optional<std::string> fill;

    bool is_transparent() const {
        return !fill || fill->empty() || *fill == TRANSPARENT_FILL;
    }
};

using LayerColorMap = std::map<std::string, LayerColorAssignment>;

/**
 * @brief Rewrite a background for a palette
 *
 * solid -> color1; gradient -> color1 + color2; pattern -> color1 +
 * patternColor; texture -> overlayColor + color1. A missing background
 * becomes solid. Unknown types are returned unchanged.
 */
BackgroundPattern theme_background(const std::optional<BackgroundPattern>& background,
                                   const ColorPalette& palette);

/**
 * @brief Fill for a filled shape painted over @p effective_bg
 *
 * Primary unless it collides with the background, then secondary. When both
 * collide, the palette's text/background color with more contrast, and as a
 * last resort white or black.
 */
std::string pick_shape_fill(const std::string& effective_bg, const ColorPalette& palette);

/**
 * @brief Fill for text of @p font_size painted over @p effective_bg
 */
std::string pick_text_color(const std::string& effective_bg, const ColorPalette& palette,
                            double font_size);

class ThemeApplier {
  public:
    /**
     * @param logo_resolver Logo lookup, not owned; nullptr leaves logos unchanged
     */
    explicit ThemeApplier(const LogoResolver* logo_resolver = nullptr);

    /**
     * @brief Decide the fill and effective background of every layer
     *
     * @param templ Template to color
     * @param palette Palette to apply
     * @param context Context map from analyze_template() for @p templ
     */
    LayerColorMap assign_colors(const CardTemplate& templ, const ColorPalette& palette,
                                const TemplateContextMap& context) const;

    /**
     * @brief Produce a themed copy of @p templ
     *
     * The result has id "<templ.id>_<palette.id>", name
     * "<templ.name> (<palette.name>)" and colors {background, primary,
     * secondary}.
     */
    CardTemplate apply(const CardTemplate& templ, const ColorPalette& palette,
                       const TemplateContextMap& context) const;

    /// Analyze @p templ and apply @p palette
    CardTemplate apply(const CardTemplate& templ, const ColorPalette& palette) const;

  private:
    void apply_logo(Layer& layer, const std::string& template_id,
                    const std::string& background_hex) const;

    const LogoResolver* logo_resolver_;
};

/**
 * @brief Convenience wrapper: analyze and apply in one call
 */
CardTemplate apply_palette(const CardTemplate& templ, const ColorPalette& palette,
                           const LogoResolver* logo_resolver = nullptr);

} // namespace cardforge
