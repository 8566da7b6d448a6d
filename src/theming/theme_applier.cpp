// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "theme_applier.h"

#include "contrast.h"
#include "layer_capabilities.h"

#include <spdlog/spdlog.h>

namespace cardforge {

namespace {

/// Color behind a layer, looking through transparent layers
std::string resolve_effective_background(const LayerContext& context,
                                         const LayerColorMap& assigned,
                                         const ColorPalette& palette) {
    if (context.on_main_background()) {
        return palette.background;
    }

    auto it = assigned.find(context.background_layer_id);
    if (it == assigned.end()) {
        // Context map does not match this template
        spdlog::debug("[ThemeApplier] Background layer '{}' not assigned yet, using card background",
                      context.background_layer_id);
        return palette.background;
    }
    if (it->second.is_transparent()) {
        return it->second.effective_background;
    }
    return *it->second.fill;
}

} // namespace

BackgroundPattern theme_background(const std::optional<BackgroundPattern>& background,
                                   const ColorPalette& palette) {
    if (!background) {
        BackgroundPattern solid;
        solid.color1 = palette.background;
        return solid;
    }

    BackgroundPattern result = *background;
    switch (result.type) {
    case BackgroundType::SOLID:
        result.color1 = palette.background;
        break;
    case BackgroundType::GRADIENT:
        result.color1 = palette.background;
        result.color2 = palette.is_dark ? palette.primary : palette.secondary;
        break;
    case BackgroundType::PATTERN:
        result.color1 = palette.background;
        result.pattern_color = palette.is_dark ? PATTERN_COLOR_ON_DARK : PATTERN_COLOR_ON_LIGHT;
        break;
    case BackgroundType::TEXTURE:
        result.overlay_color = palette.background;
        result.color1 = palette.background;
        break;
    case BackgroundType::UNKNOWN:
        spdlog::debug("[ThemeApplier] Leaving unknown background type '{}' unchanged",
                      result.type_name);
        break;
    }
    return result;
}

std::string pick_shape_fill(const std::string& effective_bg, const ColorPalette& palette) {
    if (!contrast::collides(effective_bg, palette.primary)) {
        return palette.primary;
    }
    if (!contrast::collides(effective_bg, palette.secondary)) {
        return palette.secondary;
    }

    // Both brand colors vanish here; fall back to the neutral roles
    const std::string& neutral =
        contrast::contrast_ratio(effective_bg, palette.text) >=
                contrast::contrast_ratio(effective_bg, palette.background)
            ? palette.text
            : palette.background;
    if (!contrast::collides(effective_bg, neutral)) {
        return neutral;
    }
    return contrast::prefers_light_text(effective_bg) ? contrast::WHITE : contrast::BLACK;
}

std::string pick_text_color(const std::string& effective_bg, const ColorPalette& palette,
                            double font_size) {
    if (font_size > LARGE_TEXT_FONT_SIZE &&
        contrast::contrast_ratio(effective_bg, palette.primary) > contrast::BRAND_TITLE) {
        return palette.primary;
    }

    if (contrast::prefers_light_text(effective_bg)) {
        const bool soft_ok = contrast::contrast_ratio(effective_bg, contrast::SOFT_WHITE) >=
                             contrast::AA_NORMAL_TEXT;
        return soft_ok ? contrast::SOFT_WHITE : contrast::WHITE;
    }

    if (contrast::contrast_ratio(effective_bg, palette.text) > contrast::AA_NORMAL_TEXT) {
        return palette.text;
    }
    return contrast::BLACK;
}

ThemeApplier::ThemeApplier(const LogoResolver* logo_resolver) : logo_resolver_(logo_resolver) {}

LayerColorMap ThemeApplier::assign_colors(const CardTemplate& templ, const ColorPalette& palette,
                                          const TemplateContextMap& context) const {
    LayerColorMap assigned;

    for (const auto& layer : templ.layers) {
        LayerColorAssignment entry;
        entry.effective_background =
            resolve_effective_background(context_for(context, layer.id), assigned, palette);
        entry.fill = layer.paint.fill;

        const LayerCapabilities caps = get_layer_capabilities(layer.type);

        if (layer.is_logo_layer()) {
            // Logos keep their own paint; only the asset changes
        } else if (layer.type == LayerType::TEXT) {
            entry.fill = pick_text_color(entry.effective_background, palette,
                                         layer.font_size.value_or(DEFAULT_FONT_SIZE));
        } else if (caps.is_surface) {
            if (!layer.has_transparent_fill()) {
                entry.fill = pick_shape_fill(entry.effective_background, palette);
            }
        } else if (layer.type == LayerType::LINE || layer.type == LayerType::ARROW) {
            entry.fill = palette.primary;
        }

        spdlog::trace("[ThemeApplier] '{}' on {} -> {}", layer.id, entry.effective_background,
                      entry.fill.value_or(TRANSPARENT_FILL));

        assigned.emplace(layer.id, std::move(entry));
    }

    return assigned;
}

CardTemplate ThemeApplier::apply(const CardTemplate& templ, const ColorPalette& palette,
                                 const TemplateContextMap& context) const {
    const LayerColorMap assigned = assign_colors(templ, palette, context);

    CardTemplate themed = templ;
    themed.id = templ.id + "_" + palette.id;
    themed.name = templ.name + " (" + palette.name + ")";
    themed.colors = {palette.background, palette.primary, palette.secondary};
    themed.background = theme_background(templ.background, palette);

    for (auto& layer : themed.layers) {
        auto it = assigned.find(layer.id);
        if (it == assigned.end()) {
            continue;
        }
        const LayerColorAssignment& entry = it->second;
        const LayerCapabilities caps = get_layer_capabilities(layer.type);

        if (layer.is_logo_layer()) {
            apply_logo(layer, templ.id, entry.effective_background);
        } else if (layer.type == LayerType::TEXT) {
            layer.paint.fill = entry.fill;
        } else if (caps.is_surface) {
            if (!layer.has_transparent_fill()) {
                layer.paint.fill = entry.fill;
            }
            if (layer.has_stroke()) {
                layer.paint.stroke = palette.secondary;
            }
        } else if (layer.type == LayerType::LINE || layer.type == LayerType::ARROW) {
            layer.paint.fill = palette.primary;
            layer.paint.stroke = palette.primary;
        }
    }

    spdlog::debug("[ThemeApplier] Applied palette '{}' to template '{}' -> '{}'", palette.id,
                  templ.id, themed.id);
    return themed;
}

CardTemplate ThemeApplier::apply(const CardTemplate& templ, const ColorPalette& palette) const {
    return apply(templ, palette, analyze_template(templ));
}

void ThemeApplier::apply_logo(Layer& layer, const std::string& template_id,
                              const std::string& background_hex) const {
    if (!logo_resolver_) {
        return;
    }

    auto asset = logo_resolver_->resolve_logo(template_id, background_hex);
    if (!asset) {
        return;
    }

    if (layer.type == LayerType::IMAGE) {
        layer.src = asset->path;
    } else {
        layer.path_data = asset->path;
    }
}

CardTemplate apply_palette(const CardTemplate& templ, const ColorPalette& palette,
                           const LogoResolver* logo_resolver) {
    return ThemeApplier(logo_resolver).apply(templ, palette);
}

} // namespace cardforge
