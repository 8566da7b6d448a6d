// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "card_template.h"

#include <algorithm>

namespace cardforge {

namespace {

struct LayerTypeEntry {
    LayerType type;
    const char* name;
};

// clang-format off
constexpr LayerTypeEntry LAYER_TYPES[] = {
    {LayerType::TEXT,            "Text"},
    {LayerType::RECT,            "Rect"},
    {LayerType::CIRCLE,          "Circle"},
    {LayerType::ELLIPSE,         "Ellipse"},
    {LayerType::STAR,            "Star"},
    {LayerType::REGULAR_POLYGON, "RegularPolygon"},
    {LayerType::PATH,            "Path"},
    {LayerType::ICON,            "Icon"},
    {LayerType::LINE,            "Line"},
    {LayerType::ARROW,           "Arrow"},
    {LayerType::IMAGE,           "Image"},
};
// clang-format on

} // namespace

const char* layer_type_name(LayerType type) {
    for (const auto& entry : LAYER_TYPES) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "Unknown";
}

LayerType layer_type_from_string(const std::string& name) {
    for (const auto& entry : LAYER_TYPES) {
        if (name == entry.name) {
            return entry.type;
        }
    }
    return LayerType::UNKNOWN;
}

const std::vector<std::string>& reserved_logo_ids() {
    static const std::vector<std::string> ids = {"logo", "company_logo", "brand_logo"};
    return ids;
}

bool Layer::has_transparent_fill() const {
    return !paint.fill || paint.fill->empty() || *paint.fill == TRANSPARENT_FILL;
}

bool Layer::has_stroke() const {
    return paint.stroke && !paint.stroke->empty();
}

bool Layer::is_logo_layer() const {
    if (is_logo) {
        return true;
    }
    const auto& ids = reserved_logo_ids();
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

std::string Layer::serialized_type() const {
    if (type == LayerType::UNKNOWN) {
        return type_name;
    }
    return layer_type_name(type);
}

const char* background_type_name(BackgroundType type) {
    switch (type) {
    case BackgroundType::SOLID:
        return "solid";
    case BackgroundType::GRADIENT:
        return "gradient";
    case BackgroundType::PATTERN:
        return "pattern";
    case BackgroundType::TEXTURE:
        return "texture";
    default:
        return "unknown";
    }
}

BackgroundType background_type_from_string(const std::string& name) {
    if (name == "solid")
        return BackgroundType::SOLID;
    if (name == "gradient")
        return BackgroundType::GRADIENT;
    if (name == "pattern")
        return BackgroundType::PATTERN;
    if (name == "texture")
        return BackgroundType::TEXTURE;
    return BackgroundType::UNKNOWN;
}

bool BackgroundPattern::operator==(const BackgroundPattern& other) const {
    return type == other.type && type_name == other.type_name && color1 == other.color1 &&
           color2 == other.color2 && pattern_image_url == other.pattern_image_url &&
           pattern_color == other.pattern_color && overlay_color == other.overlay_color &&
           scale == other.scale && rotation == other.rotation && opacity == other.opacity;
}

const Layer* CardTemplate::find_layer(const std::string& layer_id) const {
    for (const auto& layer : layers) {
        if (layer.id == layer_id) {
            return &layer;
        }
    }
    return nullptr;
}

int CardTemplate::layer_index(const std::string& layer_id) const {
    for (size_t i = 0; i < layers.size(); ++i) {
        if (layers[i].id == layer_id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

bool CardTemplate::has_logo_layer() const {
    return std::any_of(layers.begin(), layers.end(),
                       [](const Layer& layer) { return layer.is_logo_layer(); });
}

} // namespace cardforge
