// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file card_template.h
 * @brief In-memory model of a business card template
 *
 * @pattern Plain value structs; copying a CardTemplate is a full deep copy
 * @threading Immutable once built; safe to share across threads read-only
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cardforge {

/// Standard card dimensions in canvas units
constexpr int STANDARD_CARD_WIDTH = 600;
constexpr int STANDARD_CARD_HEIGHT = 350;
constexpr const char* STANDARD_CARD_ORIENTATION = "horizontal";

/// Fill value meaning "no fill"
constexpr const char* TRANSPARENT_FILL = "transparent";

/**
 * @brief Layer kinds understood by the theming engine
 *
 * UNKNOWN keeps layers of unrecognised types; they pass through theming
 * untouched and are written back with their original type string.
 */
enum class LayerType {
    TEXT,
    RECT,
    CIRCLE,
    ELLIPSE,
    STAR,
    REGULAR_POLYGON,
    PATH,
    ICON,
    LINE,
    ARROW,
    IMAGE,
    UNKNOWN
};

/// Canonical type string ("Text", "Rect", ...); "Unknown" for UNKNOWN
const char* layer_type_name(LayerType type);

/// Case-sensitive lookup of the canonical type string
LayerType layer_type_from_string(const std::string& name);

struct Geometry {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    double rotation = 0.0; // Degrees, clockwise
};

struct Paint {
    std::optional<std::string> fill;
    std::optional<std::string> stroke;
    std::optional<double> stroke_width;
};

struct Layer {
    std::string id;
    LayerType type = LayerType::RECT;
    std::string type_name; // Original type string, kept for UNKNOWN layers
    Geometry geometry;
    Paint paint;
    double opacity = 1.0;

    std::optional<double> font_size;
    std::optional<std::string> text;
    std::optional<std::string> src;       // Image source
    std::optional<std::string> path_data; // SVG path data for Path/Icon

    bool is_logo = false;
    bool editable = true;
    bool locked = false;

    /// Props the model does not name; written back verbatim
    nlohmann::json extra_props = nlohmann::json::object();

    /// Fill unset, empty, or "transparent"
    bool has_transparent_fill() const;

    /// Stroke set and non-empty
    bool has_stroke() const;

    /// isLogo flag or one of the reserved logo ids
    bool is_logo_layer() const;

    /// Type string to serialise: canonical name, or type_name for UNKNOWN
    std::string serialized_type() const;
};

/// Layer ids treated as logos even without the isLogo flag
const std::vector<std::string>& reserved_logo_ids();

enum class BackgroundType { SOLID, GRADIENT, PATTERN, TEXTURE, UNKNOWN };

const char* background_type_name(BackgroundType type);
BackgroundType background_type_from_string(const std::string& name);

struct BackgroundPattern {
    BackgroundType type = BackgroundType::SOLID;
    std::string type_name = "solid";
    std::string color1 = "#FFFFFF";
    std::optional<std::string> color2;
    std::optional<std::string> pattern_image_url;
    std::optional<std::string> pattern_color;
    std::optional<std::string> overlay_color;
    std::optional<double> scale;
    std::optional<double> rotation;
    std::optional<double> opacity;

    bool operator==(const BackgroundPattern& other) const;
};

struct CardTemplate {
    std::string id;
    std::string name;
    int width = STANDARD_CARD_WIDTH;
    int height = STANDARD_CARD_HEIGHT;
    std::string orientation = STANDARD_CARD_ORIENTATION;

    // Catalog metadata, carried through theming unchanged
    std::string category;
    std::string tone;
    std::vector<std::string> tags;
    std::vector<std::string> colors;
    std::optional<std::string> thumbnail;

    std::optional<BackgroundPattern> background;
    std::vector<Layer> layers; // Index order is paint order, 0 = back

    /// Layer with @p id, or nullptr
    const Layer* find_layer(const std::string& id) const;

    /// Index of layer @p id in paint order, or -1
    int layer_index(const std::string& id) const;

    bool has_logo_layer() const;
};

} // namespace cardforge
