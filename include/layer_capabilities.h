// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "card_template.h"

/**
 * @file layer_capabilities.h
 * @brief Per-type capability flags and bounding-box geometry for layers
 */

namespace cardforge {

/**
 * @brief What a layer type supports
 */
struct LayerCapabilities {
    bool is_selectable = true;
    bool has_crop = false;
    bool has_fill = true;
    bool has_stroke = true;
    bool can_edit_points = false;
    bool can_edit_text = false;
    bool has_filters = false;

    /// Filled shape that other layers can sit on for contrast purposes
    bool is_surface = false;
    /// Positioned by its centre rather than its top-left corner
    bool is_centered = false;
};

LayerCapabilities get_layer_capabilities(LayerType type);

/**
 * @brief Axis-aligned rectangle in canvas units
 */
struct BoundingBox {
    double left = 0.0;
    double top = 0.0;
    double right = 0.0;
    double bottom = 0.0;

    double width() const {
        return right - left;
    }
    double height() const {
        return bottom - top;
    }
    double area() const;

    /// True if @p other lies entirely inside this box (edges inclusive)
    bool contains(const BoundingBox& other) const;

    /// Area of the intersection with @p other, 0 if disjoint
    double intersection_area(const BoundingBox& other) const;
};

/**
 * @brief Axis-aligned bounding box of a layer
 *
 * Centered types (Circle, Ellipse, Star, RegularPolygon) treat x/y as the
 * centre; all others as the top-left corner. Rotation turns the box about its
 * anchor and the result is the enclosing axis-aligned box.
 */
BoundingBox layer_bounds(const Layer& layer);

} // namespace cardforge
