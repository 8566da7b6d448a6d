// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "layer_capabilities.h"

#include <algorithm>
#include <cmath>

namespace cardforge {

namespace {

constexpr double PI = 3.14159265358979323846;

} // namespace

LayerCapabilities get_layer_capabilities(LayerType type) {
    LayerCapabilities caps;

    switch (type) {
    case LayerType::TEXT:
        caps.has_stroke = false;
        caps.can_edit_text = true;
        break;

    case LayerType::IMAGE:
        caps.has_fill = false;
        caps.has_crop = true;
        caps.has_filters = true;
        break;

    case LayerType::CIRCLE:
    case LayerType::ELLIPSE:
    case LayerType::STAR:
    case LayerType::REGULAR_POLYGON:
        caps.is_surface = true;
        caps.is_centered = true;
        break;

    case LayerType::RECT:
    case LayerType::PATH:
    case LayerType::ICON: // Icons are paths
        caps.is_surface = true;
        break;

    case LayerType::LINE:
    case LayerType::ARROW:
        caps.has_fill = false; // Stroke only
        break;

    case LayerType::UNKNOWN:
    default:
        break;
    }

    return caps;
}

double BoundingBox::area() const {
    return std::max(0.0, width()) * std::max(0.0, height());
}

bool BoundingBox::contains(const BoundingBox& other) const {
    return other.left >= left && other.top >= top && other.right <= right &&
           other.bottom <= bottom;
}

double BoundingBox::intersection_area(const BoundingBox& other) const {
    const double w = std::min(right, other.right) - std::max(left, other.left);
    const double h = std::min(bottom, other.bottom) - std::max(top, other.top);
    if (w <= 0.0 || h <= 0.0) {
        return 0.0;
    }
    return w * h;
}

BoundingBox layer_bounds(const Layer& layer) {
    const Geometry& g = layer.geometry;
    const bool centered = get_layer_capabilities(layer.type).is_centered;

    // Corners relative to the anchor point
    const double x0 = centered ? -g.width / 2.0 : 0.0;
    const double y0 = centered ? -g.height / 2.0 : 0.0;
    const double x1 = x0 + g.width;
    const double y1 = y0 + g.height;

    if (g.rotation == 0.0) {
        return BoundingBox{g.x + std::min(x0, x1), g.y + std::min(y0, y1),
                           g.x + std::max(x0, x1), g.y + std::max(y0, y1)};
    }

    const double rad = g.rotation * PI / 180.0;
    const double cos_r = std::cos(rad);
    const double sin_r = std::sin(rad);

    const double xs[4] = {x0, x1, x1, x0};
    const double ys[4] = {y0, y0, y1, y1};

    BoundingBox box{INFINITY, INFINITY, -INFINITY, -INFINITY};
    for (int i = 0; i < 4; ++i) {
        const double rx = xs[i] * cos_r - ys[i] * sin_r;
        const double ry = xs[i] * sin_r + ys[i] * cos_r;
        box.left = std::min(box.left, g.x + rx);
        box.top = std::min(box.top, g.y + ry);
        box.right = std::max(box.right, g.x + rx);
        box.bottom = std::max(box.bottom, g.y + ry);
    }
    return box;
}

} // namespace cardforge
