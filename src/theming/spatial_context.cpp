// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "spatial_context.h"

#include "layer_capabilities.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace cardforge {

namespace {

bool sits_on(const BoundingBox& surface, const BoundingBox& target, double ratio) {
    if (surface.area() <= 0.0) {
        return false;
    }
    if (surface.contains(target)) {
        return true;
    }
    const double target_area = target.area();
    if (target_area <= 0.0) {
        return false;
    }
    return surface.intersection_area(target) / target_area >= ratio;
}

} // namespace

TemplateContextMap analyze_template(const CardTemplate& templ, const AnalysisOptions& options) {
    const double ratio = std::clamp(options.containment_ratio, 0.01, 1.0);

    const size_t count = templ.layers.size();
    std::vector<BoundingBox> bounds;
    std::vector<bool> surfaces;
    bounds.reserve(count);
    surfaces.reserve(count);
    for (const auto& layer : templ.layers) {
        bounds.push_back(layer_bounds(layer));
        surfaces.push_back(get_layer_capabilities(layer.type).is_surface);
    }

    TemplateContextMap map;
    for (size_t i = 0; i < count; ++i) {
        LayerContext context;

        // Nearest candidate beneath wins
        for (size_t j = i; j-- > 0;) {
            if (!surfaces[j]) {
                continue;
            }
            if (sits_on(bounds[j], bounds[i], ratio)) {
                context.background_layer_id = templ.layers[j].id;
                break;
            }
        }

        spdlog::trace("[SpatialContext] {} '{}' sits on '{}'", templ.layers[i].serialized_type(),
                      templ.layers[i].id, context.background_layer_id);

        if (!map.emplace(templ.layers[i].id, context).second) {
            spdlog::warn("[SpatialContext] Duplicate layer id '{}' in template '{}', keeping first",
                         templ.layers[i].id, templ.id);
        }
    }

    spdlog::debug("[SpatialContext] Analyzed {} layers of template '{}'", count, templ.id);
    return map;
}

const LayerContext& context_for(const TemplateContextMap& map, const std::string& layer_id) {
    static const LayerContext main_background{};
    auto it = map.find(layer_id);
    return it != map.end() ? it->second : main_background;
}

} // namespace cardforge
