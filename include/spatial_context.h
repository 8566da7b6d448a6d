// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file spatial_context.h
 * @brief Resolves which surface each layer is painted over
 *
 * For every layer, the layers beneath it are scanned from nearest to
 * farthest. The first surface layer whose bounding box contains (or mostly
 * overlaps) the layer's box is its background; with no such layer the card
 * background ("main_bg") is.
 *
 * The map is derived from geometry and paint order. It is rebuilt whenever
 * either changes and never patched in place.
 *
 * @threading Pure function; safe to call concurrently
 */

#pragma once

#include "card_template.h"

#include <map>
#include <string>

namespace cardforge {

/// Sentinel background id for the card's own background paint
constexpr const char* MAIN_BACKGROUND_ID = "main_bg";

/// Default fraction of a layer's box a surface must cover to count as beneath it
constexpr double DEFAULT_CONTAINMENT_RATIO = 0.9;

struct LayerContext {
    std::string background_layer_id = MAIN_BACKGROUND_ID;

    bool on_main_background() const {
        return background_layer_id == MAIN_BACKGROUND_ID;
    }

    bool operator==(const LayerContext& other) const {
        return background_layer_id == other.background_layer_id;
    }
    bool operator!=(const LayerContext& other) const {
        return !(*this == other);
    }
};

/// Layer id -> context, ordered for reproducible iteration and output
using TemplateContextMap = std::map<std::string, LayerContext>;

struct AnalysisOptions {
    /// Minimum covered fraction of the target box, in (0, 1]
    double containment_ratio = DEFAULT_CONTAINMENT_RATIO;
};

/**
 * @brief Compute the background context of every layer in @p templ
 *
 * Only surface layers (see LayerCapabilities::is_surface) are candidates.
 * A degenerate target box (zero width or height) qualifies only by full
 * containment.
 */
TemplateContextMap analyze_template(const CardTemplate& templ, const AnalysisOptions& options = {});

/**
 * @brief Context of @p layer_id, or main_bg if the layer is absent from @p map
 */
const LayerContext& context_for(const TemplateContextMap& map, const std::string& layer_id);

} // namespace cardforge
