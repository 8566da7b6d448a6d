// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "variation_generator.h"

#include "palette_generator.h"
#include "theme_applier.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <unordered_set>

namespace cardforge {

SeedSource sequential_seeds(const std::string& base) {
    auto counter = std::make_shared<int>(0);
    return [base, counter]() { return base + "-" + std::to_string(++*counter); };
}

SeedSource seed_list(std::vector<std::string> seeds) {
    if (seeds.empty()) {
        return {};
    }
    auto list = std::make_shared<std::vector<std::string>>(std::move(seeds));
    auto next = std::make_shared<size_t>(0);
    return [list, next]() {
        const size_t idx = *next < list->size() ? (*next)++ : list->size() - 1;
        return (*list)[idx];
    };
}

std::vector<CardTemplate> generate_variations(const CardTemplate& base,
                                              const VariationOptions& options,
                                              const LogoResolver* logo_resolver) {
    std::vector<CardTemplate> variations;
    variations.push_back(base);

    const int target = std::max(0, options.target_variants);
    const int max_attempts = std::max(0, options.max_attempts);

    // Geometry is constant across attempts, so analyze once
    std::optional<TemplateContextMap> context;
    const ThemeApplier applier(logo_resolver);

    std::unordered_set<std::string> seen_palettes;
    int accepted = 0;
    int attempts = 0;

    while (accepted < target && attempts < max_attempts) {
        ++attempts;

        std::optional<std::string> seed;
        if (options.seed_source) {
            seed = options.seed_source();
        }
        ColorPalette palette = generate_palette(seed);

        if (!seen_palettes.insert(palette.id).second) {
            spdlog::trace("[Variations] Skipping duplicate palette '{}'", palette.id);
            continue;
        }

        if (!context) {
            context = analyze_template(base, options.analysis);
        }

        variations.push_back(applier.apply(base, palette, *context));
        ++accepted;
    }

    if (accepted < target) {
        spdlog::debug("[Variations] Template '{}': only {} of {} variants after {} attempts",
                      base.id, accepted, target, attempts);
    } else {
        spdlog::debug("[Variations] Template '{}': {} variants in {} attempts", base.id, accepted,
                      attempts);
    }

    return variations;
}

} // namespace cardforge
