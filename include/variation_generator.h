// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file variation_generator.h
 * @brief Produces a deduplicated set of themed variants of a base template
 *
 * Variant 0 is always the unmodified base. Palettes are generated until the
 * target count is reached or the attempt budget runs out; palettes whose id
 * was already produced in this run are skipped. Running out of attempts gives
 * a shorter list, not an error.
 *
 * @threading Pure given a deterministic seed source; safe to call concurrently
 */

#pragma once

#include "card_template.h"
#include "logo_resolver.h"
#include "spatial_context.h"

#include <functional>
#include <string>
#include <vector>

namespace cardforge {

constexpr int DEFAULT_MAX_ATTEMPTS = 15;
constexpr int DEFAULT_TARGET_VARIANTS = 9;

/// Supplies the seed for each palette attempt
using SeedSource = std::function<std::string()>;

/**
 * @brief Seeds "<base>-1", "<base>-2", ... for reproducible runs
 */
SeedSource sequential_seeds(const std::string& base);

/**
 * @brief Seeds taken from @p seeds in order; the last one repeats afterwards
 *
 * An empty list yields random seeds.
 */
SeedSource seed_list(std::vector<std::string> seeds);

struct VariationOptions {
    int max_attempts = DEFAULT_MAX_ATTEMPTS;
    int target_variants = DEFAULT_TARGET_VARIANTS; // Excluding the base
    SeedSource seed_source;                        // Empty: random seeds
    AnalysisOptions analysis;
};

/**
 * @brief Generate themed variants of @p base
 *
 * @param base Base template; returned unchanged as element 0
 * @param options Attempt budget, target count and seed source
 * @param logo_resolver Logo lookup passed to the theme applier, may be nullptr
 * @return Between 1 and target_variants + 1 templates with unique ids
 */
std::vector<CardTemplate> generate_variations(const CardTemplate& base,
                                              const VariationOptions& options = {},
                                              const LogoResolver* logo_resolver = nullptr);

} // namespace cardforge
