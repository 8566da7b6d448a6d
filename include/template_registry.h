// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file template_registry.h
 * @brief Catalog of base templates and their generated variants
 *
 * Variants are generated lazily, one base at a time, and memoized under a hash
 * of the base template's content. Any change to a base (geometry included)
 * changes its hash, so stale variants are regenerated instead of served.
 *
 * @threading All public methods lock an internal mutex
 */

#pragma once

#include "card_template.h"
#include "logo_resolver.h"
#include "variation_generator.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cardforge {

enum class SortOption { NONE, POPULAR, NEWEST, NAME };

/// "popular" / "newest" / "name"; anything else is NONE
SortOption sort_option_from_string(const std::string& name);

struct TemplateFilter {
    std::string search;   ///< Case-insensitive match on name, tags, category
    std::string category; ///< Exact category; empty or "All" disables
    std::string tone;     ///< Exact tone; empty or "All" disables
    std::string color;    ///< Substring of a template color, or an exact tag
    std::vector<std::string> tags; ///< Template must carry at least one
    SortOption sort_by = SortOption::NONE;
};

/**
 * @brief 64-bit FNV-1a hash of a template's serialised content
 */
uint64_t template_content_hash(const CardTemplate& templ);

class TemplateRegistry {
  public:
    /**
     * @param options Variation settings used for every base
     * @param logo_resolver Logo lookup, not owned; may be nullptr
     * @param shuffle_seed Seed for the listing order
     */
    explicit TemplateRegistry(VariationOptions options = {},
                              const LogoResolver* logo_resolver = nullptr,
                              std::string shuffle_seed = "registry");

    /// Add a base template, replacing any base with the same id
    void add_base_template(CardTemplate templ);

    /// @return true if a base with @p id was removed
    bool remove_base_template(const std::string& id);

    size_t base_count() const;

    /// Every base and variant, in shuffled order
    std::vector<CardTemplate> get_all_templates();

    std::optional<CardTemplate> get_template_by_id(const std::string& id);

    /**
     * @brief Like get_template_by_id, but a missing id is an error
     * @throws std::out_of_range if no template has @p id
     */
    CardTemplate require_template(const std::string& id);

    std::vector<CardTemplate> get_templates(const TemplateFilter& filter);

    /// Sorted unique non-empty categories
    std::vector<std::string> get_categories();

    /// Curated color names offered as filters
    static const std::vector<std::string>& available_colors();

    /// Drop every memoized variant
    void invalidate();

    /// Number of bases with memoized variants
    size_t cached_base_count() const;

  private:
    struct CacheEntry {
        uint64_t content_hash = 0;
        std::vector<CardTemplate> variants;
    };

    const std::vector<CardTemplate>& listing_locked();

    mutable std::mutex mutex_;
    std::vector<CardTemplate> bases_;
    std::map<std::string, CacheEntry> cache_;
    std::vector<CardTemplate> listing_;
    bool listing_valid_ = false;

    VariationOptions options_;
    const LogoResolver* logo_resolver_;
    std::string shuffle_seed_;
};

} // namespace cardforge
