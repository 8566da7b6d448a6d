// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "template_registry.h"

#include "seeded_random.h"
#include "template_loader.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

namespace cardforge {

namespace {

constexpr uint64_t FNV_OFFSET = 14695981039346656037ull;
constexpr uint64_t FNV_PRIME = 1099511628211ull;

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains_ci(const std::string& haystack, const std::string& lowered_needle) {
    return to_lower(haystack).find(lowered_needle) != std::string::npos;
}

bool filter_enabled(const std::string& value) {
    return !value.empty() && value != "All";
}

bool matches(const CardTemplate& t, const TemplateFilter& filter) {
    if (!filter.search.empty()) {
        const std::string query = to_lower(filter.search);
        const bool hit = contains_ci(t.name, query) || contains_ci(t.category, query) ||
                         std::any_of(t.tags.begin(), t.tags.end(), [&](const std::string& tag) {
                             return contains_ci(tag, query);
                         });
        if (!hit) {
            return false;
        }
    }

    if (filter_enabled(filter.category) && t.category != filter.category) {
        return false;
    }

    if (filter_enabled(filter.tone) && t.tone != filter.tone) {
        return false;
    }

    if (!filter.color.empty()) {
        const std::string query = to_lower(filter.color);
        const bool hit =
            std::any_of(t.colors.begin(), t.colors.end(),
                        [&](const std::string& c) { return contains_ci(c, query); }) ||
            std::any_of(t.tags.begin(), t.tags.end(),
                        [&](const std::string& tag) { return to_lower(tag) == query; });
        if (!hit) {
            return false;
        }
    }

    if (!filter.tags.empty()) {
        const bool hit = std::any_of(filter.tags.begin(), filter.tags.end(), [&](const auto& tag) {
            return std::find(t.tags.begin(), t.tags.end(), tag) != t.tags.end();
        });
        if (!hit) {
            return false;
        }
    }

    return true;
}

void sort_templates(std::vector<CardTemplate>& templates, SortOption sort_by) {
    switch (sort_by) {
    case SortOption::NAME:
        std::stable_sort(templates.begin(), templates.end(),
                         [](const auto& a, const auto& b) { return a.name < b.name; });
        break;
    case SortOption::NEWEST:
        // Ids grow over time; no creation timestamp is stored
        std::stable_sort(templates.begin(), templates.end(),
                         [](const auto& a, const auto& b) { return a.id > b.id; });
        break;
    case SortOption::POPULAR:
        // No usage data yet: longer (more specific) names first
        std::stable_sort(templates.begin(), templates.end(), [](const auto& a, const auto& b) {
            return a.name.size() > b.name.size();
        });
        break;
    case SortOption::NONE:
        break;
    }
}

} // namespace

SortOption sort_option_from_string(const std::string& name) {
    if (name == "popular")
        return SortOption::POPULAR;
    if (name == "newest")
        return SortOption::NEWEST;
    if (name == "name")
        return SortOption::NAME;
    return SortOption::NONE;
}

uint64_t template_content_hash(const CardTemplate& templ) {
    const std::string content = template_to_json(templ).dump();
    uint64_t hash = FNV_OFFSET;
    for (unsigned char c : content) {
        hash ^= c;
        hash *= FNV_PRIME;
    }
    return hash;
}

TemplateRegistry::TemplateRegistry(VariationOptions options, const LogoResolver* logo_resolver,
                                   std::string shuffle_seed)
    : options_(std::move(options)), logo_resolver_(logo_resolver),
      shuffle_seed_(std::move(shuffle_seed)) {}

void TemplateRegistry::add_base_template(CardTemplate templ) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(bases_.begin(), bases_.end(),
                           [&](const CardTemplate& t) { return t.id == templ.id; });
    if (it != bases_.end()) {
        spdlog::debug("[TemplateRegistry] Replacing base template '{}'", templ.id);
        *it = std::move(templ);
    } else {
        spdlog::debug("[TemplateRegistry] Adding base template '{}'", templ.id);
        bases_.push_back(std::move(templ));
    }
    listing_valid_ = false;
}

bool TemplateRegistry::remove_base_template(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(bases_.begin(), bases_.end(),
                           [&](const CardTemplate& t) { return t.id == id; });
    if (it == bases_.end()) {
        return false;
    }
    bases_.erase(it);
    cache_.erase(id);
    listing_valid_ = false;
    return true;
}

size_t TemplateRegistry::base_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bases_.size();
}

const std::vector<CardTemplate>& TemplateRegistry::listing_locked() {
    // A base whose content changed since caching must be regenerated
    for (const auto& base : bases_) {
        const uint64_t hash = template_content_hash(base);
        auto it = cache_.find(base.id);
        if (it != cache_.end() && it->second.content_hash == hash) {
            continue;
        }
        if (it != cache_.end()) {
            spdlog::info("[TemplateRegistry] Base template '{}' changed, regenerating variants",
                         base.id);
        }
        CacheEntry entry;
        entry.content_hash = hash;
        entry.variants = generate_variations(base, options_, logo_resolver_);
        cache_[base.id] = std::move(entry);
        listing_valid_ = false;
    }

    if (listing_valid_) {
        return listing_;
    }

    listing_.clear();
    for (const auto& base : bases_) {
        const auto& variants = cache_[base.id].variants;
        listing_.insert(listing_.end(), variants.begin(), variants.end());
    }

    // Reproducible Fisher-Yates so variants of one base are spread out
    SeededRandom rng(shuffle_seed_);
    for (size_t i = listing_.size(); i > 1; --i) {
        const auto j = static_cast<size_t>(rng.next() * static_cast<double>(i));
        std::swap(listing_[i - 1], listing_[std::min(j, i - 1)]);
    }

    listing_valid_ = true;
    spdlog::debug("[TemplateRegistry] Listing rebuilt: {} templates from {} bases",
                  listing_.size(), bases_.size());
    return listing_;
}

std::vector<CardTemplate> TemplateRegistry::get_all_templates() {
    std::lock_guard<std::mutex> lock(mutex_);
    return listing_locked();
}

std::optional<CardTemplate> TemplateRegistry::get_template_by_id(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& t : listing_locked()) {
        if (t.id == id) {
            return t;
        }
    }
    return std::nullopt;
}

CardTemplate TemplateRegistry::require_template(const std::string& id) {
    auto templ = get_template_by_id(id);
    if (!templ) {
        throw std::out_of_range("Template with id \"" + id + "\" not found");
    }
    return *templ;
}

std::vector<CardTemplate> TemplateRegistry::get_templates(const TemplateFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CardTemplate> results;
    for (const auto& t : listing_locked()) {
        if (matches(t, filter)) {
            results.push_back(t);
        }
    }
    sort_templates(results, filter.sort_by);
    return results;
}

std::vector<std::string> TemplateRegistry::get_categories() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> categories;
    for (const auto& t : listing_locked()) {
        if (!t.category.empty()) {
            categories.insert(t.category);
        }
    }
    return {categories.begin(), categories.end()};
}

const std::vector<std::string>& TemplateRegistry::available_colors() {
    static const std::vector<std::string> colors = {"Blue",   "Red",  "Green", "Yellow",
                                                    "Purple", "Dark", "Light", "Gradient"};
    return colors;
}

void TemplateRegistry::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    listing_.clear();
    listing_valid_ = false;
}

size_t TemplateRegistry::cached_base_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

} // namespace cardforge
