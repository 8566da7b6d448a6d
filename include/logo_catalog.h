// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file logo_catalog.h
 * @brief Catalog of logo families with per-color variants
 *
 * Each family ships the same mark in several colors ("White", "Black",
 * "Navy", ...). Templates are assigned a family; the variant is picked by the
 * luminance of the background the logo sits on.
 *
 * @threading Build on one thread, then read-only; resolve_logo() is const
 */

#pragma once

#include "logo_resolver.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cardforge {

struct LogoVariant {
    std::string color; ///< Color name, e.g. "White", "Navy", "Baby-Blue"
    std::string path;  ///< Asset path or SVG path data
};

struct LogoFamily {
    std::string id;
    std::string name;
    std::vector<LogoVariant> variants;
};

/**
 * @brief Colors derived from a logo variant
 */
struct LogoTheme {
    std::string primary;
    std::string secondary;
    std::string accent;
};

/**
 * @brief Approximate hex for a logo color name; "#000000" if unknown
 */
std::string hex_for_logo_color(const std::string& color_name);

/**
 * @brief Choose the variant that reads best on @p background_hex
 *
 * Dark backgrounds (luma < 128) prefer "White", then any non-"Black" variant;
 * light backgrounds prefer "Black", then any non-"White" variant. Falls back
 * to the first variant.
 *
 * @return Chosen variant, or nullptr if the family has no variants
 */
const LogoVariant* best_logo_variant(const std::string& background_hex, const LogoFamily& family);

/**
 * @brief Derive a three-color theme from a logo variant
 *
 * Black and white logos carry no brand hue and get a fixed blue/gold theme.
 * Other colors give {base, base darkened 20%, base brightened 40%}.
 */
LogoTheme theme_from_logo(const LogoVariant& variant);

class LogoCatalog : public LogoResolver {
  public:
    LogoCatalog() = default;

    /// Add or replace a family by id
    void add_family(LogoFamily family);

    /// Use family @p family_id for template @p template_id
    void assign(const std::string& template_id, const std::string& family_id);

    /// Family used for templates without an explicit assignment
    void set_default_family(const std::string& family_id);

    const LogoFamily* find_family(const std::string& family_id) const;

    /// Family for @p template_id: assigned, else default, else nullptr
    const LogoFamily* family_for_template(const std::string& template_id) const;

    size_t family_count() const {
        return families_.size();
    }

    std::optional<LogoAsset> resolve_logo(const std::string& template_id,
                                          const std::string& background_hex) const override;

    /**
     * @brief Build a catalog from JSON
     *
     * Format: {"families": [{"id", "name", "variants": [{"color", "path"}]}],
     *          "assignments": {"<template_id>": "<family_id>"},
     *          "default_family": "<family_id>"}
     *
     * @return Catalog, or nullopt if the document is malformed
     */
    static std::optional<LogoCatalog> from_json(const nlohmann::json& json);

    /**
     * @brief Load a catalog JSON file
     * @return Catalog, or nullopt if the file is missing or malformed
     */
    static std::optional<LogoCatalog> load_from_file(const std::string& filepath);

  private:
    std::map<std::string, LogoFamily> families_;
    std::map<std::string, std::string> assignments_;
    std::string default_family_;
};

} // namespace cardforge
