// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logo_catalog.h"

#include "color_space.h"
#include "contrast.h"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace cardforge {

namespace {

struct NamedColor {
    const char* name;
    const char* hex;
};

// clang-format off
constexpr NamedColor LOGO_COLORS[] = {
    {"Black",       "#000000"},
    {"White",       "#FFFFFF"},
    {"Blue",        "#2563EB"},
    {"Green",       "#16A34A"},
    {"Red",         "#DC2626"},
    {"Purple",      "#9333EA"},
    {"Orange",      "#EA580C"},
    {"Yellow",      "#CA8A04"},
    {"Pink",        "#DB2777"},
    {"Navy",        "#1E3A8A"},
    {"Grey",        "#4B5563"},
    {"Mint",        "#34D399"},
    {"Gold",        "#D97706"},
    {"Silver",      "#9CA3AF"},
    {"Turquoise",   "#14B8A6"},
    {"Beige",       "#D6D3D1"},
    {"Mustard",     "#B45309"},
    {"Salmon",      "#FB7185"},
    {"Baby-Blue",   "#60A5FA"},
    {"Blue-Green",  "#0D9488"},
    {"Blue-Blue",   "#1D4ED8"},
    {"Pinker",      "#BE185D"},
    {"Tree",        "#15803D"},
    {"Grey-Purple", "#6B7280"},
    {"Green-Blue",  "#0F766E"},
};
// clang-format on

// Used when a logo is plain black or white
const LogoTheme NEUTRAL_LOGO_THEME = {"#2C4A6B", "#1E3A5F", "#F5C842"};

const LogoVariant* find_variant(const LogoFamily& family, const char* color) {
    for (const auto& variant : family.variants) {
        if (variant.color == color) {
            return &variant;
        }
    }
    return nullptr;
}

const LogoVariant* find_variant_except(const LogoFamily& family, const char* color) {
    for (const auto& variant : family.variants) {
        if (variant.color != color) {
            return &variant;
        }
    }
    return nullptr;
}

} // namespace

std::string hex_for_logo_color(const std::string& color_name) {
    for (const auto& entry : LOGO_COLORS) {
        if (color_name == entry.name) {
            return entry.hex;
        }
    }
    return color::FALLBACK_HEX;
}

const LogoVariant* best_logo_variant(const std::string& background_hex, const LogoFamily& family) {
    if (family.variants.empty()) {
        return nullptr;
    }

    const bool dark_bg = contrast::is_dark(background_hex);
    const char* preferred = dark_bg ? "White" : "Black";
    const char* avoided = dark_bg ? "Black" : "White";

    if (const auto* variant = find_variant(family, preferred)) {
        return variant;
    }
    if (const auto* variant = find_variant_except(family, avoided)) {
        return variant;
    }
    return &family.variants.front();
}

LogoTheme theme_from_logo(const LogoVariant& variant) {
    const std::string base = hex_for_logo_color(variant.color);
    if (base == contrast::WHITE || base == contrast::BLACK) {
        return NEUTRAL_LOGO_THEME;
    }
    return LogoTheme{base, color::adjust_brightness(base, -20), color::adjust_brightness(base, 40)};
}

void LogoCatalog::add_family(LogoFamily family) {
    std::string id = family.id;
    families_[id] = std::move(family);
}

void LogoCatalog::assign(const std::string& template_id, const std::string& family_id) {
    assignments_[template_id] = family_id;
}

void LogoCatalog::set_default_family(const std::string& family_id) {
    default_family_ = family_id;
}

const LogoFamily* LogoCatalog::find_family(const std::string& family_id) const {
    auto it = families_.find(family_id);
    return it != families_.end() ? &it->second : nullptr;
}

const LogoFamily* LogoCatalog::family_for_template(const std::string& template_id) const {
    auto it = assignments_.find(template_id);
    if (it != assignments_.end()) {
        if (const auto* family = find_family(it->second)) {
            return family;
        }
        spdlog::warn("[LogoCatalog] Template '{}' assigned to unknown family '{}'", template_id,
                     it->second);
    }
    if (!default_family_.empty()) {
        return find_family(default_family_);
    }
    return nullptr;
}

std::optional<LogoAsset> LogoCatalog::resolve_logo(const std::string& template_id,
                                                   const std::string& background_hex) const {
    const LogoFamily* family = family_for_template(template_id);
    if (!family) {
        spdlog::debug("[LogoCatalog] No logo family for template '{}'", template_id);
        return std::nullopt;
    }

    const LogoVariant* variant = best_logo_variant(background_hex, *family);
    if (!variant) {
        spdlog::warn("[LogoCatalog] Logo family '{}' has no variants", family->id);
        return std::nullopt;
    }

    spdlog::debug("[LogoCatalog] Template '{}' on {} -> {} variant of '{}'", template_id,
                  background_hex, variant->color, family->id);
    return LogoAsset{variant->path};
}

std::optional<LogoCatalog> LogoCatalog::from_json(const nlohmann::json& json) {
    try {
        LogoCatalog catalog;

        for (const auto& entry : json.at("families")) {
            LogoFamily family;
            family.id = entry.at("id").get<std::string>();
            family.name = entry.value("name", family.id);
            if (entry.contains("variants")) {
                for (const auto& v : entry["variants"]) {
                    family.variants.push_back(
                        LogoVariant{v.at("color").get<std::string>(), v.at("path").get<std::string>()});
                }
            }
            catalog.add_family(std::move(family));
        }

        if (json.contains("assignments")) {
            for (const auto& [template_id, family_id] : json["assignments"].items()) {
                catalog.assign(template_id, family_id.get<std::string>());
            }
        }

        catalog.set_default_family(json.value("default_family", ""));
        return catalog;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("[LogoCatalog] Invalid catalog JSON: {}", e.what());
        return std::nullopt;
    }
}

std::optional<LogoCatalog> LogoCatalog::load_from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        spdlog::error("[LogoCatalog] Failed to open {}", filepath);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        auto catalog = from_json(nlohmann::json::parse(buffer.str()));
        if (catalog) {
            spdlog::info("[LogoCatalog] Loaded {} logo families from {}", catalog->family_count(),
                         filepath);
        }
        return catalog;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("[LogoCatalog] Failed to parse {}: {}", filepath, e.what());
        return std::nullopt;
    }
}

} // namespace cardforge
