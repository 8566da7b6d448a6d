// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "background_presets.h"
#include "color_space.h"

#include <set>
#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace cardforge;
using namespace cardforge::backgrounds;

TEST_CASE("BackgroundPresets: catalog is well formed", "[backgrounds]") {
    REQUIRE(PRESET_COUNT == 11);

    std::set<std::string> ids;
    for (const auto& preset : PRESETS) {
        INFO(preset.id);
        REQUIRE(ids.insert(preset.id).second);
        REQUIRE(color::is_valid_hex(preset.color1));
        REQUIRE((preset.color2 != nullptr) == (preset.type == BackgroundType::GRADIENT));
        REQUIRE((preset.pattern_image_url != nullptr) == (preset.type == BackgroundType::PATTERN));
    }
}

TEST_CASE("BackgroundPresets: find_preset", "[backgrounds]") {
    auto sunset = find_preset("grad-sunset");
    REQUIRE(sunset.has_value());
    REQUIRE(std::string(sunset->name) == "Sunset");
    REQUIRE(sunset->type == BackgroundType::GRADIENT);

    REQUIRE_FALSE(find_preset("grad-nope").has_value());
}

TEST_CASE("BackgroundPresets: presets_by_type keeps catalog order", "[backgrounds]") {
    auto solids = presets_by_type(BackgroundType::SOLID);
    REQUIRE(solids.size() == 4);
    REQUIRE(std::string(solids.front().id) == "bg-white");

    REQUIRE(presets_by_type(BackgroundType::GRADIENT).size() == 4);
    REQUIRE(presets_by_type(BackgroundType::PATTERN).size() == 3);
    REQUIRE(presets_by_type(BackgroundType::TEXTURE).empty());
}

TEST_CASE("BackgroundPresets: to_pattern", "[backgrounds]") {
    BackgroundPattern gradient = find_preset("grad-ocean")->to_pattern();
    REQUIRE(gradient.type_name == "gradient");
    REQUIRE(gradient.color1 == "#06B6D4");
    REQUIRE(gradient.color2 == std::string("#3B82F6"));
    REQUIRE(gradient.rotation == 90.0);
    REQUIRE_FALSE(gradient.pattern_image_url.has_value());

    BackgroundPattern dots = find_preset("pat-dots")->to_pattern();
    REQUIRE(dots.type == BackgroundType::PATTERN);
    REQUIRE(dots.pattern_image_url == std::string(DOT_PATTERN_URI));
    REQUIRE(dots.scale == 1.0);
    REQUIRE_FALSE(dots.rotation.has_value());
}

TEST_CASE("BackgroundPresets: default is solid white", "[backgrounds]") {
    BackgroundPattern bg = default_background();
    REQUIRE(bg.type == BackgroundType::SOLID);
    REQUIRE(bg.color1 == "#FFFFFF");
    REQUIRE(bg.opacity == 1.0);
}
