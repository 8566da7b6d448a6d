// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "card_test_utils.h"
#include "layer_capabilities.h"

#include <cmath>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace cardforge;
using namespace cardforge::test;
using Catch::Approx;

TEST_CASE("LayerCapabilities: surfaces", "[layers]") {
    for (LayerType type : {LayerType::RECT, LayerType::CIRCLE, LayerType::ELLIPSE, LayerType::STAR,
                           LayerType::REGULAR_POLYGON, LayerType::PATH, LayerType::ICON}) {
        INFO(layer_type_name(type));
        REQUIRE(get_layer_capabilities(type).is_surface);
        REQUIRE(get_layer_capabilities(type).has_fill);
    }
    for (LayerType type : {LayerType::TEXT, LayerType::IMAGE, LayerType::LINE, LayerType::ARROW,
                           LayerType::UNKNOWN}) {
        INFO(layer_type_name(type));
        REQUIRE_FALSE(get_layer_capabilities(type).is_surface);
    }
}

TEST_CASE("LayerCapabilities: per-type editing flags", "[layers]") {
    auto text = get_layer_capabilities(LayerType::TEXT);
    REQUIRE(text.can_edit_text);
    REQUIRE_FALSE(text.has_stroke);

    auto image = get_layer_capabilities(LayerType::IMAGE);
    REQUIRE(image.has_crop);
    REQUIRE(image.has_filters);
    REQUIRE_FALSE(image.has_fill);

    auto line = get_layer_capabilities(LayerType::LINE);
    REQUIRE_FALSE(line.has_fill);
    REQUIRE(line.has_stroke);
}

TEST_CASE("LayerCapabilities: radial shapes are centre-anchored", "[layers]") {
    REQUIRE(get_layer_capabilities(LayerType::CIRCLE).is_centered);
    REQUIRE(get_layer_capabilities(LayerType::STAR).is_centered);
    REQUIRE_FALSE(get_layer_capabilities(LayerType::RECT).is_centered);
    REQUIRE_FALSE(get_layer_capabilities(LayerType::TEXT).is_centered);
}

TEST_CASE("layer_bounds: top-left anchored rect", "[layers][bounds]") {
    BoundingBox box = layer_bounds(make_rect("r", 10, 20, 100, 50));
    REQUIRE(box.left == 10);
    REQUIRE(box.top == 20);
    REQUIRE(box.right == 110);
    REQUIRE(box.bottom == 70);
    REQUIRE(box.area() == 5000);
}

TEST_CASE("layer_bounds: circle is centred on its position", "[layers][bounds]") {
    BoundingBox box = layer_bounds(make_layer("c", LayerType::CIRCLE, 300, 175, 200, 200, "#FFF"));
    REQUIRE(box.left == 200);
    REQUIRE(box.top == 75);
    REQUIRE(box.right == 400);
    REQUIRE(box.bottom == 275);
}

TEST_CASE("layer_bounds: rotation expands the axis-aligned box", "[layers][bounds]") {
    Layer rect = make_rect("r", 0, 0, 100, 50);
    rect.geometry.rotation = 90;

    BoundingBox box = layer_bounds(rect);
    REQUIRE(box.left == Approx(-50).margin(1e-9));
    REQUIRE(box.top == Approx(0).margin(1e-9));
    REQUIRE(box.right == Approx(0).margin(1e-9));
    REQUIRE(box.bottom == Approx(100).margin(1e-9));

    rect.geometry.rotation = 45;
    BoundingBox diag = layer_bounds(rect);
    REQUIRE(diag.width() == Approx(150 / std::sqrt(2.0)).margin(1e-9));
    REQUIRE(diag.height() == Approx(150 / std::sqrt(2.0)).margin(1e-9));
}

TEST_CASE("BoundingBox: containment is edge inclusive", "[layers][bounds]") {
    BoundingBox outer{0, 0, 100, 100};
    REQUIRE(outer.contains(BoundingBox{0, 0, 100, 100}));
    REQUIRE(outer.contains(BoundingBox{10, 10, 20, 20}));
    REQUIRE_FALSE(outer.contains(BoundingBox{10, 10, 101, 20}));
}

TEST_CASE("BoundingBox: intersection area", "[layers][bounds]") {
    BoundingBox a{0, 0, 100, 100};
    REQUIRE(a.intersection_area(BoundingBox{50, 50, 150, 150}) == 2500);
    REQUIRE(a.intersection_area(BoundingBox{100, 0, 200, 100}) == 0);
    REQUIRE(a.intersection_area(BoundingBox{200, 200, 300, 300}) == 0);
}

TEST_CASE("Layer: transparent fill detection", "[layers]") {
    Layer layer = make_rect("r", 0, 0, 10, 10);
    REQUIRE_FALSE(layer.has_transparent_fill());

    layer.paint.fill = std::string("transparent");
    REQUIRE(layer.has_transparent_fill());

    layer.paint.fill = std::string("");
    REQUIRE(layer.has_transparent_fill());

    layer.paint.fill.reset();
    REQUIRE(layer.has_transparent_fill());
}

TEST_CASE("Layer: logo detection by flag or reserved id", "[layers]") {
    Layer layer = make_layer("brand_logo", LayerType::IMAGE, 0, 0, 10, 10);
    REQUIRE(layer.is_logo_layer());

    Layer flagged = make_layer("mark", LayerType::PATH, 0, 0, 10, 10);
    REQUIRE_FALSE(flagged.is_logo_layer());
    flagged.is_logo = true;
    REQUIRE(flagged.is_logo_layer());
}

TEST_CASE("LayerType: string mapping", "[layers]") {
    REQUIRE(layer_type_from_string("RegularPolygon") == LayerType::REGULAR_POLYGON);
    REQUIRE(layer_type_from_string("rect") == LayerType::UNKNOWN);
    REQUIRE(std::string(layer_type_name(LayerType::ARROW)) == "Arrow");

    Layer custom = make_layer("q", LayerType::UNKNOWN, 0, 0, 10, 10);
    custom.type_name = "QRCode";
    REQUIRE(custom.serialized_type() == "QRCode");
}
