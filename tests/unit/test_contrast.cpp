// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "contrast.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace cardforge;
using Catch::Approx;

TEST_CASE("Contrast: luminance uses BT.709 weights on 0-255 channels", "[contrast]") {
    REQUIRE(contrast::luminance("#000000") == 0.0);
    REQUIRE(contrast::luminance("#FFFFFF") == Approx(255.0));
    REQUIRE(contrast::luminance("#FF0000") == Approx(54.213));
    REQUIRE(contrast::luminance("#00FF00") == Approx(182.376));
    REQUIRE(contrast::luminance("#0000FF") == Approx(18.411));
}

TEST_CASE("Contrast: black on white is 21", "[contrast]") {
    REQUIRE(contrast::contrast_ratio(contrast::WHITE, contrast::BLACK) == Approx(21.0));
}

TEST_CASE("Contrast: ratio is symmetric and at least 1", "[contrast]") {
    const char* colors[] = {"#3B82F6", "#0F172A", "#F8FAFC", "#F59E0B", "#808080"};
    for (const char* a : colors) {
        for (const char* b : colors) {
            double ab = contrast::contrast_ratio(a, b);
            REQUIRE(ab == Approx(contrast::contrast_ratio(b, a)));
            REQUIRE(ab >= 1.0);
        }
    }
}

TEST_CASE("Contrast: identical colors have ratio 1", "[contrast]") {
    REQUIRE(contrast::contrast_ratio("#3B82F6", "#3B82F6") == Approx(1.0));
}

TEST_CASE("Contrast: brand blue against the poles", "[contrast]") {
    REQUIRE(contrast::contrast_ratio("#3B82F6", contrast::WHITE) == Approx(1.9683).margin(1e-4));
    REQUIRE(contrast::contrast_ratio("#3B82F6", contrast::BLACK) == Approx(10.6691).margin(1e-4));
    REQUIRE_FALSE(contrast::prefers_light_text("#3B82F6"));
}

TEST_CASE("Contrast: malformed colors count as black", "[contrast]") {
    REQUIRE(contrast::contrast_ratio("not-a-color", contrast::WHITE) == Approx(21.0));
}

TEST_CASE("Contrast: is_dark splits at luma 128", "[contrast]") {
    REQUIRE(contrast::is_dark("#7F7F7F"));
    REQUIRE_FALSE(contrast::is_dark("#808080"));
    REQUIRE(contrast::is_dark("#0F172A"));
    REQUIRE_FALSE(contrast::is_dark("#F8FAFC"));
}

TEST_CASE("Contrast: collision threshold", "[contrast]") {
    REQUIRE(contrast::collides("#FFFFFF", "#F8FAFC"));
    REQUIRE(contrast::collides("#3B82F6", "#3B82F6"));
    REQUIRE_FALSE(contrast::collides("#FFFFFF", "#3B82F6"));
}

TEST_CASE("Contrast: prefers_light_text on dark surfaces", "[contrast]") {
    REQUIRE(contrast::prefers_light_text("#0F172A"));
    REQUIRE(contrast::prefers_light_text("#1B1D9B"));
    REQUIRE_FALSE(contrast::prefers_light_text("#F8F6F6"));
}
