// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "card_test_utils.h"
#include "variation_generator.h"

#include <set>

#include <catch2/catch_test_macros.hpp>

using namespace cardforge;
using namespace cardforge::test;

namespace {

void require_unique_ids(const std::vector<CardTemplate>& templates) {
    std::set<std::string> ids;
    for (const auto& t : templates) {
        REQUIRE(ids.insert(t.id).second);
    }
}

} // namespace

TEST_CASE("Variations: base first, bounded size, unique ids", "[variations]") {
    const CardTemplate base = make_business_card();
    const auto variants = generate_variations(base);

    REQUIRE(variants.front().id == base.id);
    REQUIRE(variants.size() >= 1);
    REQUIRE(variants.size() <= 10);
    require_unique_ids(variants);
}

TEST_CASE("Variations: base is returned unchanged", "[variations]") {
    const CardTemplate base = make_business_card();
    VariationOptions options;
    options.seed_source = sequential_seeds("base");
    const auto variants = generate_variations(base, options);

    REQUIRE(variants.front().name == base.name);
    REQUIRE(variants.front().layers[0].paint.fill == base.layers[0].paint.fill);
    REQUIRE_FALSE(variants.front().background.has_value());
}

TEST_CASE("Variations: sequential seeds reach the target", "[variations]") {
    const CardTemplate base = make_business_card();
    VariationOptions options;
    options.seed_source = sequential_seeds("spring");

    const auto variants = generate_variations(base, options);
    REQUIRE(variants.size() == 10);
    REQUIRE(variants[1].id == "business_gen_spring-1");
    REQUIRE(variants[9].id == "business_gen_spring-9");
    require_unique_ids(variants);

    const ColorPalette first = generate_palette(std::string("spring-1"));
    REQUIRE(variants[1].colors.front() == first.background);
    REQUIRE(variants[1].background->color1 == first.background);
}

TEST_CASE("Variations: seeded runs are reproducible", "[variations]") {
    const CardTemplate base = make_business_card();

    VariationOptions a;
    a.seed_source = sequential_seeds("repro");
    VariationOptions b;
    b.seed_source = sequential_seeds("repro");

    const auto first = generate_variations(base, a);
    const auto second = generate_variations(base, b);
    REQUIRE(first.size() == second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        REQUIRE(first[i].id == second[i].id);
        REQUIRE(first[i].colors == second[i].colors);
    }
}

TEST_CASE("Variations: duplicate palettes are skipped", "[variations]") {
    const CardTemplate base = make_business_card();
    VariationOptions options;
    options.target_variants = 3;
    options.seed_source = seed_list({"a", "a", "b"});

    const auto variants = generate_variations(base, options);

    // "b" repeats once the list runs out, so only two distinct palettes exist
    REQUIRE(variants.size() == 3);
    REQUIRE(variants[1].id == "business_gen_a");
    REQUIRE(variants[2].id == "business_gen_b");
}

TEST_CASE("Variations: running out of attempts is not an error", "[variations]") {
    const CardTemplate base = make_business_card();
    VariationOptions options;
    options.max_attempts = 2;
    options.seed_source = sequential_seeds("short");

    REQUIRE(generate_variations(base, options).size() == 3);

    options.max_attempts = 0;
    REQUIRE(generate_variations(base, options).size() == 1);
}

TEST_CASE("Variations: zero target gives only the base", "[variations]") {
    VariationOptions options;
    options.target_variants = 0;
    const auto variants = generate_variations(make_business_card(), options);
    REQUIRE(variants.size() == 1);
}

TEST_CASE("Variations: empty template still varies", "[variations]") {
    const CardTemplate base = make_template("blank", {});
    VariationOptions options;
    options.seed_source = sequential_seeds("blank");

    const auto variants = generate_variations(base, options);
    REQUIRE(variants.size() == 10);
    REQUIRE(variants[3].layers.empty());
}

TEST_CASE("Variations: logo resolver is consulted per variant", "[variations]") {
    Layer logo = make_layer("logo", LayerType::IMAGE, 20, 20, 60, 60);
    CardTemplate base = make_template("acme", {logo});

    RecordingLogoResolver resolver(std::string("logos/acme.svg"));
    VariationOptions options;
    options.target_variants = 4;
    options.seed_source = sequential_seeds("logo");

    const auto variants = generate_variations(base, options, &resolver);
    REQUIRE(variants.size() == 5);
    REQUIRE(resolver.calls.size() == 4);
    REQUIRE_FALSE(variants[0].layers[0].src.has_value());
    REQUIRE(variants[1].layers[0].src == std::string("logos/acme.svg"));
}

TEST_CASE("Seed sources", "[variations]") {
    SECTION("sequential") {
        SeedSource next = sequential_seeds("x");
        REQUIRE(next() == "x-1");
        REQUIRE(next() == "x-2");
        REQUIRE(next() == "x-3");
    }

    SECTION("list repeats its last element") {
        SeedSource next = seed_list({"one", "two"});
        REQUIRE(next() == "one");
        REQUIRE(next() == "two");
        REQUIRE(next() == "two");
    }

    SECTION("empty list means random seeds") {
        REQUIRE_FALSE(static_cast<bool>(seed_list({})));
    }
}
