// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "card_test_utils.h"
#include "template_registry.h"

#include <algorithm>
#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

using namespace cardforge;
using namespace cardforge::test;

class TemplateRegistryFixture {
  protected:
    TemplateRegistry registry{small_options()};

    static VariationOptions small_options() {
        VariationOptions options;
        options.target_variants = 2;
        options.seed_source = sequential_seeds("registry");
        return options;
    }

    static CardTemplate business() {
        CardTemplate templ = make_business_card();
        templ.name = "Executive";
        templ.category = "Business";
        templ.tone = "Corporate";
        templ.tags = {"Blue", "minimal"};
        return templ;
    }

    static CardTemplate party() {
        CardTemplate templ = make_template("party", {make_rect("confetti", 0, 0, 600, 350)});
        templ.name = "Birthday Bash";
        templ.category = "Events";
        templ.tone = "Creative";
        templ.tags = {"fun"};
        return templ;
    }

    void add_both() {
        registry.add_base_template(business());
        registry.add_base_template(party());
    }

    static size_t count_from(const std::vector<CardTemplate>& templates, const std::string& base) {
        return static_cast<size_t>(
            std::count_if(templates.begin(), templates.end(), [&](const CardTemplate& t) {
                return t.id.rfind(base, 0) == 0;
            }));
    }
};

TEST_CASE_METHOD(TemplateRegistryFixture, "TemplateRegistry: empty registry", "[registry]") {
    REQUIRE(registry.get_all_templates().empty());
    REQUIRE(registry.get_categories().empty());
    REQUIRE_FALSE(registry.get_template_by_id("business").has_value());
}

TEST_CASE_METHOD(TemplateRegistryFixture, "TemplateRegistry: bases and variants are listed",
                 "[registry]") {
    add_both();
    REQUIRE(registry.base_count() == 2);
    REQUIRE(registry.cached_base_count() == 0);

    auto all = registry.get_all_templates();
    REQUIRE(all.size() == 6);
    REQUIRE(count_from(all, "business") == 3);
    REQUIRE(count_from(all, "party") == 3);
    REQUIRE(registry.cached_base_count() == 2);
}

TEST_CASE_METHOD(TemplateRegistryFixture, "TemplateRegistry: lookup by id", "[registry]") {
    add_both();

    auto base = registry.get_template_by_id("party");
    REQUIRE(base.has_value());
    REQUIRE(base->name == "Birthday Bash");

    REQUIRE_FALSE(registry.get_template_by_id("missing").has_value());
    REQUIRE_THROWS_AS(registry.require_template("missing"), std::out_of_range);
    REQUIRE(registry.require_template("business").id == "business");
}

TEST_CASE_METHOD(TemplateRegistryFixture, "TemplateRegistry: listing order is reproducible",
                 "[registry]") {
    add_both();
    TemplateRegistry other(small_options());
    other.add_base_template(business());
    other.add_base_template(party());

    auto a = registry.get_all_templates();
    auto b = other.get_all_templates();
    REQUIRE(a.size() == b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        REQUIRE(a[i].id == b[i].id);
    }

    // Memoized: asking again gives the same listing
    auto again = registry.get_all_templates();
    for (size_t i = 0; i < a.size(); ++i) {
        REQUIRE(a[i].id == again[i].id);
    }
}

TEST_CASE_METHOD(TemplateRegistryFixture, "TemplateRegistry: filters", "[registry]") {
    add_both();

    SECTION("search is case-insensitive over name, category and tags") {
        REQUIRE(registry.get_templates({"EXECUTIVE"}).size() == 3);
        REQUIRE(registry.get_templates({"events"}).size() == 3);
        REQUIRE(registry.get_templates({"minimal"}).size() == 3);
        REQUIRE(registry.get_templates({"nothing-matches"}).empty());
    }

    SECTION("category and tone") {
        TemplateFilter filter;
        filter.category = "Business";
        REQUIRE(registry.get_templates(filter).size() == 3);

        filter.category = "All";
        filter.tone = "Creative";
        auto creative = registry.get_templates(filter);
        REQUIRE(creative.size() == 3);
        REQUIRE(count_from(creative, "party") == 3);
    }

    SECTION("color matches a tag exactly, ignoring case") {
        TemplateFilter filter;
        filter.color = "blue";
        REQUIRE(registry.get_templates(filter).size() == 3);
    }

    SECTION("tags need at least one match") {
        TemplateFilter filter;
        filter.tags = {"fun", "unused"};
        REQUIRE(registry.get_templates(filter).size() == 3);
    }
}

TEST_CASE_METHOD(TemplateRegistryFixture, "TemplateRegistry: sorting", "[registry]") {
    add_both();

    TemplateFilter filter;
    filter.sort_by = SortOption::NAME;
    auto by_name = registry.get_templates(filter);
    REQUIRE(std::is_sorted(by_name.begin(), by_name.end(),
                           [](const auto& a, const auto& b) { return a.name < b.name; }));

    filter.sort_by = SortOption::NEWEST;
    auto newest = registry.get_templates(filter);
    REQUIRE(std::is_sorted(newest.begin(), newest.end(),
                           [](const auto& a, const auto& b) { return a.id > b.id; }));
}

TEST_CASE_METHOD(TemplateRegistryFixture, "TemplateRegistry: categories", "[registry]") {
    add_both();
    const std::vector<std::string> expected = {"Business", "Events"};
    REQUIRE(registry.get_categories() == expected);
}

TEST_CASE_METHOD(TemplateRegistryFixture, "TemplateRegistry: geometry change regenerates variants",
                 "[registry]") {
    registry.add_base_template(business());
    REQUIRE(registry.get_all_templates().size() == 3);

    CardTemplate moved = business();
    moved.layers[0].geometry.height = 200;
    registry.add_base_template(moved);
    REQUIRE(registry.base_count() == 1);

    for (const auto& t : registry.get_all_templates()) {
        INFO(t.id);
        REQUIRE(t.find_layer("header")->geometry.height == 200);
    }
}

TEST_CASE_METHOD(TemplateRegistryFixture, "TemplateRegistry: invalidate drops the cache",
                 "[registry]") {
    add_both();
    registry.get_all_templates();
    REQUIRE(registry.cached_base_count() == 2);

    registry.invalidate();
    REQUIRE(registry.cached_base_count() == 0);
    REQUIRE(registry.get_all_templates().size() == 6);
}

TEST_CASE_METHOD(TemplateRegistryFixture, "TemplateRegistry: remove a base", "[registry]") {
    add_both();
    REQUIRE(registry.remove_base_template("party"));
    REQUIRE_FALSE(registry.remove_base_template("party"));

    auto all = registry.get_all_templates();
    REQUIRE(all.size() == 3);
    REQUIRE(count_from(all, "party") == 0);
}

TEST_CASE("TemplateRegistry: content hash tracks any change", "[registry]") {
    CardTemplate a = make_business_card();
    CardTemplate b = make_business_card();
    REQUIRE(template_content_hash(a) == template_content_hash(b));

    b.layers[2].geometry.x += 1;
    REQUIRE(template_content_hash(a) != template_content_hash(b));
}

TEST_CASE("TemplateRegistry: sort options and colors", "[registry]") {
    REQUIRE(sort_option_from_string("popular") == SortOption::POPULAR);
    REQUIRE(sort_option_from_string("newest") == SortOption::NEWEST);
    REQUIRE(sort_option_from_string("name") == SortOption::NAME);
    REQUIRE(sort_option_from_string("random") == SortOption::NONE);
    REQUIRE(TemplateRegistry::available_colors().size() == 8);
}
