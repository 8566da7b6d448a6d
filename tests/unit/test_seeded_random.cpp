// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "seeded_random.h"

#include <cctype>
#include <set>
#include <stdexcept>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace cardforge;
using Catch::Approx;

TEST_CASE("SeededRandom: hash of empty seed folds the offset", "[random]") {
    REQUIRE(SeededRandom::hash("") == 0xdead6042u);
}

TEST_CASE("SeededRandom: non-ASCII seeds hash per UTF-16 code unit", "[random]") {
    // U+00E9 is one code unit even though it is two UTF-8 bytes
    REQUIRE(SeededRandom::hash("\xc3\xa9") == 2621154333u);
    REQUIRE(SeededRandom::hash("caf\xc3\xa9") == 751765261u);
    // U+1F600 becomes a surrogate pair
    REQUIRE(SeededRandom::hash("\xf0\x9f\x98\x80") == 338497471u);
    REQUIRE(SeededRandom::hash("\xe6\x97\xa5\xe6\x9c\xac") == 2454337708u);
    // Malformed bytes hash like U+FFFD
    REQUIRE(SeededRandom::hash("\xff") == 4033449755u);
    REQUIRE(SeededRandom::hash("\xff") == SeededRandom::hash("\xef\xbf\xbd"));
}

TEST_CASE("SeededRandom: known sequence for 'abc'", "[random]") {
    SeededRandom rng("abc");
    REQUIRE(rng.state() == 1040704568u);

    REQUIRE(rng.next() == Approx(0.8173195251729339).epsilon(1e-12));
    REQUIRE(rng.next() == Approx(0.018706450704485178).epsilon(1e-12));
    REQUIRE(rng.next() == Approx(0.5909268560353667).epsilon(1e-12));
    REQUIRE(rng.state() == 2538011521u);
}

TEST_CASE("SeededRandom: same seed gives the same sequence", "[random]") {
    SeededRandom a("brand-42");
    SeededRandom b("brand-42");
    for (int i = 0; i < 100; ++i) {
        REQUIRE(a.next() == b.next());
    }
}

TEST_CASE("SeededRandom: different seeds diverge", "[random]") {
    SeededRandom a("seed-a");
    SeededRandom b("seed-b");
    bool differs = false;
    for (int i = 0; i < 10; ++i) {
        if (a.next() != b.next()) {
            differs = true;
        }
    }
    REQUIRE(differs);
}

TEST_CASE("SeededRandom: next stays in [0, 1)", "[random]") {
    SeededRandom rng("bounds");
    for (int i = 0; i < 10000; ++i) {
        double v = rng.next();
        REQUIRE(v >= 0.0);
        REQUIRE(v < 1.0);
    }
}

TEST_CASE("SeededRandom: range stays in [min, max)", "[random]") {
    SeededRandom rng("range");
    for (int i = 0; i < 1000; ++i) {
        double v = rng.range(-15.0, 15.0);
        REQUIRE(v >= -15.0);
        REQUIRE(v < 15.0);
    }
}

TEST_CASE("SeededRandom: choice picks list elements", "[random]") {
    SeededRandom rng("choice");
    const std::vector<std::string> items = {"Corporate", "Modern", "Creative"};
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        seen.insert(rng.choice(items));
    }
    REQUIRE(seen.size() == 3);
}

TEST_CASE("SeededRandom: choice on an empty list throws", "[random]") {
    SeededRandom rng("empty");
    const std::vector<int> empty;
    REQUIRE_THROWS_AS(rng.choice(empty), std::invalid_argument);
}

TEST_CASE("SeededRandom: random_seed is 7 base36 characters", "[random]") {
    for (int i = 0; i < 20; ++i) {
        std::string seed = SeededRandom::random_seed();
        REQUIRE(seed.size() == 7);
        for (char c : seed) {
            REQUIRE((std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'z')));
        }
    }
}
