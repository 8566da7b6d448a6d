// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "seeded_random.h"

#include <random>
#include <stdexcept>
#include <vector>

namespace cardforge {

namespace {

constexpr uint32_t HASH_OFFSET = 0xdeadbeefu;
constexpr uint32_t HASH_PRIME = 2654435761u;
constexpr uint64_t LCG_MULTIPLIER = 1664525u;
constexpr uint64_t LCG_INCREMENT = 1013904223u;
constexpr double TWO_POW_32 = 4294967296.0;

constexpr size_t RANDOM_SEED_LENGTH = 7;

constexpr uint32_t REPLACEMENT_CHAR = 0xFFFD;

// Decode UTF-8 into UTF-16 code units; malformed bytes become U+FFFD
std::vector<uint16_t> utf16_code_units(const std::string& utf8) {
    std::vector<uint16_t> units;
    units.reserve(utf8.size());

    size_t i = 0;
    while (i < utf8.size()) {
        const auto lead = static_cast<unsigned char>(utf8[i]);
        uint32_t cp = REPLACEMENT_CHAR;
        size_t len = 1;
        uint32_t min_cp = 0;

        if (lead < 0x80) {
            cp = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            len = 2;
            cp = lead & 0x1F;
            min_cp = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            len = 3;
            cp = lead & 0x0F;
            min_cp = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            len = 4;
            cp = lead & 0x07;
            min_cp = 0x10000;
        } else {
            len = 0;
        }

        if (len > 1) {
            bool valid = i + len <= utf8.size();
            for (size_t k = 1; valid && k < len; ++k) {
                const auto cont = static_cast<unsigned char>(utf8[i + k]);
                if ((cont & 0xC0) != 0x80) {
                    valid = false;
                } else {
                    cp = (cp << 6) | (cont & 0x3F);
                }
            }
            if (!valid || cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                cp = REPLACEMENT_CHAR;
                len = 1;
            }
        } else if (len == 0) {
            cp = REPLACEMENT_CHAR;
            len = 1;
        }

        if (cp >= 0x10000) {
            cp -= 0x10000;
            units.push_back(static_cast<uint16_t>(0xD800 | (cp >> 10)));
            units.push_back(static_cast<uint16_t>(0xDC00 | (cp & 0x3FF)));
        } else {
            units.push_back(static_cast<uint16_t>(cp));
        }
        i += len;
    }
    return units;
}

} // namespace

SeededRandom::SeededRandom(const std::string& seed) : state_(hash(seed)) {}

uint32_t SeededRandom::hash(const std::string& seed) {
    uint32_t h = HASH_OFFSET;
    // Seeds are hashed per UTF-16 code unit so non-ASCII seeds keep their palettes
    for (uint16_t unit : utf16_code_units(seed)) {
        // Unsigned 32-bit multiply wraps exactly like Math.imul
        h = (h ^ unit) * HASH_PRIME;
    }
    return h ^ (h >> 16);
}

double SeededRandom::next() {
    // 64-bit intermediate so the modulo matches arbitrary-precision arithmetic
    uint64_t s = static_cast<uint64_t>(state_) * LCG_MULTIPLIER + LCG_INCREMENT;
    state_ = static_cast<uint32_t>(s % 4294967296ull);
    return static_cast<double>(state_) / TWO_POW_32;
}

double SeededRandom::range(double min, double max) {
    return min + next() * (max - min);
}

size_t SeededRandom::index(size_t size) {
    if (size == 0) {
        throw std::invalid_argument("SeededRandom::choice on empty list");
    }
    auto idx = static_cast<size_t>(next() * static_cast<double>(size));
    return idx < size ? idx : size - 1;
}

std::string SeededRandom::random_seed() {
    static constexpr char ALPHABET[] = "0123456789abcdefghijklmnopqrstuvwxyz";

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dist(0, 35);

    std::string seed;
    seed.reserve(RANDOM_SEED_LENGTH);
    for (size_t i = 0; i < RANDOM_SEED_LENGTH; ++i) {
        seed.push_back(ALPHABET[dist(gen)]);
    }
    return seed;
}

} // namespace cardforge
