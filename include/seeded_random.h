// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file seeded_random.h
 * @brief Deterministic pseudo-random generator driven by a string seed
 *
 * The same seed string always yields the same sequence of values. Palette ids
 * and variant ids are derived from the seed, so this sequence must never
 * change between releases.
 *
 * @threading Not thread-safe; each generation call owns its own instance
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace cardforge {

class SeededRandom {
  public:
    explicit SeededRandom(const std::string& seed);

    /**
     * @brief Hash a seed string to the initial 32-bit state
     *
     * h = 0xdeadbeef; h = (h ^ c) * 2654435761 per character; h ^= h >> 16.
     */
    static uint32_t hash(const std::string& seed);

    /// Advance the LCG and return a value in [0, 1)
    double next();

    /// Uniform value in [min, max)
    double range(double min, double max);

    /**
     * @brief Pick one element of a non-empty list
     * @throws std::invalid_argument if the list is empty
     */
    template <typename T> const T& choice(const std::vector<T>& items) {
        return items.at(index(items.size()));
    }

    /// Current 32-bit state (exposed for tests)
    uint32_t state() const {
        return state_;
    }

    /**
     * @brief Generate a fresh, non-deterministic 7-character base36 seed
     *
     * Used when the caller does not supply a seed.
     */
    static std::string random_seed();

  private:
    size_t index(size_t size);

    uint32_t state_;
};

} // namespace cardforge
