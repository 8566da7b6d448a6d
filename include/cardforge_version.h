// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file cardforge_version.h
 * @brief CardForge version information
 *
 * The version is set in the project() call of the root CMakeLists.txt and
 * passed via -DCARDFORGE_VERSION during compilation.
 */

#include <cstdio>

// Fallback if not defined (e.g., IDE parsing)
#ifndef CARDFORGE_VERSION
#define CARDFORGE_VERSION "dev"
#endif

#ifndef CARDFORGE_VERSION_MAJOR
#define CARDFORGE_VERSION_MAJOR 0
#endif

#ifndef CARDFORGE_VERSION_MINOR
#define CARDFORGE_VERSION_MINOR 0
#endif

#ifndef CARDFORGE_VERSION_PATCH
#define CARDFORGE_VERSION_PATCH 0
#endif

// Build type
#ifndef CARDFORGE_BUILD_TYPE
#define CARDFORGE_BUILD_TYPE "dev"
#endif

/**
 * @brief Get version string, e.g. "1.2.0"
 */
inline const char* cardforge_version() {
    return CARDFORGE_VERSION;
}

/**
 * @brief Get version with build type, e.g. "1.2.0 (Release)"
 */
inline const char* cardforge_version_full() {
    static char buf[64];
    static bool initialized = false;
    if (!initialized) {
        snprintf(buf, sizeof(buf), "%s (%s)", CARDFORGE_VERSION, CARDFORGE_BUILD_TYPE);
        initialized = true;
    }
    return buf;
}
