// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <optional>
#include <string>

namespace cardforge {

/**
 * @brief Logo asset chosen for a background
 */
struct LogoAsset {
    std::string path; ///< Image source or SVG path data, depending on the layer
};

/**
 * @brief Abstract logo lookup used by the theme applier
 *
 * Implementations must be pure lookups: the same template id and background
 * always give the same answer, with no side effects. The applier only calls
 * this for templates that contain a logo layer.
 *
 * - LogoCatalog: families of color variants loaded from JSON
 */
class LogoResolver {
  public:
    virtual ~LogoResolver() = default;

    /**
     * @brief Pick the logo asset for a template on a given background
     *
     * @param template_id Id of the base template being themed
     * @param background_hex Final resolved color behind the logo ("#RRGGBB")
     * @return Asset to use, or nullopt to leave the logo layer unchanged
     */
    virtual std::optional<LogoAsset> resolve_logo(const std::string& template_id,
                                                  const std::string& background_hex) const = 0;
};

} // namespace cardforge
