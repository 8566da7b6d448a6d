// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file template_loader.h
 * @brief JSON (de)serialisation for templates, palettes and context maps
 *
 * Template files use the editor's node format:
 * {"id", "name", "width", "height", "background": {...},
 *  "layers": [{"id", "type", "props": {...}, "editable", "locked", "isLogo"}]}
 *
 * Props the model does not name are preserved and written back verbatim.
 *
 * @threading Stateless; file functions touch only the given paths
 */

#pragma once

#include "card_template.h"
#include "palette_generator.h"
#include "spatial_context.h"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cardforge {

/**
 * @brief Build a template from parsed JSON
 * @throws nlohmann::json::exception on missing id/layers or wrong types
 */
CardTemplate template_from_json(const nlohmann::json& json);

nlohmann::json template_to_json(const CardTemplate& templ);

/**
 * @brief Build a background from JSON; a missing type means solid
 */
BackgroundPattern background_from_json(const nlohmann::json& json);

nlohmann::json background_to_json(const BackgroundPattern& background);

nlohmann::json palette_to_json(const ColorPalette& palette);

/**
 * @brief Build a palette from JSON
 * @return Palette, or nullopt if required fields are missing
 */
std::optional<ColorPalette> palette_from_json(const nlohmann::json& json);

nlohmann::json context_map_to_json(const TemplateContextMap& map);

/**
 * @brief Parse template from JSON string
 * @param json_str JSON content
 * @param source Name used in log messages
 * @return Template, or nullopt on parse error
 */
std::optional<CardTemplate> parse_template_json(const std::string& json_str,
                                                const std::string& source);

/**
 * @brief Load template from JSON file
 * @return Template, or nullopt if the file is missing or malformed
 */
std::optional<CardTemplate> load_template_from_file(const std::string& filepath);

/**
 * @brief Save template to JSON file
 * @return true on success, false on error
 */
bool save_template_to_file(const CardTemplate& templ, const std::string& filepath);

/**
 * @brief Load every valid *.json template in a directory
 *
 * Hidden files, non-JSON files and invalid templates are skipped.
 *
 * @return Templates sorted by id
 */
std::vector<CardTemplate> load_templates_from_directory(const std::string& dir);

/**
 * @brief Check structural invariants of a template
 *
 * Non-empty id, positive size, non-empty and unique layer ids.
 *
 * @return Human-readable problems; empty if the template is valid
 */
std::vector<std::string> validate_template(const CardTemplate& templ);

} // namespace cardforge
