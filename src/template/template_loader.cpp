// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "template_loader.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <dirent.h>
#include <fstream>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace cardforge {

namespace {

// Props mapped onto Layer fields; everything else lands in extra_props
const std::set<std::string>& modelled_props() {
    static const std::set<std::string> keys = {
        "x",    "y",      "width",       "height",   "rotation", "opacity", "fill",
        "stroke", "strokeWidth", "fontSize", "text", "src",      "data"};
    return keys;
}

std::optional<std::string> optional_string(const json& obj, const char* key) {
    if (obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<double> optional_number(const json& obj, const char* key) {
    if (obj.contains(key) && obj[key].is_number()) {
        return obj[key].get<double>();
    }
    return std::nullopt;
}

double number_or(const json& obj, const char* key, double fallback) {
    return optional_number(obj, key).value_or(fallback);
}

template <typename T> void put_optional(json& obj, const char* key, const std::optional<T>& value) {
    if (value) {
        obj[key] = *value;
    }
}

Layer layer_from_json(const json& node) {
    Layer layer;
    layer.id = node.at("id").get<std::string>();
    layer.type_name = node.at("type").get<std::string>();
    layer.type = layer_type_from_string(layer.type_name);
    layer.editable = node.value("editable", true);
    layer.locked = node.value("locked", false);
    layer.is_logo = node.value("isLogo", false);

    const json props = node.contains("props") && node["props"].is_object() ? node["props"]
                                                                           : json::object();

    layer.geometry.x = number_or(props, "x", 0.0);
    layer.geometry.y = number_or(props, "y", 0.0);
    layer.geometry.rotation = number_or(props, "rotation", 0.0);

    // Radial shapes may only carry a radius
    std::optional<double> radius = optional_number(props, "radius");
    if (!radius) {
        radius = optional_number(props, "outerRadius");
    }
    const double diameter = radius ? *radius * 2.0 : 0.0;
    layer.geometry.width = number_or(props, "width", diameter);
    layer.geometry.height = number_or(props, "height", diameter);

    layer.opacity = number_or(props, "opacity", 1.0);
    layer.paint.fill = optional_string(props, "fill");
    layer.paint.stroke = optional_string(props, "stroke");
    layer.paint.stroke_width = optional_number(props, "strokeWidth");
    layer.font_size = optional_number(props, "fontSize");
    layer.text = optional_string(props, "text");
    layer.src = optional_string(props, "src");
    layer.path_data = optional_string(props, "data");

    const auto& modelled = modelled_props();
    for (const auto& [key, value] : props.items()) {
        if (modelled.count(key) == 0) {
            layer.extra_props[key] = value;
        }
    }

    if (layer.type == LayerType::UNKNOWN) {
        spdlog::debug("[TemplateLoader] Layer '{}' has unknown type '{}', keeping as-is", layer.id,
                      layer.type_name);
    }
    return layer;
}

json layer_to_json(const Layer& layer) {
    json props = layer.extra_props.is_object() ? layer.extra_props : json::object();
    props["x"] = layer.geometry.x;
    props["y"] = layer.geometry.y;
    props["width"] = layer.geometry.width;
    props["height"] = layer.geometry.height;
    props["rotation"] = layer.geometry.rotation;
    props["opacity"] = layer.opacity;
    put_optional(props, "fill", layer.paint.fill);
    put_optional(props, "stroke", layer.paint.stroke);
    put_optional(props, "strokeWidth", layer.paint.stroke_width);
    put_optional(props, "fontSize", layer.font_size);
    put_optional(props, "text", layer.text);
    put_optional(props, "src", layer.src);
    put_optional(props, "data", layer.path_data);

    json node = {{"id", layer.id},
                 {"type", layer.serialized_type()},
                 {"props", props},
                 {"editable", layer.editable},
                 {"locked", layer.locked}};
    if (layer.is_logo) {
        node["isLogo"] = true;
    }
    return node;
}

bool ends_with_json(const std::string& filename) {
    return filename.size() > 5 && filename.substr(filename.size() - 5) == ".json";
}

} // namespace

BackgroundPattern background_from_json(const json& obj) {
    BackgroundPattern bg;
    bg.type_name = obj.value("type", "solid");
    bg.type = background_type_from_string(bg.type_name);
    bg.color1 = obj.value("color1", "#FFFFFF");
    bg.color2 = optional_string(obj, "color2");
    bg.pattern_image_url = optional_string(obj, "patternImageURL");
    bg.pattern_color = optional_string(obj, "patternColor");
    bg.overlay_color = optional_string(obj, "overlayColor");
    bg.scale = optional_number(obj, "scale");
    bg.rotation = optional_number(obj, "rotation");
    bg.opacity = optional_number(obj, "opacity");
    return bg;
}

json background_to_json(const BackgroundPattern& bg) {
    json obj = {{"type", bg.type == BackgroundType::UNKNOWN ? bg.type_name
                                                            : background_type_name(bg.type)},
                {"color1", bg.color1}};
    put_optional(obj, "color2", bg.color2);
    put_optional(obj, "patternImageURL", bg.pattern_image_url);
    put_optional(obj, "patternColor", bg.pattern_color);
    put_optional(obj, "overlayColor", bg.overlay_color);
    put_optional(obj, "scale", bg.scale);
    put_optional(obj, "rotation", bg.rotation);
    put_optional(obj, "opacity", bg.opacity);
    return obj;
}

CardTemplate template_from_json(const json& obj) {
    CardTemplate templ;
    templ.id = obj.at("id").get<std::string>();
    templ.name = obj.value("name", templ.id);
    templ.width = obj.value("width", STANDARD_CARD_WIDTH);
    templ.height = obj.value("height", STANDARD_CARD_HEIGHT);
    templ.orientation = obj.value("orientation", STANDARD_CARD_ORIENTATION);
    templ.category = obj.value("category", "");
    templ.tone = obj.value("tone", "");
    if (obj.contains("tags")) {
        templ.tags = obj["tags"].get<std::vector<std::string>>();
    }
    if (obj.contains("colors")) {
        templ.colors = obj["colors"].get<std::vector<std::string>>();
    }
    templ.thumbnail = optional_string(obj, "thumbnail");

    if (obj.contains("background") && obj["background"].is_object()) {
        templ.background = background_from_json(obj["background"]);
    }

    for (const auto& node : obj.at("layers")) {
        templ.layers.push_back(layer_from_json(node));
    }
    return templ;
}

json template_to_json(const CardTemplate& templ) {
    json obj = {{"id", templ.id},
                {"name", templ.name},
                {"width", templ.width},
                {"height", templ.height},
                {"orientation", templ.orientation}};
    if (!templ.category.empty()) {
        obj["category"] = templ.category;
    }
    if (!templ.tone.empty()) {
        obj["tone"] = templ.tone;
    }
    obj["tags"] = templ.tags;
    obj["colors"] = templ.colors;
    put_optional(obj, "thumbnail", templ.thumbnail);
    if (templ.background) {
        obj["background"] = background_to_json(*templ.background);
    }

    json layers = json::array();
    for (const auto& layer : templ.layers) {
        layers.push_back(layer_to_json(layer));
    }
    obj["layers"] = layers;
    return obj;
}

json palette_to_json(const ColorPalette& palette) {
    return {{"id", palette.id},
            {"name", palette.name},
            {"primary", palette.primary},
            {"secondary", palette.secondary},
            {"accent", palette.accent},
            {"background", palette.background},
            {"text", palette.text},
            {"subtext", palette.subtext},
            {"isDark", palette.is_dark}};
}

std::optional<ColorPalette> palette_from_json(const json& obj) {
    try {
        ColorPalette palette;
        palette.id = obj.at("id").get<std::string>();
        palette.name = obj.value("name", palette.id);
        palette.primary = obj.at("primary").get<std::string>();
        palette.secondary = obj.at("secondary").get<std::string>();
        palette.accent = obj.value("accent", palette.primary);
        palette.background = obj.at("background").get<std::string>();
        palette.text = obj.at("text").get<std::string>();
        palette.subtext = obj.value("subtext", palette.text);
        palette.is_dark = obj.value("isDark", false);
        return palette;
    } catch (const json::exception& e) {
        spdlog::error("[TemplateLoader] Invalid palette JSON: {}", e.what());
        return std::nullopt;
    }
}

json context_map_to_json(const TemplateContextMap& map) {
    json obj = json::object();
    for (const auto& [layer_id, context] : map) {
        obj[layer_id] = {{"backgroundLayerId", context.background_layer_id}};
    }
    return obj;
}

std::optional<CardTemplate> parse_template_json(const std::string& json_str,
                                                const std::string& source) {
    try {
        return template_from_json(json::parse(json_str));
    } catch (const json::exception& e) {
        spdlog::error("[TemplateLoader] Failed to parse {}: {}", source, e.what());
        return std::nullopt;
    }
}

std::optional<CardTemplate> load_template_from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        spdlog::error("[TemplateLoader] Failed to open {}", filepath);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_template_json(buffer.str(), filepath);
}

bool save_template_to_file(const CardTemplate& templ, const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        spdlog::error("[TemplateLoader] Failed to write {}", filepath);
        return false;
    }

    file << template_to_json(templ).dump(2);
    if (!file.good()) {
        spdlog::error("[TemplateLoader] Write error on {}", filepath);
        return false;
    }
    return true;
}

std::vector<CardTemplate> load_templates_from_directory(const std::string& dir) {
    std::vector<CardTemplate> templates;

    DIR* handle = opendir(dir.c_str());
    if (!handle) {
        spdlog::warn("[TemplateLoader] Could not open templates directory: {}", dir);
        return templates;
    }

    struct dirent* entry;
    while ((entry = readdir(handle)) != nullptr) {
        std::string filename = entry->d_name;

        // Skip non-json and hidden files
        if (!ends_with_json(filename) || filename[0] == '.') {
            continue;
        }

        auto templ = load_template_from_file(dir + "/" + filename);
        if (!templ) {
            continue;
        }

        auto problems = validate_template(*templ);
        if (!problems.empty()) {
            spdlog::warn("[TemplateLoader] Skipping {}: {}", filename, problems.front());
            continue;
        }
        templates.push_back(std::move(*templ));
    }

    closedir(handle);

    std::sort(templates.begin(), templates.end(),
              [](const CardTemplate& a, const CardTemplate& b) { return a.id < b.id; });

    spdlog::debug("[TemplateLoader] Loaded {} templates from {}", templates.size(), dir);
    return templates;
}

std::vector<std::string> validate_template(const CardTemplate& templ) {
    std::vector<std::string> problems;

    if (templ.id.empty()) {
        problems.push_back("template id is empty");
    }
    if (templ.width <= 0 || templ.height <= 0) {
        problems.push_back("template size must be positive");
    }

    std::set<std::string> ids;
    for (const auto& layer : templ.layers) {
        if (layer.id.empty()) {
            problems.push_back("layer with empty id");
        } else if (!ids.insert(layer.id).second) {
            problems.push_back("duplicate layer id '" + layer.id + "'");
        }
    }
    return problems;
}

} // namespace cardforge
