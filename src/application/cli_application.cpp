// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_application.h"

#include "background_presets.h"
#include "cardforge_version.h"
#include "config.h"
#include "environment_config.h"
#include "logging_init.h"
#include "palette_generator.h"
#include "spatial_context.h"
#include "template_loader.h"
#include "theme_applier.h"
#include "variation_generator.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <iomanip>
#include <map>
#include <stdexcept>
#include <sys/stat.h>

#include <nlohmann/json.hpp>

namespace cardforge {

using json = nlohmann::json;

namespace {

struct CommandArity {
    size_t min;
    size_t max;
    bool takes_output;
    bool takes_seed;
};

const std::map<std::string, CommandArity>& commands() {
    static const std::map<std::string, CommandArity> table = {
        {"palette", {0, 1, false, false}},   {"analyze", {1, 1, false, false}},
        {"apply", {2, 2, true, false}},      {"variations", {1, 1, true, true}},
        {"presets", {0, 0, false, false}},
    };
    return table;
}

const std::string& option_value(const std::vector<std::string>& args, size_t& i) {
    if (i + 1 >= args.size()) {
        throw std::invalid_argument("option " + args[i] + " requires a value");
    }
    return args[++i];
}

std::optional<CardTemplate> load_template_arg(const std::string& path) {
    auto templ = load_template_from_file(path);
    if (!templ) {
        spdlog::error("[CLI] Could not load template from {}", path);
        return std::nullopt;
    }
    for (const auto& problem : validate_template(*templ)) {
        spdlog::warn("[CLI] {}: {}", path, problem);
    }
    return templ;
}

bool ensure_directory(const std::string& dir) {
    struct stat st;
    if (stat(dir.c_str(), &st) == 0) {
        if (S_ISDIR(st.st_mode)) {
            return true;
        }
        spdlog::error("[CLI] {} exists and is not a directory", dir);
        return false;
    }
    if (mkdir(dir.c_str(), 0755) != 0) {
        spdlog::error("[CLI] Cannot create directory {}: {}", dir, strerror(errno));
        return false;
    }
    return true;
}

} // namespace

CliOptions parse_cli_args(const std::vector<std::string>& args) {
    CliOptions options;
    options.config_path = DEFAULT_CONFIG_PATH;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else if (arg == "--version") {
            options.show_version = true;
        } else if (arg == "-v") {
            options.verbosity += 1;
        } else if (arg == "-vv") {
            options.verbosity += 2;
        } else if (arg == "-c" || arg == "--config") {
            options.config_path = option_value(args, i);
        } else if (arg == "-o" || arg == "--output") {
            options.output = option_value(args, i);
        } else if (arg == "--seed") {
            options.seed = option_value(args, i);
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument("unknown option " + arg);
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            options.positionals.push_back(arg);
        }
    }

    if (options.show_help || options.show_version) {
        return options;
    }
    if (options.command.empty()) {
        throw std::invalid_argument("no command given");
    }

    auto it = commands().find(options.command);
    if (it == commands().end()) {
        throw std::invalid_argument("unknown command " + options.command);
    }
    const CommandArity& arity = it->second;
    if (options.positionals.size() < arity.min || options.positionals.size() > arity.max) {
        throw std::invalid_argument("wrong number of arguments for " + options.command);
    }
    if (options.output && !arity.takes_output) {
        throw std::invalid_argument(options.command + " does not accept -o");
    }
    if (options.seed && !arity.takes_seed) {
        throw std::invalid_argument(options.command + " does not accept --seed");
    }
    return options;
}

CliApplication::CliApplication(std::ostream& out, std::ostream& err) : out_(out), err_(err) {}

int CliApplication::run(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return run(args);
}

int CliApplication::run(const std::vector<std::string>& args) {
    CliOptions options;
    try {
        options = parse_cli_args(args);
    } catch (const std::invalid_argument& e) {
        err_ << "cardforge: " << e.what() << "\n";
        print_usage(err_);
        return CLI_EXIT_USAGE_ERROR;
    }

    if (options.show_help) {
        print_usage(out_);
        return CLI_EXIT_OK;
    }
    if (options.show_version) {
        out_ << "cardforge " << cardforge_version_full() << "\n";
        return CLI_EXIT_OK;
    }

    init_logging_and_config(options);
    spdlog::debug("[CLI] Running '{}' with {} argument(s)", options.command,
                  options.positionals.size());

    if (options.command == "palette")
        return cmd_palette(options);
    if (options.command == "analyze")
        return cmd_analyze(options);
    if (options.command == "apply")
        return cmd_apply(options);
    if (options.command == "variations")
        return cmd_variations(options);
    return cmd_presets();
}

void CliApplication::init_logging_and_config(const CliOptions& options) {
    // Early logger so config problems are visible
    logging::LogSettings settings;
    settings.level = logging::level_for_verbosity(options.verbosity, spdlog::level::warn);
    logging::init_logging(settings);

    Config* config = Config::get_instance();
    config->init(options.config_path);

    const std::string configured = config->get<std::string>("/log_level", "warn");
    auto level = logging::parse_level(configured);
    if (!level) {
        spdlog::warn("[CLI] Unknown log_level '{}' in config, using warn", configured);
        level = spdlog::level::warn;
    }
    if (auto env_level = config::EnvironmentConfig::get_log_level()) {
        if (auto parsed = logging::parse_level(*env_level)) {
            level = parsed;
        } else {
            spdlog::warn("[CLI] Ignoring invalid CARDFORGE_LOG_LEVEL '{}'", *env_level);
        }
    }

    settings.level = logging::level_for_verbosity(options.verbosity, *level);
    settings.file_path = config->get<std::string>("/log_path", "");
    logging::init_logging(settings);

    load_logo_catalog();
}

void CliApplication::load_logo_catalog() {
    const std::string path = Config::get_instance()->get<std::string>("/logo_catalog", "");
    if (path.empty()) {
        return;
    }
    auto catalog = LogoCatalog::load_from_file(path);
    if (!catalog) {
        spdlog::warn("[CLI] Logo catalog {} unavailable, logos stay unchanged", path);
        return;
    }
    spdlog::info("[CLI] Loaded {} logo families from {}", catalog->family_count(), path);
    logo_catalog_ = std::make_unique<LogoCatalog>(std::move(*catalog));
}

int CliApplication::cmd_palette(const CliOptions& options) {
    std::optional<std::string> seed;
    if (!options.positionals.empty()) {
        seed = options.positionals[0];
    } else {
        seed = config::EnvironmentConfig::get_fixed_seed();
    }

    const PaletteGeneration generation = generate_palette_detailed(seed);
    json result = {{"seed", generation.seed},
                   {"tone", tone_name(generation.tone)},
                   {"mode", background_mode_name(generation.mode)},
                   {"baseHue", generation.base_hue},
                   {"palette", palette_to_json(generation.palette)}};
    out_ << std::setw(2) << result << "\n";
    return CLI_EXIT_OK;
}

int CliApplication::cmd_analyze(const CliOptions& options) {
    auto templ = load_template_arg(options.positionals[0]);
    if (!templ) {
        return CLI_EXIT_RUNTIME_ERROR;
    }
    const auto context = analyze_template(*templ, Config::get_instance()->get_analysis_options());
    out_ << std::setw(2) << context_map_to_json(context) << "\n";
    return CLI_EXIT_OK;
}

int CliApplication::cmd_apply(const CliOptions& options) {
    auto templ = load_template_arg(options.positionals[0]);
    if (!templ) {
        return CLI_EXIT_RUNTIME_ERROR;
    }

    const ColorPalette palette = generate_palette(options.positionals[1]);
    const auto context = analyze_template(*templ, Config::get_instance()->get_analysis_options());
    ThemeApplier applier(logo_catalog_.get());
    const CardTemplate themed = applier.apply(*templ, palette, context);

    if (options.output) {
        if (!save_template_to_file(themed, *options.output)) {
            return CLI_EXIT_RUNTIME_ERROR;
        }
        spdlog::info("[CLI] Wrote {} to {}", themed.id, *options.output);
        return CLI_EXIT_OK;
    }
    out_ << std::setw(2) << template_to_json(themed) << "\n";
    return CLI_EXIT_OK;
}

int CliApplication::cmd_variations(const CliOptions& options) {
    auto templ = load_template_arg(options.positionals[0]);
    if (!templ) {
        return CLI_EXIT_RUNTIME_ERROR;
    }

    VariationOptions variation_options = Config::get_instance()->get_variation_options();
    if (auto attempts = config::EnvironmentConfig::get_max_attempts()) {
        variation_options.max_attempts = *attempts;
    }
    std::optional<std::string> seed_base = options.seed;
    if (!seed_base) {
        seed_base = config::EnvironmentConfig::get_fixed_seed();
    }
    if (seed_base) {
        variation_options.seed_source = sequential_seeds(*seed_base);
    }

    const auto variants = generate_variations(*templ, variation_options, logo_catalog_.get());

    if (options.output) {
        if (!ensure_directory(*options.output)) {
            return CLI_EXIT_RUNTIME_ERROR;
        }
        int failures = 0;
        for (const auto& variant : variants) {
            if (!save_template_to_file(variant, *options.output + "/" + variant.id + ".json")) {
                ++failures;
            }
        }
        if (failures > 0) {
            spdlog::error("[CLI] {} of {} variants could not be written", failures,
                          variants.size());
            return CLI_EXIT_RUNTIME_ERROR;
        }
        spdlog::info("[CLI] Wrote {} variants to {}", variants.size(), *options.output);
        return CLI_EXIT_OK;
    }

    json result = json::array();
    for (const auto& variant : variants) {
        result.push_back(template_to_json(variant));
    }
    out_ << std::setw(2) << result << "\n";
    return CLI_EXIT_OK;
}

int CliApplication::cmd_presets() {
    json result = json::array();
    for (const auto& preset : backgrounds::PRESETS) {
        result.push_back({{"id", preset.id},
                          {"name", preset.name},
                          {"background", background_to_json(preset.to_pattern())}});
    }
    out_ << std::setw(2) << result << "\n";
    return CLI_EXIT_OK;
}

void CliApplication::print_usage(std::ostream& os) const {
    os << "Usage: cardforge [options] <command> [args]\n"
          "\n"
          "Commands:\n"
          "  palette [SEED]                       Generate a palette\n"
          "  analyze FILE                         Print the background context of each layer\n"
          "  apply FILE SEED [-o OUT]             Apply the palette for SEED to a template\n"
          "  variations FILE [-o DIR] [--seed B]  Generate themed variants of a template\n"
          "  presets                              List background presets\n"
          "\n"
          "Options:\n"
          "  -c, --config PATH   Config file (default "
       << DEFAULT_CONFIG_PATH
       << ")\n"
          "  -v, -vv             Debug / trace logging\n"
          "  --version           Print version\n"
          "  -h, --help          Show this help\n";
}

} // namespace cardforge
