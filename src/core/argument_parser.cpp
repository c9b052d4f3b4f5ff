/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/argument_parser.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include <algorithm>
#include <args.hxx>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <print>
#include <string_view>

namespace {

    constexpr std::array<std::string_view, 6> SECTION_AXES = {"x", "-x", "y", "-y", "z", "-z"};
    constexpr std::array<std::string_view, 3> ORTHO_AXES = {"x", "y", "z"};

    constexpr const char* HELP_HEADER = "bimscope: headless BIM model snapshots.\n";
    constexpr const char* HELP_FOOTER =
        "\n"
        "EXAMPLES:\n"
        "bimscope -m building.glb -o view.png\n"
        "bimscope -m building.glb --metadata building.json --filter walls.json -o walls.png\n"
        "bimscope -m building.glb --section z:3.0 --ortho z --width 2000 --height 1500 -o plan.png\n"
        "\n"
        "ENVIRONMENT:\n"
        "LOG_LEVEL -- Set log level (trace/debug/info/perf/warn/error)\n";

    enum class ParseResult {
        Success,
        Help
    };

    std::optional<std::string> normalize_format(std::string str) {
        std::transform(str.begin(), str.end(), str.begin(),
                       [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!str.empty() && str.front() == '.')
            str.erase(0, 1);
        if (str == "png")
            return std::string("png");
        if (str == "jpeg" || str == "jpg")
            return std::string("jpeg");
        return std::nullopt;
    }

    std::expected<ParseResult, std::string> parse_arguments(
        const std::vector<std::string>& args,
        bim::core::param::SnapshotParameters& params,
        std::optional<std::string>& config_file,
        std::optional<std::string>& format_override,
        std::optional<float>& quality_override) {

        try {
            ::args::ArgumentParser parser(HELP_HEADER, HELP_FOOTER);
            parser.helpParams.width = 160;

            // =============================================================================
            // INPUT
            // =============================================================================
            ::args::Group input_group(parser, "INPUT:");
            ::args::HelpFlag help(input_group, "help", "Display help menu", {'h', "help"});
            ::args::ValueFlag<std::string> model(input_group, "path", "Model file or file:// URL (.glb, .gltf, .obj, .fbx, .dae, .stl, .ply)", {'m', "model"});
            ::args::ValueFlag<std::string> metadata(input_group, "path", "Element metadata document (json)", {"metadata"});
            ::args::ValueFlag<std::string> config(input_group, "path", "Viewer config file (json)", {"config"});

            // =============================================================================
            // VIEW
            // =============================================================================
            ::args::Group view_sep(parser, " ");
            ::args::Group view_group(parser, "VIEW:");
            ::args::ValueFlag<std::string> filter(view_group, "path", "Filter criteria (json)", {"filter"});
            ::args::ValueFlagList<std::string> sections(view_group, "axis:offset", "Section plane, axis one of x,-x,y,-y,z,-z (repeatable)", {"section"});
            ::args::ValueFlag<std::string> ortho(view_group, "axis", "Orthographic view along x, y or z", {"ortho"});
            ::args::Flag fit(view_group, "fit", "Center the model and scale it to the configured fit size", {"fit"});

            // =============================================================================
            // OUTPUT
            // =============================================================================
            ::args::Group output_sep(parser, " ");
            ::args::Group output_group(parser, "OUTPUT:");
            ::args::ValueFlag<std::string> output(output_group, "path", "Output image path", {'o', "output"});
            ::args::ValueFlag<int> width(output_group, "px", "Image width", {"width"});
            ::args::ValueFlag<int> height(output_group, "px", "Image height", {"height"});
            ::args::ValueFlag<std::string> format(output_group, "format", "png or jpeg (default: from output extension)", {'f', "format"});
            ::args::ValueFlag<float> quality(output_group, "quality", "JPEG quality [0-1]", {"quality"});
            ::args::Flag transparent(output_group, "transparent", "Transparent background (png only)", {"transparent"});
            ::args::ValueFlag<std::string> background(output_group, "color", "Background colour #rrggbb", {"background"});

            // =============================================================================
            // LOGGING
            // =============================================================================
            ::args::Group log_sep(parser, " ");
            ::args::Group log_group(parser, "LOGGING:");
            ::args::ValueFlag<std::string> log_level(log_group, "level", "Log level: trace, debug, info, perf, warn, error, critical, off", {"log-level"});
            ::args::ValueFlag<std::string> log_file(log_group, "path", "Also write logs to this file", {"log-file"});
            ::args::ValueFlag<std::string> log_filter(log_group, "pattern", "Only log messages matching the glob pattern", {"log-filter"});

            try {
                parser.Prog(args.front());
                parser.ParseArgs(std::vector<std::string>(args.begin() + 1, args.end()));
            } catch (const ::args::Help&) {
                std::print("{}", parser.Help());
                return ParseResult::Help;
            } catch (const ::args::ParseError& e) {
                return std::unexpected(std::format("Parse error: {}\n{}", e.what(), parser.Help()));
            }

            // Initialize logger (CLI args override environment variable)
            {
                auto level = bim::core::LogLevel::Info;
                if (const char* env_level = std::getenv("LOG_LEVEL")) {
                    level = bim::core::parse_log_level(env_level);
                }
                if (log_level) {
                    level = bim::core::parse_log_level(::args::get(log_level));
                }
                const std::string file_path = log_file ? ::args::get(log_file) : std::string{};
                const std::string filter_pattern = log_filter ? ::args::get(log_filter) : std::string{};

                bim::core::Logger::get().init({.console_level = level, .file = file_path, .filter_pattern = filter_pattern});
                params.log_level = level;
                params.log_file = file_path;

                LOG_DEBUG("Logger initialized with level: {}", bim::core::log_level_name(level));
                if (!file_path.empty()) {
                    LOG_DEBUG("Logging to file: {}", file_path);
                }
            }

            if (!model) {
                return std::unexpected(std::format("Missing --model\n\n{}", parser.Help()));
            }
            if (!output) {
                return std::unexpected(std::format("Missing --output\n\n{}", parser.Help()));
            }

            params.model_path = bim::core::utf8_to_path(::args::get(model));
            params.output_path = bim::core::utf8_to_path(::args::get(output));
            if (metadata)
                params.metadata_path = bim::core::utf8_to_path(::args::get(metadata));
            if (filter)
                params.filter_path = bim::core::utf8_to_path(::args::get(filter));
            if (config)
                config_file = ::args::get(config);

            for (const auto& spec : ::args::get(sections)) {
                auto section = bim::core::args::parse_section_spec(spec);
                if (!section)
                    return std::unexpected(section.error());
                params.sections.push_back(std::move(*section));
            }

            if (ortho) {
                const auto axis = ::args::get(ortho);
                if (std::find(ORTHO_AXES.begin(), ORTHO_AXES.end(), axis) == ORTHO_AXES.end()) {
                    return std::unexpected(std::format("Invalid --ortho axis '{}'. Use: x, y, z", axis));
                }
                params.ortho_axis = axis;
            }

            if (width) {
                if (::args::get(width) <= 0)
                    return std::unexpected("--width must be positive");
                params.width = ::args::get(width);
            }
            if (height) {
                if (::args::get(height) <= 0)
                    return std::unexpected("--height must be positive");
                params.height = ::args::get(height);
            }

            if (format) {
                format_override = normalize_format(::args::get(format));
                if (!format_override) {
                    return std::unexpected(std::format("Invalid format '{}'. Use: png, jpeg", ::args::get(format)));
                }
            } else if (params.output_path.has_extension()) {
                format_override = normalize_format(params.output_path.extension().string());
                if (!format_override) {
                    return std::unexpected(std::format("Unknown extension '{}'. Use --format",
                                                       params.output_path.extension().string()));
                }
            }

            if (quality)
                quality_override = ::args::get(quality);
            if (background)
                params.background = ::args::get(background);
            params.transparent = ::args::get(transparent);
            params.fit = ::args::get(fit);

            return ParseResult::Success;

        } catch (const std::exception& e) {
            return std::unexpected(std::format("Unexpected error during argument parsing: {}", e.what()));
        }
    }

    std::vector<std::string> convert_args(int argc, const char* const argv[]) {
        return std::vector<std::string>(argv, argv + argc);
    }

} // anonymous namespace

std::expected<bim::core::param::SectionSpec, std::string>
bim::core::args::parse_section_spec(const std::string& spec) {
    const auto colon = spec.find(':');
    const std::string axis = spec.substr(0, colon);
    if (std::find(SECTION_AXES.begin(), SECTION_AXES.end(), axis) == SECTION_AXES.end()) {
        return std::unexpected(std::format("Invalid section '{}': axis must be one of x, -x, y, -y, z, -z", spec));
    }

    param::SectionSpec section;
    section.axis = axis;
    if (colon == std::string::npos)
        return section;

    const char* begin = spec.data() + colon + 1;
    const char* end = spec.data() + spec.size();
    const auto [ptr, ec] = std::from_chars(begin, end, section.offset);
    if (ec != std::errc{} || ptr != end) {
        return std::unexpected(std::format("Invalid section '{}': offset is not a number", spec));
    }
    return section;
}

// Public interface
std::expected<bim::core::args::ParsedArgs, std::string>
bim::core::args::parse_args(int argc, const char* const argv[]) {

    auto params = std::make_unique<param::SnapshotParameters>();
    std::optional<std::string> config_file;
    std::optional<std::string> format_override;
    std::optional<float> quality_override;

    auto parse_result = parse_arguments(convert_args(argc, argv), *params,
                                        config_file, format_override, quality_override);
    if (!parse_result) {
        return std::unexpected(parse_result.error());
    }
    if (*parse_result == ParseResult::Help) {
        return HelpMode{};
    }

    // Load from --config or keep defaults, then apply command line overrides
    if (config_file) {
        auto viewer_result = param::read_viewer_params_from_json(utf8_to_path(*config_file));
        if (!viewer_result) {
            return std::unexpected(std::format("Config load failed: {}", viewer_result.error()));
        }
        params->viewer = std::move(*viewer_result);
    }

    if (format_override)
        params->viewer.image_export.format = *format_override;
    if (quality_override)
        params->viewer.image_export.quality = *quality_override;

    if (auto error = params->viewer.validate(); !error.empty())
        return std::unexpected("ERROR: " + error);

    return SnapshotMode{std::move(params)};
}
