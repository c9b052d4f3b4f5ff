// SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "core/argument_parser.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>
#include <initializer_list>
#include <vector>

namespace bim::core::args {

    namespace {
        std::expected<ParsedArgs, std::string> parse(std::initializer_list<const char*> extra) {
            std::vector<const char*> argv = {"bimscope", "--log-level", "error"};
            argv.insert(argv.end(), extra.begin(), extra.end());
            return parse_args(static_cast<int>(argv.size()), argv.data());
        }

        const param::SnapshotParameters& snapshot(const std::expected<ParsedArgs, std::string>& result) {
            return *std::get<SnapshotMode>(*result).params;
        }
    } // namespace

    // ---------------------------------------------------------------------------
    // Section specs
    // ---------------------------------------------------------------------------

    TEST(ParseSectionSpec, AxisAndOffset) {
        const auto spec = parse_section_spec("z:2.5");
        ASSERT_TRUE(spec.has_value()) << spec.error();
        EXPECT_EQ(spec->axis, "z");
        EXPECT_FLOAT_EQ(spec->offset, 2.5f);

        const auto negative = parse_section_spec("-x:-1");
        ASSERT_TRUE(negative.has_value());
        EXPECT_EQ(negative->axis, "-x");
        EXPECT_FLOAT_EQ(negative->offset, -1.0f);
    }

    TEST(ParseSectionSpec, OffsetDefaultsToZero) {
        const auto spec = parse_section_spec("-y");
        ASSERT_TRUE(spec.has_value());
        EXPECT_EQ(spec->axis, "-y");
        EXPECT_FLOAT_EQ(spec->offset, 0.0f);
    }

    TEST(ParseSectionSpec, Rejects) {
        EXPECT_FALSE(parse_section_spec("w:1").has_value());
        EXPECT_FALSE(parse_section_spec("Z:1").has_value());
        EXPECT_FALSE(parse_section_spec("z:").has_value());
        EXPECT_FALSE(parse_section_spec("z:abc").has_value());
        EXPECT_FALSE(parse_section_spec("z:1.5m").has_value());
        EXPECT_FALSE(parse_section_spec("").has_value());
    }

    // ---------------------------------------------------------------------------
    // Command line
    // ---------------------------------------------------------------------------

    TEST(ParseArgs, MinimalSnapshot) {
        const auto result = parse({"-m", "building.glb", "-o", "view.png"});
        ASSERT_TRUE(result.has_value()) << result.error();
        ASSERT_TRUE(std::holds_alternative<SnapshotMode>(*result));

        const auto& params = snapshot(result);
        EXPECT_EQ(params.model_path.generic_string(), "building.glb");
        EXPECT_EQ(params.output_path.generic_string(), "view.png");
        EXPECT_EQ(params.viewer.image_export.format, "png");
        EXPECT_TRUE(params.sections.empty());
        EXPECT_FALSE(params.ortho_axis.has_value());
        EXPECT_FALSE(params.transparent);
        EXPECT_FALSE(params.fit);
        EXPECT_EQ(params.log_level, LogLevel::Error);
    }

    TEST(ParseArgs, FullSnapshot) {
        const auto result = parse({"--model", "building.glb", "--metadata", "building.json",
                                   "--filter", "walls.json", "--section", "z:3", "--section=-x:1.5",
                                   "--ortho", "z", "--fit", "--width", "800", "--height", "600",
                                   "--transparent", "--background", "#202020", "--output", "plan.PNG"});
        ASSERT_TRUE(result.has_value()) << result.error();

        const auto& params = snapshot(result);
        EXPECT_EQ(params.metadata_path.generic_string(), "building.json");
        EXPECT_EQ(params.filter_path.generic_string(), "walls.json");
        ASSERT_EQ(params.sections.size(), 2u);
        EXPECT_EQ(params.sections[0].axis, "z");
        EXPECT_FLOAT_EQ(params.sections[0].offset, 3.0f);
        EXPECT_EQ(params.sections[1].axis, "-x");
        EXPECT_EQ(params.ortho_axis, "z");
        EXPECT_TRUE(params.fit);
        EXPECT_EQ(params.width, 800);
        EXPECT_EQ(params.height, 600);
        EXPECT_TRUE(params.transparent);
        EXPECT_EQ(params.background, "#202020");
        EXPECT_EQ(params.viewer.image_export.format, "png");
    }

    TEST(ParseArgs, FormatFromExtensionOrFlag) {
        EXPECT_EQ(snapshot(parse({"-m", "a.glb", "-o", "shot.jpg"})).viewer.image_export.format, "jpeg");

        const auto flagged = parse({"-m", "a.glb", "-o", "shot", "-f", "JPEG", "--quality", "0.5"});
        ASSERT_TRUE(flagged.has_value()) << flagged.error();
        EXPECT_EQ(snapshot(flagged).viewer.image_export.format, "jpeg");
        EXPECT_FLOAT_EQ(snapshot(flagged).viewer.image_export.quality, 0.5f);
    }

    TEST(ParseArgs, Errors) {
        EXPECT_FALSE(parse({"-o", "view.png"}).has_value());
        EXPECT_FALSE(parse({"-m", "a.glb"}).has_value());
        EXPECT_FALSE(parse({"-m", "a.glb", "-o", "view.gif"}).has_value());
        EXPECT_FALSE(parse({"-m", "a.glb", "-o", "view.png", "--format", "bmp"}).has_value());
        EXPECT_FALSE(parse({"-m", "a.glb", "-o", "view.png", "--ortho", "-z"}).has_value());
        EXPECT_FALSE(parse({"-m", "a.glb", "-o", "view.png", "--section", "q:1"}).has_value());
        EXPECT_FALSE(parse({"-m", "a.glb", "-o", "view.png", "--width", "0"}).has_value());
        EXPECT_FALSE(parse({"-m", "a.glb", "-o", "view.png", "--quality", "2"}).has_value());
        EXPECT_FALSE(parse({"-m", "a.glb", "-o", "view.png", "--unknown"}).has_value());
    }

    TEST(ParseArgs, HelpMode) {
        testing::internal::CaptureStdout();
        const auto result = parse({"--help"});
        const std::string help = testing::internal::GetCapturedStdout();

        ASSERT_TRUE(result.has_value());
        EXPECT_TRUE(std::holds_alternative<HelpMode>(*result));
        EXPECT_NE(help.find("--section"), std::string::npos);
    }

    TEST(ParseArgs, ConfigFileThenOverrides) {
        const test::TempDir dir("bimscope_argument_parser");
        const auto config = dir.write("viewer.json", R"({
            "export": {"format": "jpeg", "quality": 0.4},
            "camera": {"fov_y_degrees": 30}
        })");

        const auto result = parse({"-m", "a.glb", "-o", "view.png", "--config", config.c_str()});
        ASSERT_TRUE(result.has_value()) << result.error();

        const auto& viewer = snapshot(result).viewer;
        EXPECT_FLOAT_EQ(viewer.camera.fov_y_degrees, 30.0f);
        EXPECT_FLOAT_EQ(viewer.image_export.quality, 0.4f);
        // Output extension wins over the config file
        EXPECT_EQ(viewer.image_export.format, "png");

        EXPECT_FALSE(parse({"-m", "a.glb", "-o", "view.png", "--config", "/nonexistent/viewer.json"}).has_value());
    }

} // namespace bim::core::args
