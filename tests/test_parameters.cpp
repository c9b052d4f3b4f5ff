// SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "core/parameters.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace bim::core::param {

    TEST(ViewerParameters, DefaultsAreValid) {
        const ViewerParameters params;
        EXPECT_TRUE(params.validate().empty());
        EXPECT_EQ(params.image_export.format, "png");
        EXPECT_FLOAT_EQ(params.image_export.quality, 0.92f);
        EXPECT_FLOAT_EQ(params.camera.fov_y_degrees, 50.0f);
    }

    TEST(ViewerParameters, JsonRoundTrip) {
        ViewerParameters params;
        params.selection.highlight_color = {1.0f, 0.5f, 0.0f};
        params.clipping.helper_size = 12.0f;
        params.image_export.format = "jpeg";
        params.image_export.quality = 0.7f;
        params.camera.fit_size = 25.0f;

        const auto restored = ViewerParameters::from_json(params.to_json());
        EXPECT_EQ(restored.selection.highlight_color, params.selection.highlight_color);
        EXPECT_FLOAT_EQ(restored.clipping.helper_size, 12.0f);
        EXPECT_EQ(restored.image_export.format, "jpeg");
        EXPECT_FLOAT_EQ(restored.image_export.quality, 0.7f);
        EXPECT_FLOAT_EQ(restored.camera.fit_size, 25.0f);
    }

    TEST(ViewerParameters, PartialJsonKeepsDefaults) {
        const auto params = ViewerParameters::from_json(nlohmann::json::parse(R"({
            "export": {"format": "jpg"},
            "clipping": {"helper_color": [1, 0]}
        })"));
        EXPECT_EQ(params.image_export.format, "jpeg");
        EXPECT_FLOAT_EQ(params.image_export.quality, 0.92f);
        EXPECT_EQ(params.clipping.helper_color, (std::array<float, 3>{0.0f, 1.0f, 0.0f}));

        const auto bad_format = ExportParameters::from_json(nlohmann::json::parse(R"({"format": "gif"})"));
        EXPECT_EQ(bad_format.format, "png");
    }

    TEST(ViewerParameters, ValidateReportsFirstProblem) {
        ViewerParameters params;
        params.image_export.quality = 1.5f;
        EXPECT_NE(params.validate().find("quality"), std::string::npos);

        params = {};
        params.camera.near_plane = 10.0f;
        params.camera.far_plane = 5.0f;
        EXPECT_NE(params.validate().find("near_plane"), std::string::npos);

        params = {};
        params.camera.fov_y_degrees = 180.0f;
        EXPECT_FALSE(params.validate().empty());

        params = {};
        params.clipping.helper_size = 0.0f;
        EXPECT_FALSE(params.validate().empty());
    }

    TEST(ViewerParametersFile, SaveThenRead) {
        const test::TempDir dir("bimscope_parameters");
        ViewerParameters params;
        params.camera.fov_y_degrees = 35.0f;

        const auto saved = save_viewer_params_to_json(params, dir.path() / "viewer.json");
        ASSERT_TRUE(saved.has_value()) << saved.error();

        const auto loaded = read_viewer_params_from_json(dir.path() / "viewer.json");
        ASSERT_TRUE(loaded.has_value()) << loaded.error();
        EXPECT_FLOAT_EQ(loaded->camera.fov_y_degrees, 35.0f);
    }

    TEST(ViewerParametersFile, SaveIntoDirectoryUsesDefaultName) {
        const test::TempDir dir("bimscope_parameters_dir");
        ASSERT_TRUE(save_viewer_params_to_json(ViewerParameters{}, dir.path()).has_value());
        EXPECT_TRUE(std::filesystem::exists(dir.path() / "viewer_config.json"));
    }

    TEST(ViewerParametersFile, ReadErrors) {
        const test::TempDir dir("bimscope_parameters_errors");

        const auto missing = read_viewer_params_from_json(dir.path() / "missing.json");
        ASSERT_FALSE(missing.has_value());
        EXPECT_NE(missing.error().find("not found"), std::string::npos);

        const auto malformed = read_viewer_params_from_json(dir.write("bad.json", "{ nope"));
        ASSERT_FALSE(malformed.has_value());
        EXPECT_NE(malformed.error().find("parse error"), std::string::npos);

        const auto invalid = read_viewer_params_from_json(dir.write("invalid.json", R"({"export": {"quality": 4}})"));
        ASSERT_FALSE(invalid.has_value());
        EXPECT_NE(invalid.error().find("quality"), std::string::npos);

        const auto wrong_type = read_viewer_params_from_json(dir.write("type.json", R"({"camera": {"fit_size": "big"}})"));
        EXPECT_FALSE(wrong_type.has_value());
    }

} // namespace bim::core::param
