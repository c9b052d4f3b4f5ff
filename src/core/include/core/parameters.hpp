/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include "core/logger.hpp"

#include <array>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace bim::core {
    namespace param {

        struct BIM_CORE_API SelectionParameters {
            std::array<float, 3> highlight_color = {0.0f, 1.0f, 0.0f}; // RGB [0-1]
            std::array<float, 3> emissive_color = {0.0f, 1.0f, 0.0f};
            float emissive_intensity = 0.5f;
            float roughness = 0.5f;
            float metalness = 0.2f;

            nlohmann::json to_json() const;
            static SelectionParameters from_json(const nlohmann::json& j);
        };

        struct BIM_CORE_API ClippingParameters {
            float helper_size = 5.0f; // edge length of the plane quad
            std::array<float, 3> helper_color = {0.0f, 1.0f, 0.0f};

            nlohmann::json to_json() const;
            static ClippingParameters from_json(const nlohmann::json& j);
        };

        struct BIM_CORE_API ExportParameters {
            std::string format = "png"; // png, jpeg
            float quality = 0.92f;      // jpeg only, [0-1]

            nlohmann::json to_json() const;
            static ExportParameters from_json(const nlohmann::json& j);
        };

        struct BIM_CORE_API CameraParameters {
            float fov_y_degrees = 50.0f;
            float near_plane = 0.1f;
            float far_plane = 2000.0f;
            std::array<float, 3> placement_offset = {0.7f, 0.5f, 0.7f}; // multiples of the fit distance
            float fit_size = 10.0f;                                      // target for scale-to-fit

            nlohmann::json to_json() const;
            static CameraParameters from_json(const nlohmann::json& j);
        };

        struct BIM_CORE_API ViewerParameters {
            SelectionParameters selection;
            ClippingParameters clipping;
            ExportParameters image_export;
            CameraParameters camera;

            nlohmann::json to_json() const;
            static ViewerParameters from_json(const nlohmann::json& j);

            // Empty string when valid
            [[nodiscard]] std::string validate() const;
        };

        struct SectionSpec {
            std::string axis; // x, -x, y, -y, z, -z
            float offset = 0.0f;
        };

        // Parameters for the headless snapshot command
        struct BIM_CORE_API SnapshotParameters {
            std::filesystem::path model_path;
            std::filesystem::path metadata_path; // optional
            std::filesystem::path filter_path;   // optional, filter criteria json
            std::filesystem::path output_path;

            std::vector<SectionSpec> sections;
            std::optional<std::string> ortho_axis; // x, y, z
            std::optional<int> width;
            std::optional<int> height;
            bool transparent = false;
            std::optional<std::string> background; // #rrggbb
            bool fit = false;

            LogLevel log_level = LogLevel::Info;
            std::string log_file;

            ViewerParameters viewer;
        };

        BIM_CORE_API std::expected<ViewerParameters, std::string> read_viewer_params_from_json(const std::filesystem::path& path);

        BIM_CORE_API std::expected<void, std::string> save_viewer_params_to_json(
            const ViewerParameters& params,
            const std::filesystem::path& output_path);

    } // namespace param
} // namespace bim::core
