/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/parameters.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include <chrono>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>

namespace bim::core {
    namespace param {
        namespace {
            std::expected<nlohmann::json, std::string> read_json_file(const std::filesystem::path& path) {
                if (!std::filesystem::exists(path)) {
                    return std::unexpected(std::format("Config file not found: {}", path_to_utf8(path)));
                }

                std::ifstream file;
                if (!open_file_for_read(path, file)) {
                    return std::unexpected(std::format("Cannot open config: {}", path_to_utf8(path)));
                }

                try {
                    std::stringstream buffer;
                    buffer << file.rdbuf();
                    return nlohmann::json::parse(buffer.str());
                } catch (const nlohmann::json::parse_error& e) {
                    return std::unexpected(std::format("JSON parse error in {}: {}", path_to_utf8(path), e.what()));
                }
            }

            void read_color(const nlohmann::json& j, const char* key, std::array<float, 3>& out) {
                if (!j.contains(key))
                    return;
                const auto& value = j[key];
                if (!value.is_array() || value.size() != 3) {
                    LOG_WARN("Ignoring '{}': expected an array of 3 numbers", key);
                    return;
                }
                for (size_t i = 0; i < 3; ++i) {
                    out[i] = value[i].get<float>();
                }
            }
        } // namespace

        nlohmann::json SelectionParameters::to_json() const {
            nlohmann::json json;
            json["highlight_color"] = highlight_color;
            json["emissive_color"] = emissive_color;
            json["emissive_intensity"] = emissive_intensity;
            json["roughness"] = roughness;
            json["metalness"] = metalness;
            return json;
        }

        SelectionParameters SelectionParameters::from_json(const nlohmann::json& j) {
            SelectionParameters params;
            read_color(j, "highlight_color", params.highlight_color);
            read_color(j, "emissive_color", params.emissive_color);
            if (j.contains("emissive_intensity")) {
                params.emissive_intensity = j["emissive_intensity"];
            }
            if (j.contains("roughness")) {
                params.roughness = j["roughness"];
            }
            if (j.contains("metalness")) {
                params.metalness = j["metalness"];
            }
            return params;
        }

        nlohmann::json ClippingParameters::to_json() const {
            nlohmann::json json;
            json["helper_size"] = helper_size;
            json["helper_color"] = helper_color;
            return json;
        }

        ClippingParameters ClippingParameters::from_json(const nlohmann::json& j) {
            ClippingParameters params;
            if (j.contains("helper_size")) {
                params.helper_size = j["helper_size"];
            }
            read_color(j, "helper_color", params.helper_color);
            return params;
        }

        nlohmann::json ExportParameters::to_json() const {
            nlohmann::json json;
            json["format"] = format;
            json["quality"] = quality;
            return json;
        }

        ExportParameters ExportParameters::from_json(const nlohmann::json& j) {
            ExportParameters params;
            if (j.contains("format")) {
                const std::string format = j["format"];
                if (format == "png" || format == "jpeg" || format == "jpg") {
                    params.format = format == "jpg" ? "jpeg" : format;
                } else {
                    LOG_WARN("Invalid export format '{}' in JSON, using default", format);
                }
            }
            if (j.contains("quality")) {
                params.quality = j["quality"];
            }
            return params;
        }

        nlohmann::json CameraParameters::to_json() const {
            nlohmann::json json;
            json["fov_y_degrees"] = fov_y_degrees;
            json["near_plane"] = near_plane;
            json["far_plane"] = far_plane;
            json["placement_offset"] = placement_offset;
            json["fit_size"] = fit_size;
            return json;
        }

        CameraParameters CameraParameters::from_json(const nlohmann::json& j) {
            CameraParameters params;
            if (j.contains("fov_y_degrees")) {
                params.fov_y_degrees = j["fov_y_degrees"];
            }
            if (j.contains("near_plane")) {
                params.near_plane = j["near_plane"];
            }
            if (j.contains("far_plane")) {
                params.far_plane = j["far_plane"];
            }
            read_color(j, "placement_offset", params.placement_offset);
            if (j.contains("fit_size")) {
                params.fit_size = j["fit_size"];
            }
            return params;
        }

        nlohmann::json ViewerParameters::to_json() const {
            nlohmann::json json;
            json["selection"] = selection.to_json();
            json["clipping"] = clipping.to_json();
            json["export"] = image_export.to_json();
            json["camera"] = camera.to_json();
            return json;
        }

        ViewerParameters ViewerParameters::from_json(const nlohmann::json& j) {
            ViewerParameters params;
            if (j.contains("selection")) {
                params.selection = SelectionParameters::from_json(j["selection"]);
            }
            if (j.contains("clipping")) {
                params.clipping = ClippingParameters::from_json(j["clipping"]);
            }
            if (j.contains("export")) {
                params.image_export = ExportParameters::from_json(j["export"]);
            }
            if (j.contains("camera")) {
                params.camera = CameraParameters::from_json(j["camera"]);
            }
            return params;
        }

        std::string ViewerParameters::validate() const {
            if (image_export.quality < 0.0f || image_export.quality > 1.0f)
                return "export.quality must be between 0.0 and 1.0";
            if (clipping.helper_size <= 0.0f)
                return "clipping.helper_size must be greater than 0";
            if (camera.fov_y_degrees <= 0.0f || camera.fov_y_degrees >= 180.0f)
                return "camera.fov_y_degrees must be in (0, 180)";
            if (camera.near_plane <= 0.0f || camera.far_plane <= camera.near_plane)
                return "camera.near_plane must be positive and below camera.far_plane";
            if (camera.fit_size <= 0.0f)
                return "camera.fit_size must be greater than 0";
            return {};
        }

        std::expected<ViewerParameters, std::string> read_viewer_params_from_json(const std::filesystem::path& path) {
            auto json_result = read_json_file(path);
            if (!json_result) {
                return std::unexpected(json_result.error());
            }

            try {
                auto params = ViewerParameters::from_json(*json_result);
                if (const auto error = params.validate(); !error.empty()) {
                    return std::unexpected(std::format("Invalid config {}: {}", path_to_utf8(path), error));
                }
                return params;
            } catch (const std::exception& e) {
                return std::unexpected(std::format("Error parsing viewer parameters: {}", e.what()));
            }
        }

        std::expected<void, std::string> save_viewer_params_to_json(
            const ViewerParameters& params,
            const std::filesystem::path& output_path) {
            try {
                nlohmann::json json = params.to_json();

                const auto now = std::chrono::system_clock::now();
                const auto time_t = std::chrono::system_clock::to_time_t(now);
                std::stringstream ss;
                ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
                json["timestamp"] = ss.str();

                const std::filesystem::path filepath = (output_path.extension() == ".json")
                                                           ? output_path
                                                           : output_path / "viewer_config.json";
                std::ofstream file;
                if (!open_file_for_write(filepath, file)) {
                    return std::unexpected(std::format("Cannot write: {}", path_to_utf8(filepath)));
                }

                file << json.dump(4);
                LOG_INFO("Saved config: {}", path_to_utf8(filepath));
                return {};
            } catch (const std::exception& e) {
                return std::unexpected(std::format("Error saving viewer parameters: {}", e.what()));
            }
        }

    } // namespace param
} // namespace bim::core
