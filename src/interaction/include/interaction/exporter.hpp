/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "io/error.hpp"
#include "rendering/image.hpp"
#include "rendering/image_codec.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bim::core {
    class Scene;
    class ViewCamera;
} // namespace bim::core

namespace bim::rendering {
    class Renderer;
}

namespace bim::interaction {

    enum class ViewAxis : uint8_t {
        X,
        Y,
        Z
    };

    [[nodiscard]] std::optional<ViewAxis> view_axis_from_string(std::string_view str);

    struct ExportOptions {
        std::optional<int> width;  // default: current drawing-buffer width
        std::optional<int> height; // default: current drawing-buffer height
        rendering::ImageFormat format = rendering::ImageFormat::Png;
        float quality = rendering::DEFAULT_JPEG_QUALITY; // JPEG only
        bool transparent = false;                        // PNG only
        std::optional<std::string> background_color;     // "#rrggbb"
    };

    struct ExportResult {
        std::string data_url;
        std::vector<uint8_t> blob;
        int width = 0;
        int height = 0;
        size_t size = 0;
        rendering::ImageFormat format = rendering::ImageFormat::Png;
        std::chrono::system_clock::time_point timestamp;
    };

    // "512 B", "1.50 KB", "2.00 MB"
    [[nodiscard]] std::string format_file_size(uint64_t bytes);

    // "#rrggbb" (or "rrggbb") to linear [0, 1] RGB
    [[nodiscard]] std::optional<glm::vec3> parse_hex_color(std::string_view hex);

    /**
     * @brief Renders still images from the current view.
     *
     * Every export snapshots the renderer's size, pixel ratio, background and
     * clear alpha, mutates them for the export frame, and restores them (then
     * re-renders) on every exit path, including exceptions thrown by the
     * renderer. Camera pose and camera swaps are restored the same way.
     */
    class Exporter {
    public:
        Exporter() = default;
        Exporter(rendering::Renderer* renderer, core::Scene* scene, core::ViewCamera* camera);

        void setRenderer(rendering::Renderer* renderer) { renderer_ = renderer; }
        void setScene(core::Scene* scene) { scene_ = scene; }
        void setCamera(core::ViewCamera* camera) { camera_ = camera; }
        [[nodiscard]] core::ViewCamera* getCamera() const { return camera_; }

        io::Result<ExportResult> exportImage(const ExportOptions& options = {});

        // Temporarily moves the camera to position, aimed at target
        io::Result<ExportResult> exportSection(const glm::vec3& camera_position, const glm::vec3& target,
                                               const ExportOptions& options = {});

        // Orthographic view of the whole scene (helpers excluded) along +axis
        io::Result<ExportResult> exportOrthographic(ViewAxis axis, const ExportOptions& options = {});

        static io::Result<void> writeToFile(const ExportResult& result, const std::filesystem::path& path);

    private:
        [[nodiscard]] io::Result<void> checkReady() const;

        rendering::Renderer* renderer_ = nullptr;
        core::Scene* scene_ = nullptr;
        core::ViewCamera* camera_ = nullptr;
    };

} // namespace bim::interaction
