/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "interaction/exporter.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include "core/scene.hpp"
#include "core/view_camera.hpp"
#include "rendering/renderer.hpp"
#include <cctype>
#include <exception>
#include <format>
#include <fstream>

namespace bim::interaction {

    namespace {
        constexpr float ORTHO_NEAR = 0.1f;
        constexpr float ORTHO_FAR_FACTOR = 10.0f;
        constexpr float ORTHO_DISTANCE_FACTOR = 2.0f;

        void render_or_log(rendering::Renderer& renderer, const core::Scene& scene, const core::ViewCamera& camera) {
            try {
                renderer.render(scene, camera);
            } catch (const std::exception& e) {
                LOG_ERROR("Re-render after export failed: {}", e.what());
            }
        }

        // Restores renderer output state and re-renders with whatever camera is active at scope exit
        class RendererStateGuard {
        public:
            RendererStateGuard(rendering::Renderer& renderer, const core::Scene& scene, core::ViewCamera* const& camera)
                : renderer_(renderer),
                  scene_(scene),
                  camera_(camera),
                  size_(renderer.getSize()),
                  pixel_ratio_(renderer.getPixelRatio()),
                  background_(renderer.getBackground()),
                  clear_alpha_(renderer.getClearAlpha()) {}

            ~RendererStateGuard() {
                renderer_.setSize(size_.x, size_.y);
                renderer_.setPixelRatio(pixel_ratio_);
                renderer_.setBackground(background_);
                renderer_.setClearAlpha(clear_alpha_);
                if (camera_) {
                    render_or_log(renderer_, scene_, *camera_);
                }
            }

            RendererStateGuard(const RendererStateGuard&) = delete;
            RendererStateGuard& operator=(const RendererStateGuard&) = delete;

        private:
            rendering::Renderer& renderer_;
            const core::Scene& scene_;
            core::ViewCamera* const& camera_;
            glm::ivec2 size_;
            float pixel_ratio_;
            std::optional<glm::vec3> background_;
            float clear_alpha_;
        };

        // Restores the camera pose and re-renders from it, so the last frame is the original view
        class CameraPoseGuard {
        public:
            CameraPoseGuard(core::ViewCamera& camera, rendering::Renderer& renderer, const core::Scene& scene)
                : camera_(camera),
                  renderer_(renderer),
                  scene_(scene),
                  position_(camera.position),
                  orientation_(camera.orientation) {}

            ~CameraPoseGuard() {
                camera_.position = position_;
                camera_.orientation = orientation_;
                render_or_log(renderer_, scene_, camera_);
            }

            CameraPoseGuard(const CameraPoseGuard&) = delete;
            CameraPoseGuard& operator=(const CameraPoseGuard&) = delete;

        private:
            core::ViewCamera& camera_;
            rendering::Renderer& renderer_;
            const core::Scene& scene_;
            glm::vec3 position_;
            glm::quat orientation_;
        };

        // Points the exporter at a temporary camera, then swaps the original back and re-renders with it
        class CameraSwapGuard {
        public:
            CameraSwapGuard(core::ViewCamera*& slot, core::ViewCamera& temporary,
                            rendering::Renderer& renderer, const core::Scene& scene)
                : slot_(slot),
                  original_(slot),
                  renderer_(renderer),
                  scene_(scene) {
                slot_ = &temporary;
            }

            ~CameraSwapGuard() {
                slot_ = original_;
                if (original_) {
                    render_or_log(renderer_, scene_, *original_);
                }
            }

            CameraSwapGuard(const CameraSwapGuard&) = delete;
            CameraSwapGuard& operator=(const CameraSwapGuard&) = delete;

        private:
            core::ViewCamera*& slot_;
            core::ViewCamera* original_;
            rendering::Renderer& renderer_;
            const core::Scene& scene_;
        };

        glm::vec3 axis_direction(const ViewAxis axis) {
            switch (axis) {
            case ViewAxis::X: return {1.0f, 0.0f, 0.0f};
            case ViewAxis::Y: return {0.0f, 1.0f, 0.0f};
            case ViewAxis::Z: return {0.0f, 0.0f, 1.0f};
            }
            return {0.0f, 0.0f, 1.0f};
        }

        int hex_digit(const char c) {
            if (c >= '0' && c <= '9')
                return c - '0';
            const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (lower >= 'a' && lower <= 'f')
                return lower - 'a' + 10;
            return -1;
        }
    } // namespace

    std::optional<ViewAxis> view_axis_from_string(const std::string_view str) {
        if (str == "x" || str == "X")
            return ViewAxis::X;
        if (str == "y" || str == "Y")
            return ViewAxis::Y;
        if (str == "z" || str == "Z")
            return ViewAxis::Z;
        return std::nullopt;
    }

    std::string format_file_size(const uint64_t bytes) {
        constexpr uint64_t KIB = 1024;
        if (bytes < KIB)
            return std::format("{} B", bytes);
        if (bytes < KIB * KIB)
            return std::format("{:.2f} KB", static_cast<double>(bytes) / KIB);
        return std::format("{:.2f} MB", static_cast<double>(bytes) / (KIB * KIB));
    }

    std::optional<glm::vec3> parse_hex_color(std::string_view hex) {
        if (hex.starts_with('#'))
            hex.remove_prefix(1);
        if (hex.size() != 6)
            return std::nullopt;

        glm::vec3 color;
        for (int i = 0; i < 3; ++i) {
            const int hi = hex_digit(hex[i * 2]);
            const int lo = hex_digit(hex[i * 2 + 1]);
            if (hi < 0 || lo < 0)
                return std::nullopt;
            color[i] = static_cast<float>(hi * 16 + lo) / 255.0f;
        }
        return color;
    }

    Exporter::Exporter(rendering::Renderer* renderer, core::Scene* scene, core::ViewCamera* camera)
        : renderer_(renderer),
          scene_(scene),
          camera_(camera) {}

    io::Result<void> Exporter::checkReady() const {
        if (!renderer_ || !scene_ || !camera_) {
            return io::make_error(io::ErrorCode::INVALID_STATE,
                                  "Renderer, scene and camera must be set before exporting");
        }
        return {};
    }

    io::Result<ExportResult> Exporter::exportImage(const ExportOptions& options) {
        if (auto ready = checkReady(); !ready) {
            return std::unexpected(ready.error());
        }

        const glm::ivec2 buffer = renderer_->getDrawingBufferSize();
        const int width = options.width.value_or(buffer.x);
        const int height = options.height.value_or(buffer.y);
        if (width <= 0 || height <= 0) {
            return io::make_error(io::ErrorCode::INVALID_ARGUMENT,
                                  std::format("Invalid export size {}x{}", width, height));
        }

        std::optional<glm::vec3> background_override;
        if (options.background_color) {
            background_override = parse_hex_color(*options.background_color);
            if (!background_override) {
                return io::make_error(io::ErrorCode::INVALID_ARGUMENT,
                                      std::format("Invalid background colour '{}'", *options.background_color));
            }
        }

        LOG_TIMER_DEBUG("exportImage");

        ExportResult result;
        {
            RendererStateGuard restore(*renderer_, *scene_, camera_);

            renderer_->setSize(width, height);
            renderer_->setPixelRatio(1.0f);

            if (options.transparent && options.format == rendering::ImageFormat::Png) {
                renderer_->setBackground(std::nullopt);
                renderer_->setClearAlpha(0.0f);
            } else if (background_override) {
                renderer_->setBackground(background_override);
            }

            renderer_->render(*scene_, *camera_);
            const auto image = renderer_->readPixels();

            auto encoded = rendering::encode_image(image, options.format, options.quality);
            if (!encoded) {
                LOG_ERROR("Export failed: {}", encoded.error().format());
                return std::unexpected(encoded.error());
            }

            result.data_url = rendering::to_data_url(*encoded, options.format);
            auto blob = rendering::data_url_to_bytes(result.data_url);
            if (!blob) {
                LOG_ERROR("Export failed: {}", blob.error().format());
                return std::unexpected(blob.error());
            }

            result.blob = std::move(*blob);
            result.width = image.width;
            result.height = image.height;
        }

        result.size = result.blob.size();
        result.format = options.format;
        result.timestamp = std::chrono::system_clock::now();

        LOG_INFO("Exported {}x{} {} ({})", result.width, result.height,
                 rendering::image_format_to_string(result.format), format_file_size(result.size));
        return result;
    }

    io::Result<ExportResult> Exporter::exportSection(const glm::vec3& camera_position, const glm::vec3& target,
                                                     const ExportOptions& options) {
        if (auto ready = checkReady(); !ready) {
            return std::unexpected(ready.error());
        }

        CameraPoseGuard restore(*camera_, *renderer_, *scene_);
        camera_->position = camera_position;
        camera_->lookAt(target);
        return exportImage(options);
    }

    io::Result<ExportResult> Exporter::exportOrthographic(const ViewAxis axis, const ExportOptions& options) {
        if (auto ready = checkReady(); !ready) {
            return std::unexpected(ready.error());
        }

        const auto bounds = scene_->getSceneBounds(false);
        const float max_dim = bounds.maxDimension();
        if (bounds.isEmpty() || max_dim <= 0.0f) {
            return io::make_error(io::ErrorCode::INVALID_STATE, "Scene has no geometry to frame");
        }

        const glm::ivec2 buffer = renderer_->getDrawingBufferSize();
        const int width = options.width.value_or(buffer.x);
        const int height = options.height.value_or(buffer.y);
        if (width <= 0 || height <= 0) {
            return io::make_error(io::ErrorCode::INVALID_ARGUMENT,
                                  std::format("Invalid export size {}x{}", width, height));
        }
        const float aspect = static_cast<float>(width) / static_cast<float>(height);

        const glm::vec3 center = bounds.center();
        const core::OrthoExtents extents{
            .left = -max_dim * aspect / 2.0f,
            .right = max_dim * aspect / 2.0f,
            .top = max_dim / 2.0f,
            .bottom = -max_dim / 2.0f};
        auto ortho = core::ViewCamera::orthographic(extents, ORTHO_NEAR, max_dim * ORTHO_FAR_FACTOR);
        ortho.position = center + axis_direction(axis) * (max_dim * ORTHO_DISTANCE_FACTOR);
        ortho.lookAt(center);

        LOG_DEBUG("Orthographic export: max dimension {:.3f}, aspect {:.3f}", max_dim, aspect);

        CameraSwapGuard swap(camera_, ortho, *renderer_, *scene_);
        return exportImage(options);
    }

    io::Result<void> Exporter::writeToFile(const ExportResult& result, const std::filesystem::path& path) {
        if (auto writable = io::verify_writable(path); !writable) {
            return std::unexpected(writable.error());
        }

        std::ofstream file;
        if (!core::open_file_for_write(path, file)) {
            return io::make_error(io::ErrorCode::WRITE_FAILURE, "Cannot open output file", path);
        }

        file.write(reinterpret_cast<const char*>(result.blob.data()), static_cast<std::streamsize>(result.blob.size()));
        if (!file) {
            return io::make_error(io::ErrorCode::WRITE_FAILURE, "Error while writing image", path);
        }

        LOG_INFO("Wrote {} to {}", format_file_size(result.blob.size()), core::path_to_utf8(path));
        return {};
    }

} // namespace bim::interaction
