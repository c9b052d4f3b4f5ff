/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/application.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include "core/scene.hpp"
#include "core/view_camera.hpp"
#include "interaction/clipping_controller.hpp"
#include "interaction/exporter.hpp"
#include "interaction/filter_engine.hpp"
#include "interaction/model_binder.hpp"
#include "io/assimp_asset_source.hpp"
#include "io/metadata_loader.hpp"
#include "rendering/software_renderer.hpp"

#include <chrono>
#include <format>
#include <optional>
#include <thread>

namespace bim::app {

    namespace {

        constexpr int DEFAULT_WIDTH = 1280;
        constexpr int DEFAULT_HEIGHT = 720;
        constexpr auto POLL_INTERVAL = std::chrono::milliseconds(5);

        std::optional<interaction::LoadResult> loadModel(io::AssimpAssetSource& source,
                                                         interaction::ModelBinder& binder,
                                                         core::Scene& scene,
                                                         const std::string& url,
                                                         std::shared_ptr<const core::ModelMetadata> metadata) {
            std::optional<interaction::LoadResult> outcome;
            int last_reported = -1;

            binder.load(scene, url, std::move(metadata),
                        interaction::LoadCallbacks{
                            .on_progress = [&last_reported](const interaction::LoadProgress& progress) {
                                const int percent = static_cast<int>(progress.percentage);
                                if (percent / 10 != last_reported / 10) {
                                    last_reported = percent;
                                    LOG_DEBUG("Loading: {}% ({} / {} bytes)", percent, progress.loaded, progress.total);
                                }
                            },
                            .on_complete = [&outcome](interaction::LoadResult result) {
                                outcome = std::move(result);
                            }});

            while (!outcome) {
                const size_t delivered = source.poll();
                if (outcome)
                    break;
                if (delivered == 0 && !source.hasPendingWork()) {
                    LOG_ERROR("Asset source went idle without completing the load");
                    return std::nullopt;
                }
                std::this_thread::sleep_for(POLL_INTERVAL);
            }
            return outcome;
        }

        int runSnapshot(const core::param::SnapshotParameters& params) {
            const auto& viewer = params.viewer;
            core::Scene scene;

            std::shared_ptr<const core::ModelMetadata> metadata;
            if (!params.metadata_path.empty()) {
                auto result = io::load_model_metadata(params.metadata_path);
                if (!result) {
                    LOG_ERROR("Failed to load metadata: {}", result.error().format());
                    return 1;
                }
                metadata = std::make_shared<const core::ModelMetadata>(std::move(*result));
            }

            io::AssimpAssetSource source;
            interaction::ModelBinder binder(source);

            LOG_INFO("Loading model: {}", core::path_to_utf8(params.model_path));
            auto outcome = loadModel(source, binder, scene, core::path_to_utf8(params.model_path), metadata);
            if (!outcome)
                return 1;
            if (!*outcome) {
                LOG_ERROR("Failed to load model: {}", outcome->error().format());
                return 1;
            }
            const std::shared_ptr<interaction::BoundModel> model = **outcome;
            LOG_INFO("Model loaded: {} of {} leaves bound to metadata", model->bound_count, model->total_count);

            if (params.fit) {
                interaction::ModelBinder::centerAtOrigin(scene, *model);
                interaction::ModelBinder::scaleToFit(scene, *model, viewer.camera.fit_size);
            }
            const core::BoundingBox& bounds = model->bounds;

            const int width = params.width.value_or(DEFAULT_WIDTH);
            const int height = params.height.value_or(DEFAULT_HEIGHT);

            auto camera = core::ViewCamera::perspective(viewer.camera.fov_y_degrees,
                                                        static_cast<float>(width) / static_cast<float>(height),
                                                        viewer.camera.near_plane, viewer.camera.far_plane);
            const auto& offset = viewer.camera.placement_offset;
            camera.position = interaction::ModelBinder::suggestCameraPosition(
                bounds, viewer.camera.fov_y_degrees, glm::vec3(offset[0], offset[1], offset[2]));
            camera.lookAt(bounds.isEmpty() ? glm::vec3(0.0f) : bounds.center());

            rendering::SoftwareRenderer renderer(width, height);

            if (!params.filter_path.empty()) {
                auto criteria = interaction::load_filter_criteria(params.filter_path);
                if (!criteria) {
                    LOG_ERROR("Failed to load filter: {}", criteria.error().format());
                    return 1;
                }
                interaction::FilterEngine filter(&scene, model);
                const auto result = filter.applyFilter(*criteria);
                LOG_INFO("Filter matched {} of {} elements ({:.2f} ms)",
                         result.match_count, result.total_count, result.execution_time_ms);
            }

            interaction::ClippingController clipping(viewer.clipping);
            clipping.setScene(&scene);
            clipping.setRenderer(&renderer);
            for (size_t i = 0; i < params.sections.size(); ++i) {
                const auto& section = params.sections[i];
                const auto axis = interaction::plane_axis_from_string(section.axis);
                if (!axis) {
                    LOG_ERROR("Invalid section axis '{}'", section.axis);
                    return 1;
                }
                const std::string id = std::format("section-{}", i);
                if (!clipping.createPresetPlane(id, *axis, section.offset)) {
                    LOG_ERROR("Failed to create section plane '{}'", id);
                    return 1;
                }
                clipping.setHelperVisible(id, false);
                LOG_DEBUG("Section plane {}: axis {} offset {}", id, section.axis, section.offset);
            }

            interaction::ExportOptions options;
            options.format = rendering::image_format_from_string(viewer.image_export.format)
                                 .value_or(rendering::ImageFormat::Png);
            options.quality = viewer.image_export.quality;
            options.transparent = params.transparent;
            options.background_color = params.background;

            interaction::Exporter exporter(&renderer, &scene, &camera);
            io::Result<interaction::ExportResult> exported = [&]() -> io::Result<interaction::ExportResult> {
                if (params.ortho_axis) {
                    const auto axis = interaction::view_axis_from_string(*params.ortho_axis);
                    if (!axis) {
                        return io::make_error(io::ErrorCode::INVALID_ARGUMENT,
                                              std::format("Invalid view axis '{}'", *params.ortho_axis));
                    }
                    return exporter.exportOrthographic(*axis, options);
                }
                return exporter.exportImage(options);
            }();

            if (!exported) {
                LOG_ERROR("Export failed: {}", exported.error().format());
                return 1;
            }
            if (auto written = interaction::Exporter::writeToFile(*exported, params.output_path); !written) {
                LOG_ERROR("Failed to write image: {}", written.error().format());
                return 1;
            }

            LOG_INFO("Saved {}x{} {} ({}) to {}", exported->width, exported->height,
                     rendering::image_format_to_string(exported->format),
                     interaction::format_file_size(exported->size),
                     core::path_to_utf8(params.output_path));
            return 0;
        }

    } // namespace

    int Application::run(std::unique_ptr<bim::core::param::SnapshotParameters> params) {
        if (!params) {
            LOG_ERROR("No snapshot parameters");
            return 1;
        }
        return runSnapshot(*params);
    }

} // namespace bim::app
