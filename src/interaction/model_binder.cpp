/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "interaction/model_binder.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <glm/gtc/matrix_transform.hpp>

namespace bim::interaction {

    namespace {
        // Monotonic view over the counters a source reports
        struct ProgressTracker {
            uint64_t loaded = 0;
            uint64_t total = 0;

            LoadProgress advance(const io::FetchProgress& progress) {
                loaded = std::max(loaded, progress.loaded_bytes);
                total = std::max(total, progress.total_bytes);

                LoadProgress out{loaded, total, 0.0f};
                if (total > 0) {
                    out.percentage = std::min(100.0f, static_cast<float>(static_cast<double>(loaded) /
                                                                         static_cast<double>(total) * 100.0));
                }
                return out;
            }
        };
    } // namespace

    const NodeBinding* BoundModel::binding(const core::NodeId id) const {
        const auto it = bindings.find(id);
        return it != bindings.end() ? &it->second : nullptr;
    }

    const core::SemanticElement* BoundModel::elementFor(const core::NodeId id) const {
        const auto* b = binding(id);
        return b ? b->element : nullptr;
    }

    bool BoundModel::isSelectable(const core::NodeId id) const {
        const auto* b = binding(id);
        return !b || b->selectable;
    }

    void BoundModel::setSelectable(const core::NodeId id, const bool selectable) {
        bindings[id].selectable = selectable;
    }

    ModelBinder::ModelBinder(io::AssetSource& source) : source_(source) {}

    uint64_t ModelBinder::load(core::Scene& scene,
                               const std::string& source_url,
                               std::shared_ptr<const core::ModelMetadata> metadata,
                               LoadCallbacks callbacks) {
        const uint64_t request_id = ++latest_request_id_;
        LOG_INFO("Loading model '{}' (request {})", source_url, request_id);

        auto index = std::make_shared<const ModelMetadataIndex>(std::move(metadata));
        auto tracker = std::make_shared<ProgressTracker>();

        auto on_progress = [tracker, on_progress = callbacks.on_progress](const io::FetchProgress& progress) {
            const auto clamped = tracker->advance(progress);
            if (on_progress)
                on_progress(clamped);
        };

        auto on_complete = [&scene, request_id, source_url, index = std::move(index),
                            on_complete = std::move(callbacks.on_complete)](
                               io::Result<std::shared_ptr<io::ImportedAsset>> fetched) {
            if (!fetched || !*fetched) {
                auto error = fetched ? io::Error(io::ErrorCode::INTERNAL_ERROR, "Asset source returned no asset")
                                     : fetched.error();
                LOG_ERROR("Failed to load '{}' (request {}): {}", source_url, request_id, error.format());
                if (on_complete)
                    on_complete(std::unexpected(std::move(error)));
                return;
            }

            core::NodeId root = core::NULL_NODE;
            {
                core::Scene::Transaction txn(scene);
                root = materialize(scene, (*fetched)->root);
            }
            if (root == core::NULL_NODE) {
                if (on_complete)
                    on_complete(io::make_error(io::ErrorCode::EMPTY_MODEL, "Asset produced no scene nodes"));
                return;
            }

            auto model = bind(scene, root, index);
            model->request_id = request_id;
            model->source_url = source_url;

            if (on_complete)
                on_complete(std::move(model));
        };

        source_.fetch(source_url, std::move(on_progress), std::move(on_complete));
        return request_id;
    }

    core::NodeId ModelBinder::materialize(core::Scene& scene, const io::ImportedNode& node, const core::NodeId parent) {
        core::NodeId id = core::NULL_NODE;
        if (node.mesh) {
            id = scene.addMesh(node.name, node.mesh, node.material, parent);
        }
        if (id == core::NULL_NODE) {
            id = scene.addGroup(node.name, parent);
        }

        if (auto* scene_node = scene.getNodeById(id)) {
            scene_node->source_guid = node.source_guid;
        }
        scene.setNodeTransform(id, node.transform);

        for (const auto& child : node.children) {
            materialize(scene, child, id);
        }
        return id;
    }

    std::shared_ptr<BoundModel> ModelBinder::bind(const core::Scene& scene, const core::NodeId root,
                                                  std::shared_ptr<const ModelMetadataIndex> index) {
        auto model = std::make_shared<BoundModel>();
        model->root = root;
        model->index = index ? std::move(index) : std::make_shared<const ModelMetadataIndex>();
        model->bounds = scene.getWorldBounds(root);

        for (const core::NodeId id : scene.getMeshNodes(root)) {
            const auto* node = scene.getNodeById(id);
            ++model->total_count;

            NodeBinding binding;
            if (!node->source_guid.empty()) {
                binding.element = model->index->resolve(node->source_guid);
            }
            if (!binding.element) {
                binding.element = model->index->resolve(node->name);
            }

            if (binding.element) {
                ++model->bound_count;
            } else {
                binding.is_bim_object = true;
            }
            model->bindings.emplace(id, binding);
        }

        LOG_INFO("Bound metadata to {} of {} leaf nodes ({} elements available)",
                 model->bound_count, model->total_count, model->index->elementCount());
        if (model->bound_count < model->total_count) {
            LOG_DEBUG("{} leaf nodes have no matching element", model->total_count - model->bound_count);
        }
        return model;
    }

    void ModelBinder::centerAtOrigin(core::Scene& scene, const core::NodeId root) {
        const auto bounds = scene.getWorldBounds(root);
        if (bounds.isEmpty()) {
            LOG_WARN("Cannot center node {}: empty bounds", root);
            return;
        }

        const glm::vec3 center = bounds.center();
        scene.setNodeTransform(root, glm::translate(glm::mat4(1.0f), -center) * scene.getNodeTransform(root));
        LOG_DEBUG("Centered node {} (offset {:.3f}, {:.3f}, {:.3f})", root, -center.x, -center.y, -center.z);
    }

    void ModelBinder::scaleToFit(core::Scene& scene, const core::NodeId root, const float target_size) {
        const auto bounds = scene.getWorldBounds(root);
        const float max_dim = bounds.maxDimension();
        if (bounds.isEmpty() || max_dim <= 0.0f) {
            LOG_WARN("Cannot scale node {}: degenerate bounds", root);
            return;
        }
        if (target_size <= 0.0f) {
            LOG_WARN("Cannot scale node {} to non-positive size {}", root, target_size);
            return;
        }

        const float scale = target_size / max_dim;
        scene.setNodeTransform(root, glm::scale(glm::mat4(1.0f), glm::vec3(scale)) * scene.getNodeTransform(root));
        LOG_DEBUG("Scaled node {} by {:.4f}", root, scale);
    }

    void ModelBinder::centerAtOrigin(core::Scene& scene, BoundModel& model) {
        centerAtOrigin(scene, model.root);
        model.bounds = scene.getWorldBounds(model.root);
    }

    void ModelBinder::scaleToFit(core::Scene& scene, BoundModel& model, const float target_size) {
        scaleToFit(scene, model.root, target_size);
        model.bounds = scene.getWorldBounds(model.root);
    }

    glm::vec3 ModelBinder::suggestCameraPosition(const core::BoundingBox& bounds, const float fov_degrees,
                                                 const glm::vec3& offset) {
        const float size = bounds.maxDimension();
        const float distance = size / (2.0f * std::tan(glm::radians(fov_degrees) / 2.0f));
        return bounds.center() + offset * distance;
    }

} // namespace bim::interaction
