/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "interaction/selector.hpp"
#include "core/logger.hpp"
#include "core/view_camera.hpp"
#include <glm/gtc/matrix_inverse.hpp>

namespace bim::interaction {

    namespace {
        std::shared_ptr<core::Material> make_highlight_material(const core::param::SelectionParameters& params) {
            auto material = std::make_shared<core::Material>();
            material->name = "SelectionHighlight";
            material->base_color = glm::vec4(params.highlight_color[0], params.highlight_color[1],
                                             params.highlight_color[2], 1.0f);
            material->emissive = glm::vec3(params.emissive_color[0], params.emissive_color[1], params.emissive_color[2]);
            material->emissive_intensity = params.emissive_intensity;
            material->roughness = params.roughness;
            material->metallic = params.metalness;
            return material;
        }
    } // namespace

    std::optional<glm::vec2> pointer_to_ndc(const PointerEvent& event, const ViewportRect& viewport) {
        if (viewport.width <= 0.0f || viewport.height <= 0.0f)
            return std::nullopt;
        return glm::vec2(((event.client_x - viewport.left) / viewport.width) * 2.0f - 1.0f,
                         -((event.client_y - viewport.top) / viewport.height) * 2.0f + 1.0f);
    }

    std::optional<RayHit> raycast_scene(const core::Scene& scene, const core::Ray& ray, const BoundModel* model) {
        std::optional<RayHit> best;

        const core::NodeId root = model ? model->root : core::NULL_NODE;
        for (const core::NodeId id : scene.getMeshNodes(root)) {
            if (!scene.isNodeEffectivelyVisible(id))
                continue;
            if (model && !model->isSelectable(id))
                continue;

            const auto* node = scene.getNodeById(id);
            const auto& mesh = *node->mesh;
            const glm::mat4& local_to_world = scene.getWorldTransform(id);
            const glm::mat4 world_to_local = glm::inverse(local_to_world);

            // Affine maps preserve the ray parameter, so t stays comparable across nodes
            const core::Ray local_ray{glm::vec3(world_to_local * glm::vec4(ray.origin, 1.0f)),
                                      glm::vec3(world_to_local * glm::vec4(ray.direction, 0.0f))};

            if (!core::intersect_ray_aabb(local_ray, mesh.bounds()))
                continue;

            std::optional<float> node_t;
            glm::vec3 local_normal{0.0f};
            for (const auto& tri : mesh.indices) {
                if (tri.x >= mesh.vertices.size() || tri.y >= mesh.vertices.size() || tri.z >= mesh.vertices.size())
                    continue;
                const glm::vec3& v0 = mesh.vertices[tri.x];
                const glm::vec3& v1 = mesh.vertices[tri.y];
                const glm::vec3& v2 = mesh.vertices[tri.z];

                const auto t = core::intersect_ray_triangle(local_ray, v0, v1, v2);
                if (t && (!node_t || *t < *node_t)) {
                    node_t = t;
                    local_normal = glm::cross(v1 - v0, v2 - v0);
                }
            }

            if (!node_t || (best && *node_t >= best->distance))
                continue;

            RayHit hit;
            hit.node = id;
            hit.distance = *node_t;
            hit.point = ray.at(*node_t);
            hit.normal = glm::normalize(glm::mat3(glm::inverseTranspose(local_to_world)) * local_normal);
            best = hit;
        }
        return best;
    }

    Selector::Selector() : Selector(core::param::SelectionParameters{}) {}

    Selector::Selector(const core::param::SelectionParameters& params)
        : highlight_material_(make_highlight_material(params)) {}

    Selector::~Selector() {
        clearSelection();
    }

    SelectionResult Selector::pick(const PointerEvent& event, const core::ViewCamera& camera,
                                   core::Scene& scene, const ViewportRect& viewport) {
        const auto ndc = pointer_to_ndc(event, viewport);
        if (!ndc) {
            LOG_DEBUG("Pick ignored: viewport has no area");
            return {};
        }

        core::Ray ray = camera.rayFromNdc(*ndc);
        ray.direction = glm::normalize(ray.direction);

        const auto hit = raycast_scene(scene, ray, model_.get());
        if (!hit) {
            clearSelection();
            return {};
        }

        highlight(scene, hit->node);

        SelectionResult result;
        result.node = hit->node;
        result.element = model_ ? model_->elementFor(hit->node) : nullptr;
        result.point = hit->point;
        result.normal = hit->normal;
        result.distance = hit->distance;

        if (result.element) {
            LOG_DEBUG("Selected node {} -> {} '{}' at {:.3f}", hit->node, result.element->type_tag,
                      result.element->display_name, hit->distance);
        } else {
            LOG_DEBUG("Selected node {} (no semantic data) at {:.3f}", hit->node, hit->distance);
        }
        return result;
    }

    void Selector::highlight(core::Scene& scene, const core::NodeId node) {
        clearSelection();

        const auto* scene_node = scene.getNodeById(node);
        if (!scene_node)
            return;

        original_material_ = scene_node->material;
        selected_scene_ = &scene;
        selected_node_ = node;
        scene.setNodeMaterial(node, highlight_material_);
    }

    void Selector::clearSelection() {
        if (selected_node_ == core::NULL_NODE)
            return;

        if (selected_scene_ && selected_scene_->getNodeById(selected_node_)) {
            selected_scene_->setNodeMaterial(selected_node_, std::move(original_material_));
        }
        original_material_.reset();
        selected_scene_ = nullptr;
        selected_node_ = core::NULL_NODE;
    }

    const core::SemanticElement* Selector::getSelectedElement() const {
        if (!model_ || selected_node_ == core::NULL_NODE)
            return nullptr;
        return model_->elementFor(selected_node_);
    }

} // namespace bim::interaction
