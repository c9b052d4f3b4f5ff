/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "interaction/clipping_controller.hpp"
#include "core/logger.hpp"
#include "rendering/renderer.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <utility>

namespace bim::interaction {

    namespace {
        constexpr float MIN_NORMAL_LENGTH = 1e-8f;
        constexpr float HELPER_OPACITY = 0.25f;

        bool is_valid_normal(const glm::vec3& normal) {
            return glm::length(normal) > MIN_NORMAL_LENGTH;
        }

        // Quad helpers face +Z in their local frame
        glm::mat4 helper_transform(const SectionPlane& plane) {
            const glm::vec3 z_axis = glm::normalize(plane.normal);
            const glm::vec3 reference = std::abs(z_axis.y) < 0.99f ? glm::vec3(0.0f, 1.0f, 0.0f)
                                                                   : glm::vec3(1.0f, 0.0f, 0.0f);
            const glm::vec3 x_axis = glm::normalize(glm::cross(reference, z_axis));
            const glm::vec3 y_axis = glm::cross(z_axis, x_axis);

            glm::mat4 m(1.0f);
            m[0] = glm::vec4(x_axis, 0.0f);
            m[1] = glm::vec4(y_axis, 0.0f);
            m[2] = glm::vec4(z_axis, 0.0f);
            m[3] = glm::vec4(plane.position, 1.0f);
            return m;
        }
    } // namespace

    std::optional<PlaneAxis> plane_axis_from_string(const std::string_view str) {
        if (str == "x")
            return PlaneAxis::PositiveX;
        if (str == "-x")
            return PlaneAxis::NegativeX;
        if (str == "y")
            return PlaneAxis::PositiveY;
        if (str == "-y")
            return PlaneAxis::NegativeY;
        if (str == "z")
            return PlaneAxis::PositiveZ;
        if (str == "-z")
            return PlaneAxis::NegativeZ;
        return std::nullopt;
    }

    std::string_view plane_axis_to_string(const PlaneAxis axis) {
        switch (axis) {
        case PlaneAxis::PositiveX: return "x";
        case PlaneAxis::NegativeX: return "-x";
        case PlaneAxis::PositiveY: return "y";
        case PlaneAxis::NegativeY: return "-y";
        case PlaneAxis::PositiveZ: return "z";
        case PlaneAxis::NegativeZ: return "-z";
        }
        return "z";
    }

    glm::vec3 plane_axis_normal(const PlaneAxis axis) {
        switch (axis) {
        case PlaneAxis::PositiveX: return {1.0f, 0.0f, 0.0f};
        case PlaneAxis::NegativeX: return {-1.0f, 0.0f, 0.0f};
        case PlaneAxis::PositiveY: return {0.0f, 1.0f, 0.0f};
        case PlaneAxis::NegativeY: return {0.0f, -1.0f, 0.0f};
        case PlaneAxis::PositiveZ: return {0.0f, 0.0f, 1.0f};
        case PlaneAxis::NegativeZ: return {0.0f, 0.0f, -1.0f};
        }
        return {0.0f, 0.0f, 1.0f};
    }

    core::Plane SectionPlane::plane() const {
        return core::Plane::fromNormalAndPoint(glm::normalize(normal), position);
    }

    ClippingController::ClippingController(const core::param::ClippingParameters& params)
        : params_(params) {}

    ClippingController::~ClippingController() {
        dispose();
    }

    void ClippingController::setScene(core::Scene* scene) {
        if (scene == scene_)
            return;

        // Planes keep their helpers across scenes
        std::vector<bool> wants_helper(planes_.size());
        for (size_t i = 0; i < planes_.size(); ++i) {
            wants_helper[i] = planes_[i].hasHelper() || (!scene_ && planes_[i].helper_visible);
            disposeHelper(planes_[i]);
        }
        if (scene_ && helper_group_ != core::NULL_NODE) {
            scene_->removeNode(helper_group_);
        }
        helper_group_ = core::NULL_NODE;
        scene_ = scene;

        if (!scene_)
            return;
        for (size_t i = 0; i < planes_.size(); ++i) {
            if (wants_helper[i]) {
                planes_[i].helper = createHelper(planes_[i]);
                updateHelper(planes_[i]);
            }
        }
    }

    void ClippingController::setRenderer(rendering::Renderer* renderer) {
        renderer_ = renderer;
        publish();
    }

    std::optional<SectionPlane> ClippingController::addPlane(const AddPlaneConfig& config) {
        if (!is_valid_normal(config.normal)) {
            LOG_WARN("Rejected clipping plane '{}': zero-length normal", config.id);
            return std::nullopt;
        }

        if (auto* existing = findPlane(config.id)) {
            LOG_DEBUG("Replacing clipping plane '{}'", config.id);
            disposeHelper(*existing);
            planes_.erase(planes_.begin() + (existing - planes_.data()));
        }

        SectionPlane plane;
        plane.id = config.id;
        plane.position = config.position;
        plane.normal = config.normal;
        plane.enabled = config.enabled;
        plane.helper_visible = config.show_helper;
        if (config.show_helper) {
            plane.helper = createHelper(plane);
            updateHelper(plane);
        }

        planes_.push_back(plane);
        publish();

        const auto p = plane.plane();
        LOG_DEBUG("Added clipping plane '{}' normal=({:.3f}, {:.3f}, {:.3f}) constant={:.3f}",
                  plane.id, p.normal.x, p.normal.y, p.normal.z, p.constant);
        return plane;
    }

    bool ClippingController::removePlane(const std::string& id) {
        auto* plane = findPlane(id);
        if (!plane)
            return false;

        disposeHelper(*plane);
        planes_.erase(planes_.begin() + (plane - planes_.data()));
        publish();
        LOG_DEBUG("Removed clipping plane '{}'", id);
        return true;
    }

    bool ClippingController::updatePlanePosition(const std::string& id, const glm::vec3& position) {
        auto* plane = findPlane(id);
        if (!plane)
            return false;

        plane->position = position;
        updateHelper(*plane);
        publish();
        return true;
    }

    bool ClippingController::updatePlaneNormal(const std::string& id, const glm::vec3& normal) {
        auto* plane = findPlane(id);
        if (!plane)
            return false;
        if (!is_valid_normal(normal)) {
            LOG_WARN("Ignored zero-length normal for clipping plane '{}'", id);
            return false;
        }

        plane->normal = normal;
        updateHelper(*plane);
        publish();
        return true;
    }

    bool ClippingController::setPlaneEnabled(const std::string& id, const bool enabled) {
        auto* plane = findPlane(id);
        if (!plane)
            return false;

        plane->enabled = enabled;
        updateHelper(*plane);
        publish();
        return true;
    }

    bool ClippingController::setHelperVisible(const std::string& id, const bool visible) {
        auto* plane = findPlane(id);
        if (!plane || !plane->hasHelper())
            return false;

        plane->helper_visible = visible;
        updateHelper(*plane);
        return true;
    }

    std::optional<SectionPlane> ClippingController::createPresetPlane(const std::string& id, const PlaneAxis axis,
                                                                       const float offset) {
        const glm::vec3 normal = plane_axis_normal(axis);
        return addPlane(AddPlaneConfig{
            .id = id,
            .position = normal * offset,
            .normal = normal,
            .enabled = true,
            .show_helper = true});
    }

    std::vector<core::Plane> ClippingController::getEnabledPlanes() const {
        std::vector<core::Plane> result;
        for (const auto& plane : planes_) {
            if (plane.enabled)
                result.push_back(plane.plane());
        }
        return result;
    }

    const SectionPlane* ClippingController::getPlane(const std::string& id) const {
        const auto it = std::find_if(planes_.begin(), planes_.end(),
                                     [&id](const SectionPlane& p) { return p.id == id; });
        return it != planes_.end() ? &*it : nullptr;
    }

    SectionPlane* ClippingController::findPlane(const std::string& id) {
        return const_cast<SectionPlane*>(std::as_const(*this).getPlane(id));
    }

    void ClippingController::clearAll() {
        for (auto& plane : planes_) {
            disposeHelper(plane);
        }
        planes_.clear();
        publish();
    }

    void ClippingController::dispose() {
        clearAll();
        if (scene_ && helper_group_ != core::NULL_NODE) {
            scene_->removeNode(helper_group_);
        }
        helper_group_ = core::NULL_NODE;
    }

    core::NodeId ClippingController::ensureHelperGroup() {
        if (helper_group_ != core::NULL_NODE && scene_->getNodeById(helper_group_))
            return helper_group_;
        helper_group_ = scene_->addGroup(std::string(HELPER_GROUP_NAME));
        return helper_group_;
    }

    core::NodeId ClippingController::createHelper(const SectionPlane& plane) {
        if (!scene_)
            return core::NULL_NODE;

        auto material = std::make_shared<core::Material>();
        material->name = "ClippingPlaneHelper";
        material->base_color = glm::vec4(params_.helper_color[0], params_.helper_color[1],
                                         params_.helper_color[2], HELPER_OPACITY);
        material->double_sided = true;

        auto mesh = std::make_shared<core::MeshData>(core::MeshData::quad(params_.helper_size));
        return scene_->addHelper(std::format("ClippingPlaneHelper-{}", plane.id), std::move(mesh),
                                 std::move(material), ensureHelperGroup());
    }

    void ClippingController::disposeHelper(SectionPlane& plane) {
        if (plane.helper == core::NULL_NODE)
            return;
        if (scene_) {
            scene_->removeNode(plane.helper);
        }
        plane.helper = core::NULL_NODE;
    }

    void ClippingController::updateHelper(const SectionPlane& plane) {
        if (!scene_ || plane.helper == core::NULL_NODE)
            return;

        core::Scene::Transaction txn(*scene_);
        scene_->setNodeTransform(plane.helper, helper_transform(plane));
        scene_->setNodeVisible(plane.helper, plane.enabled && plane.helper_visible);
    }

    void ClippingController::publish() {
        if (!renderer_)
            return;

        auto planes = getEnabledPlanes();
        const bool enabled = !planes.empty();
        renderer_->setClippingPlanes(std::move(planes));
        renderer_->setLocalClippingEnabled(enabled);
    }

} // namespace bim::interaction
