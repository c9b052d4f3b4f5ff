/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/geometry.hpp"
#include "core/parameters.hpp"
#include "core/scene.hpp"
#include <cstdint>
#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bim::rendering {
    class Renderer;
}

namespace bim::interaction {

    enum class PlaneAxis : uint8_t {
        PositiveX,
        NegativeX,
        PositiveY,
        NegativeY,
        PositiveZ,
        NegativeZ
    };

    // "x", "-x", "y", "-y", "z", "-z"
    [[nodiscard]] std::optional<PlaneAxis> plane_axis_from_string(std::string_view str);
    [[nodiscard]] std::string_view plane_axis_to_string(PlaneAxis axis);
    [[nodiscard]] glm::vec3 plane_axis_normal(PlaneAxis axis);

    struct SectionPlane {
        std::string id;
        glm::vec3 position{0.0f};
        glm::vec3 normal{0.0f, 0.0f, 1.0f}; // as given, not necessarily unit length
        bool enabled = true;
        bool helper_visible = true;
        core::NodeId helper = core::NULL_NODE;

        // Unit normal and constant = -position . normal, derived on every call
        [[nodiscard]] core::Plane plane() const;
        [[nodiscard]] bool hasHelper() const { return helper != core::NULL_NODE; }
    };

    struct AddPlaneConfig {
        std::string id;
        glm::vec3 position{0.0f};
        glm::vec3 normal{0.0f, 0.0f, 1.0f};
        bool enabled = true;
        bool show_helper = true;
    };

    /**
     * @brief Owns the section planes and keeps the renderer's clip state in sync.
     *
     * After every mutation the enabled planes are published to the renderer in
     * insertion order, with local clipping on iff at least one is published.
     * Planes may carry a quad helper parented under a single helper group node;
     * a helper is shown when its plane is enabled and its helper is visible.
     */
    class ClippingController {
    public:
        static constexpr std::string_view HELPER_GROUP_NAME = "ClippingPlaneHelpers";

        ClippingController() = default;
        explicit ClippingController(const core::param::ClippingParameters& params);
        ~ClippingController();

        ClippingController(const ClippingController&) = delete;
        ClippingController& operator=(const ClippingController&) = delete;

        // Moves helpers to the new scene
        void setScene(core::Scene* scene);
        void setRenderer(rendering::Renderer* renderer);

        // Replaces a plane with the same id. nullopt for a zero-length normal.
        std::optional<SectionPlane> addPlane(const AddPlaneConfig& config);
        bool removePlane(const std::string& id);

        bool updatePlanePosition(const std::string& id, const glm::vec3& position);
        bool updatePlaneNormal(const std::string& id, const glm::vec3& normal);
        bool setPlaneEnabled(const std::string& id, bool enabled);
        bool setHelperVisible(const std::string& id, bool visible);

        std::optional<SectionPlane> createPresetPlane(const std::string& id, PlaneAxis axis, float offset = 0.0f);

        [[nodiscard]] std::vector<core::Plane> getEnabledPlanes() const;
        [[nodiscard]] const SectionPlane* getPlane(const std::string& id) const;
        [[nodiscard]] const std::vector<SectionPlane>& getAllPlanes() const { return planes_; }
        [[nodiscard]] size_t planeCount() const { return planes_.size(); }
        [[nodiscard]] core::NodeId helperGroup() const { return helper_group_; }

        void clearAll();

        // clearAll() plus removal of the helper group
        void dispose();

    private:
        SectionPlane* findPlane(const std::string& id);
        core::NodeId ensureHelperGroup();
        core::NodeId createHelper(const SectionPlane& plane);
        void disposeHelper(SectionPlane& plane);
        void updateHelper(const SectionPlane& plane);
        void publish();

        core::param::ClippingParameters params_;
        core::Scene* scene_ = nullptr;
        rendering::Renderer* renderer_ = nullptr;
        std::vector<SectionPlane> planes_; // insertion order
        core::NodeId helper_group_ = core::NULL_NODE;
    };

} // namespace bim::interaction
