/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include "core/geometry.hpp"
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace bim::core {

    enum class ProjectionType : uint8_t {
        Perspective,
        Orthographic
    };

    struct OrthoExtents {
        float left = -1.0f;
        float right = 1.0f;
        float top = 1.0f;
        float bottom = -1.0f;
    };

    /**
     * @brief Viewer camera looking down its local -Z axis.
     *
     * Pose is position + orientation. Projection is either perspective
     * (vertical field of view + aspect) or orthographic (explicit extents).
     */
    class BIM_CORE_API ViewCamera {
    public:
        ViewCamera() = default;

        [[nodiscard]] static ViewCamera perspective(float fov_y_degrees, float aspect, float near_plane, float far_plane);
        [[nodiscard]] static ViewCamera orthographic(const OrthoExtents& extents, float near_plane, float far_plane);

        ProjectionType projection = ProjectionType::Perspective;
        float fov_y_degrees = 50.0f;
        float aspect = 1.0f;
        float near_plane = 0.1f;
        float far_plane = 2000.0f;
        OrthoExtents ortho;

        glm::vec3 position{0.0f};
        glm::quat orientation{1.0f, 0.0f, 0.0f, 0.0f};

        // Rotates the camera so -Z points at target. Falls back to another up
        // axis when the view direction is parallel to up.
        void lookAt(const glm::vec3& target, const glm::vec3& up = glm::vec3(0.0f, 1.0f, 0.0f));

        [[nodiscard]] glm::vec3 forward() const;
        [[nodiscard]] glm::vec3 up() const;
        [[nodiscard]] glm::mat4 viewMatrix() const;
        [[nodiscard]] glm::mat4 projectionMatrix() const;

        // ndc in [-1, 1]^2, +y up
        [[nodiscard]] Ray rayFromNdc(const glm::vec2& ndc) const;

        [[nodiscard]] bool isOrthographic() const { return projection == ProjectionType::Orthographic; }
    };

} // namespace bim::core
