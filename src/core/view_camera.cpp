/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/view_camera.hpp"
#include <cmath>
#include <glm/gtc/matrix_transform.hpp>

namespace bim::core {

    namespace {
        constexpr float PARALLEL_EPS = 1e-4f;

        glm::vec3 unproject(const glm::mat4& inv_view_proj, const glm::vec3& ndc) {
            const glm::vec4 p = inv_view_proj * glm::vec4(ndc, 1.0f);
            return glm::vec3(p) / p.w;
        }
    } // namespace

    ViewCamera ViewCamera::perspective(const float fov_y_degrees, const float aspect,
                                       const float near_plane, const float far_plane) {
        ViewCamera cam;
        cam.projection = ProjectionType::Perspective;
        cam.fov_y_degrees = fov_y_degrees;
        cam.aspect = aspect;
        cam.near_plane = near_plane;
        cam.far_plane = far_plane;
        return cam;
    }

    ViewCamera ViewCamera::orthographic(const OrthoExtents& extents, const float near_plane, const float far_plane) {
        ViewCamera cam;
        cam.projection = ProjectionType::Orthographic;
        cam.ortho = extents;
        cam.near_plane = near_plane;
        cam.far_plane = far_plane;
        const float h = extents.top - extents.bottom;
        cam.aspect = h != 0.0f ? (extents.right - extents.left) / h : 1.0f;
        return cam;
    }

    void ViewCamera::lookAt(const glm::vec3& target, const glm::vec3& up_hint) {
        const glm::vec3 dir = target - position;
        if (glm::length(dir) < PARALLEL_EPS)
            return;

        const glm::vec3 f = glm::normalize(dir);
        glm::vec3 world_up = glm::normalize(up_hint);
        if (std::abs(glm::dot(f, world_up)) > 1.0f - PARALLEL_EPS) {
            // Looking straight along the up axis: screen-up becomes -Z (or +Y when up was Z)
            world_up = std::abs(world_up.y) > 0.5f ? glm::vec3(0.0f, 0.0f, -1.0f) : glm::vec3(0.0f, 1.0f, 0.0f);
        }

        const glm::vec3 z_axis = -f;
        const glm::vec3 x_axis = glm::normalize(glm::cross(world_up, z_axis));
        const glm::vec3 y_axis = glm::cross(z_axis, x_axis);
        orientation = glm::normalize(glm::quat_cast(glm::mat3(x_axis, y_axis, z_axis)));
    }

    glm::vec3 ViewCamera::forward() const {
        return glm::normalize(orientation * glm::vec3(0.0f, 0.0f, -1.0f));
    }

    glm::vec3 ViewCamera::up() const {
        return glm::normalize(orientation * glm::vec3(0.0f, 1.0f, 0.0f));
    }

    glm::mat4 ViewCamera::viewMatrix() const {
        const glm::mat4 camera_to_world = glm::translate(glm::mat4(1.0f), position) * glm::mat4_cast(orientation);
        return glm::inverse(camera_to_world);
    }

    glm::mat4 ViewCamera::projectionMatrix() const {
        if (projection == ProjectionType::Orthographic) {
            return glm::ortho(ortho.left, ortho.right, ortho.bottom, ortho.top, near_plane, far_plane);
        }
        return glm::perspective(glm::radians(fov_y_degrees), aspect, near_plane, far_plane);
    }

    Ray ViewCamera::rayFromNdc(const glm::vec2& ndc) const {
        const glm::mat4 inv_view_proj = glm::inverse(projectionMatrix() * viewMatrix());

        Ray ray;
        if (projection == ProjectionType::Orthographic) {
            ray.origin = unproject(inv_view_proj, glm::vec3(ndc, -1.0f));
            ray.direction = forward();
        } else {
            ray.origin = position;
            ray.direction = glm::normalize(unproject(inv_view_proj, glm::vec3(ndc, 0.5f)) - position);
        }
        return ray;
    }

} // namespace bim::core
