/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/geometry.hpp"
#include <algorithm>

namespace bim::core {

    float BoundingBox::maxDimension() const {
        const glm::vec3 s = size();
        return std::max({s.x, s.y, s.z});
    }

    void BoundingBox::expand(const glm::vec3& point) {
        min = glm::min(min, point);
        max = glm::max(max, point);
    }

    void BoundingBox::expand(const BoundingBox& other) {
        if (other.isEmpty())
            return;
        expand(other.min);
        expand(other.max);
    }

    BoundingBox BoundingBox::transformed(const glm::mat4& transform) const {
        BoundingBox result;
        if (isEmpty())
            return result;

        constexpr int BBOX_CORNERS = 8;
        for (int i = 0; i < BBOX_CORNERS; ++i) {
            const glm::vec3 corner(
                (i & 1) ? max.x : min.x,
                (i & 2) ? max.y : min.y,
                (i & 4) ? max.z : min.z);
            result.expand(glm::vec3(transform * glm::vec4(corner, 1.0f)));
        }
        return result;
    }

    std::optional<float> intersect_ray_triangle(const Ray& ray,
                                                const glm::vec3& v0, const glm::vec3& v1, const glm::vec3& v2) {
        constexpr float EPS = 1e-7f;
        const glm::vec3 e1 = v1 - v0;
        const glm::vec3 e2 = v2 - v0;
        const glm::vec3 h = glm::cross(ray.direction, e2);
        const float a = glm::dot(e1, h);
        if (a > -EPS && a < EPS)
            return std::nullopt;

        const float f = 1.0f / a;
        const glm::vec3 s = ray.origin - v0;
        const float u = f * glm::dot(s, h);
        if (u < 0.0f || u > 1.0f)
            return std::nullopt;

        const glm::vec3 q = glm::cross(s, e1);
        const float v = f * glm::dot(ray.direction, q);
        if (v < 0.0f || u + v > 1.0f)
            return std::nullopt;

        const float t = f * glm::dot(e2, q);
        if (t <= EPS)
            return std::nullopt;
        return t;
    }

    std::optional<float> intersect_ray_aabb(const Ray& ray, const BoundingBox& box) {
        if (box.isEmpty())
            return std::nullopt;

        const glm::vec3 inv_dir = 1.0f / ray.direction;
        const glm::vec3 t1 = (box.min - ray.origin) * inv_dir;
        const glm::vec3 t2 = (box.max - ray.origin) * inv_dir;
        const glm::vec3 t_min_v = glm::min(t1, t2);
        const glm::vec3 t_max_v = glm::max(t1, t2);
        const float t_enter = std::max({t_min_v.x, t_min_v.y, t_min_v.z});
        const float t_exit = std::min({t_max_v.x, t_max_v.y, t_max_v.z});
        if (t_enter > t_exit || t_exit < 0.0f)
            return std::nullopt;
        return t_enter >= 0.0f ? t_enter : t_exit;
    }

} // namespace bim::core
