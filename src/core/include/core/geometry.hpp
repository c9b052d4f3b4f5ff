/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include <glm/glm.hpp>
#include <limits>
#include <optional>

namespace bim::core {

    struct Ray {
        glm::vec3 origin{0.0f};
        glm::vec3 direction{0.0f, 0.0f, -1.0f};

        [[nodiscard]] glm::vec3 at(const float t) const { return origin + direction * t; }
    };

    struct BIM_CORE_API BoundingBox {
        glm::vec3 min{std::numeric_limits<float>::max()};
        glm::vec3 max{std::numeric_limits<float>::lowest()};

        BoundingBox() = default;
        BoundingBox(const glm::vec3& min_in, const glm::vec3& max_in) : min(min_in),
                                                                          max(max_in) {}

        [[nodiscard]] bool isEmpty() const {
            return min.x > max.x || min.y > max.y || min.z > max.z;
        }
        [[nodiscard]] glm::vec3 center() const { return (min + max) * 0.5f; }
        [[nodiscard]] glm::vec3 size() const { return isEmpty() ? glm::vec3(0.0f) : max - min; }
        [[nodiscard]] float maxDimension() const;

        void expand(const glm::vec3& point);
        void expand(const BoundingBox& other);

        // Bounds of the eight transformed corners
        [[nodiscard]] BoundingBox transformed(const glm::mat4& transform) const;
    };

    /// Half-space boundary n·p + constant = 0. Points with negative distance lie behind the plane.
    struct Plane {
        glm::vec3 normal{0.0f, 0.0f, 1.0f};
        float constant = 0.0f;

        [[nodiscard]] float distanceTo(const glm::vec3& point) const {
            return glm::dot(normal, point) + constant;
        }

        [[nodiscard]] static Plane fromNormalAndPoint(const glm::vec3& unit_normal, const glm::vec3& point) {
            return Plane{unit_normal, -glm::dot(point, unit_normal)};
        }

        bool operator==(const Plane&) const = default;
    };

    // Möller-Trumbore, two-sided. Returns the ray parameter of the hit.
    [[nodiscard]] BIM_CORE_API std::optional<float> intersect_ray_triangle(
        const Ray& ray, const glm::vec3& v0, const glm::vec3& v1, const glm::vec3& v2);

    // Slab test. Returns the entry parameter, or the exit parameter when the origin is inside.
    [[nodiscard]] BIM_CORE_API std::optional<float> intersect_ray_aabb(const Ray& ray, const BoundingBox& box);

} // namespace bim::core
