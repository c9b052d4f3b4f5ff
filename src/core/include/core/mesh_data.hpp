/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include "core/geometry.hpp"
#include <cstddef>
#include <glm/glm.hpp>
#include <string>
#include <vector>

namespace bim::core {

    struct Material {
        std::string name;
        glm::vec4 base_color{0.8f, 0.8f, 0.8f, 1.0f};
        glm::vec3 emissive{0.0f};
        float emissive_intensity = 1.0f;
        float metallic = 0.0f;
        float roughness = 0.5f;
        bool double_sided = false;
    };

    struct BIM_CORE_API MeshData {
        std::vector<glm::vec3> vertices;
        std::vector<glm::uvec3> indices; // triangles
        std::vector<glm::vec3> normals;  // per vertex, optional

        MeshData() = default;
        MeshData(std::vector<glm::vec3> verts, std::vector<glm::uvec3> tris)
            : vertices(std::move(verts)),
              indices(std::move(tris)) {}

        [[nodiscard]] size_t vertex_count() const { return vertices.size(); }
        [[nodiscard]] size_t face_count() const { return indices.size(); }
        [[nodiscard]] bool has_normals() const { return !normals.empty() && normals.size() == vertices.size(); }

        [[nodiscard]] BoundingBox bounds() const {
            BoundingBox box;
            for (const auto& v : vertices)
                box.expand(v);
            return box;
        }

        // Axis-aligned box, 8 vertices / 12 triangles, outward winding
        [[nodiscard]] static MeshData box(const glm::vec3& min, const glm::vec3& max);

        // Unit quad in the XY plane centered at the origin, facing +Z
        [[nodiscard]] static MeshData quad(float size);
    };

} // namespace bim::core
