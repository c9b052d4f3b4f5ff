/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/mesh_data.hpp"

namespace bim::core {

    MeshData MeshData::box(const glm::vec3& min, const glm::vec3& max) {
        std::vector<glm::vec3> verts = {
            {min.x, min.y, min.z},
            {max.x, min.y, min.z},
            {max.x, max.y, min.z},
            {min.x, max.y, min.z},
            {min.x, min.y, max.z},
            {max.x, min.y, max.z},
            {max.x, max.y, max.z},
            {min.x, max.y, max.z}};

        // Two triangles per face: -Z, +Z, -Y, +Y, -X, +X
        std::vector<glm::uvec3> tris = {
            {0, 2, 1}, {0, 3, 2},
            {4, 5, 6}, {4, 6, 7},
            {0, 1, 5}, {0, 5, 4},
            {3, 7, 6}, {3, 6, 2},
            {0, 4, 7}, {0, 7, 3},
            {1, 2, 6}, {1, 6, 5}};

        return MeshData(std::move(verts), std::move(tris));
    }

    MeshData MeshData::quad(const float size) {
        const float h = size * 0.5f;
        MeshData mesh({{-h, -h, 0.0f}, {h, -h, 0.0f}, {h, h, 0.0f}, {-h, h, 0.0f}},
                      {{0, 1, 2}, {0, 2, 3}});
        mesh.normals.assign(4, glm::vec3(0.0f, 0.0f, 1.0f));
        return mesh;
    }

} // namespace bim::core
