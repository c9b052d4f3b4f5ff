/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/mesh_data.hpp"
#include <cstddef>
#include <glm/glm.hpp>
#include <memory>
#include <string>
#include <vector>

namespace bim::io {

    /// Detached node tree produced by an asset source, not yet part of any scene
    struct ImportedNode {
        std::string name;
        std::string source_guid; // from node metadata (ifcGuid / GlobalId), may be empty
        glm::mat4 transform{1.0f};
        std::shared_ptr<core::MeshData> mesh; // null for pure transform nodes
        std::shared_ptr<core::Material> material;
        std::vector<ImportedNode> children;
    };

    struct ImportedAsset {
        std::string source_url;
        ImportedNode root;

        [[nodiscard]] size_t meshNodeCount() const {
            size_t count = 0;
            countMeshes(root, count);
            return count;
        }

    private:
        static void countMeshes(const ImportedNode& node, size_t& count) {
            if (node.mesh)
                ++count;
            for (const auto& child : node.children)
                countMeshes(child, count);
        }
    };

} // namespace bim::io
