/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include "core/geometry.hpp"
#include "core/mesh_data.hpp"
#include <cstdint>
#include <functional>
#include <glm/glm.hpp>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace bim::core {

    using NodeId = int32_t;
    constexpr NodeId NULL_NODE = -1;

    enum class NodeType : uint8_t {
        GROUP,  // Empty transform node for organization
        MESH,   // Triangle mesh with a material slot
        HELPER  // Editor visual (section plane quads), never part of the model
    };

    class Scene;

    class BIM_CORE_API SceneNode {
    public:
        NodeId id = NULL_NODE;
        NodeId parent_id = NULL_NODE;
        std::vector<NodeId> children;
        NodeType type = NodeType::GROUP;
        std::string name;

        // Identifier attached by the source asset (e.g. an IFC GlobalId in node extras)
        std::string source_guid;

        std::shared_ptr<MeshData> mesh;
        std::shared_ptr<Material> material;

        glm::mat4 local_transform{1.0f};
        bool visible = true;

        mutable glm::mat4 world_transform{1.0f};
        mutable bool transform_dirty = true;

        [[nodiscard]] const glm::mat4& transform() const { return local_transform; }
        [[nodiscard]] bool hasGeometry() const { return mesh != nullptr; }
    };

    class BIM_CORE_API Scene {
    public:
        using Node = SceneNode;

        enum class MutationType : uint32_t {
            NODE_ADDED = 1 << 0,
            NODE_REMOVED = 1 << 1,
            TRANSFORM_CHANGED = 1 << 2,
            VISIBILITY_CHANGED = 1 << 3,
            MATERIAL_CHANGED = 1 << 4,
            CLEARED = 1 << 5,
        };

        using MutationListener = std::function<void(uint32_t mutation_flags)>;

        void notifyMutation(MutationType type);

        class BIM_CORE_API Transaction {
        public:
            explicit Transaction(Scene& scene);
            ~Transaction();
            Transaction(const Transaction&) = delete;
            Transaction& operator=(const Transaction&) = delete;

        private:
            Scene& scene_;
        };

        Scene() = default;
        ~Scene() = default;

        Scene(const Scene&) = delete;
        Scene& operator=(const Scene&) = delete;

        NodeId addGroup(const std::string& name, NodeId parent = NULL_NODE);
        NodeId addMesh(const std::string& name, std::shared_ptr<MeshData> mesh_data,
                       std::shared_ptr<Material> material, NodeId parent = NULL_NODE);
        NodeId addHelper(const std::string& name, std::shared_ptr<MeshData> mesh_data,
                         std::shared_ptr<Material> material, NodeId parent = NULL_NODE);
        bool removeNode(NodeId id, bool keep_children = false);
        void clear();

        void setNodeVisible(NodeId id, bool visible);
        void setSubtreeVisible(NodeId id, bool visible);
        void setNodeTransform(NodeId id, const glm::mat4& transform);
        [[nodiscard]] glm::mat4 getNodeTransform(NodeId id) const;
        void setNodeMaterial(NodeId id, std::shared_ptr<Material> material);

        [[nodiscard]] const glm::mat4& getWorldTransform(NodeId node) const;
        [[nodiscard]] std::vector<NodeId> getRootNodes() const;
        [[nodiscard]] SceneNode* getNodeById(NodeId id);
        [[nodiscard]] const SceneNode* getNodeById(NodeId id) const;
        [[nodiscard]] NodeId findNodeByName(const std::string& name) const;

        [[nodiscard]] bool isNodeEffectivelyVisible(NodeId id) const;
        [[nodiscard]] bool isInSubtree(NodeId id, NodeId root) const;

        // Bounds in the node's own coordinate frame (own mesh plus transformed children)
        [[nodiscard]] bool getNodeBounds(NodeId id, glm::vec3& out_min, glm::vec3& out_max,
                                         bool include_helpers = false) const;
        [[nodiscard]] BoundingBox getWorldBounds(NodeId id, bool include_helpers = false) const;
        [[nodiscard]] BoundingBox getSceneBounds(bool include_helpers = false) const;

        // Pre-order traversal, children in insertion order
        void forEachInSubtree(NodeId root, const std::function<void(const SceneNode&)>& fn) const;
        [[nodiscard]] std::vector<NodeId> getMeshNodes(NodeId root = NULL_NODE) const;

        size_t getNodeCount() const { return nodes_.size(); }
        std::vector<const SceneNode*> getNodes() const;
        bool hasNodes() const { return !nodes_.empty(); }

        void setMutationListener(MutationListener listener) { mutation_listener_ = std::move(listener); }
        [[nodiscard]] uint64_t generation() const { return generation_; }

        void markTransformDirty(NodeId node);

    private:
        std::vector<std::unique_ptr<SceneNode>> nodes_;
        std::unordered_map<NodeId, size_t> id_to_index_;
        NodeId next_node_id_ = 0;

        uint32_t pending_mutations_ = 0;
        int transaction_depth_ = 0;
        uint64_t generation_ = 0;
        MutationListener mutation_listener_;

        NodeId addNodeInternal(std::unique_ptr<SceneNode> node);
        void flushMutations();
        void updateWorldTransform(const SceneNode& node) const;
        void removeNodeInternal(NodeId id, bool keep_children);
    };

} // namespace bim::core
