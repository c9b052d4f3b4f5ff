/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/scene.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cassert>
#include <utility>

namespace bim::core {

    void Scene::notifyMutation(MutationType type) {
        pending_mutations_ |= static_cast<uint32_t>(type);

        if (transaction_depth_ == 0) {
            flushMutations();
        }
    }

    void Scene::flushMutations() {
        if (pending_mutations_ == 0)
            return;
        const uint32_t flags = pending_mutations_;
        pending_mutations_ = 0;
        ++generation_;
        if (mutation_listener_) {
            mutation_listener_(flags);
        }
    }

    Scene::Transaction::Transaction(Scene& scene) : scene_(scene) {
        ++scene_.transaction_depth_;
    }

    Scene::Transaction::~Transaction() {
        assert(scene_.transaction_depth_ > 0);
        if (--scene_.transaction_depth_ == 0) {
            scene_.flushMutations();
        }
    }

    NodeId Scene::addNodeInternal(std::unique_ptr<SceneNode> node) {
        const NodeId id = next_node_id_++;
        node->id = id;

        if (node->parent_id != NULL_NODE) {
            if (auto* p = getNodeById(node->parent_id)) {
                p->children.push_back(id);
            } else {
                LOG_WARN("Parent {} of node '{}' not found, adding as root", node->parent_id, node->name);
                node->parent_id = NULL_NODE;
            }
        }

        id_to_index_[id] = nodes_.size();
        nodes_.push_back(std::move(node));
        notifyMutation(MutationType::NODE_ADDED);
        return id;
    }

    NodeId Scene::addGroup(const std::string& name, const NodeId parent) {
        auto node = std::make_unique<SceneNode>();
        node->parent_id = parent;
        node->type = NodeType::GROUP;
        node->name = name;

        const NodeId id = addNodeInternal(std::move(node));
        LOG_TRACE("Added group node '{}' (id={})", name, id);
        return id;
    }

    NodeId Scene::addMesh(const std::string& name, std::shared_ptr<MeshData> mesh_data,
                          std::shared_ptr<Material> material, const NodeId parent) {
        if (!mesh_data) {
            LOG_WARN("Cannot add mesh node '{}': mesh data is null", name);
            return NULL_NODE;
        }

        const size_t nv = mesh_data->vertex_count();
        const size_t nf = mesh_data->face_count();

        auto node = std::make_unique<SceneNode>();
        node->parent_id = parent;
        node->type = NodeType::MESH;
        node->name = name;
        node->mesh = std::move(mesh_data);
        node->material = material ? std::move(material) : std::make_shared<Material>();

        const NodeId id = addNodeInternal(std::move(node));
        LOG_TRACE("Added mesh node '{}' (id={}, {} vertices, {} faces)", name, id, nv, nf);
        return id;
    }

    NodeId Scene::addHelper(const std::string& name, std::shared_ptr<MeshData> mesh_data,
                            std::shared_ptr<Material> material, const NodeId parent) {
        auto node = std::make_unique<SceneNode>();
        node->parent_id = parent;
        node->type = NodeType::HELPER;
        node->name = name;
        node->mesh = std::move(mesh_data);
        node->material = std::move(material);

        const NodeId id = addNodeInternal(std::move(node));
        LOG_TRACE("Added helper node '{}' (id={})", name, id);
        return id;
    }

    bool Scene::removeNode(const NodeId id, const bool keep_children) {
        if (!getNodeById(id))
            return false;
        Transaction txn(*this);
        removeNodeInternal(id, keep_children);
        return true;
    }

    void Scene::removeNodeInternal(const NodeId id, const bool keep_children) {
        SceneNode* node = getNodeById(id);
        if (!node)
            return;

        const NodeId parent_id = node->parent_id;
        SceneNode* parent = getNodeById(parent_id);
        if (parent)
            std::erase(parent->children, id);

        // Snapshot: recursive removal mutates nodes_ and invalidates node
        const std::vector<NodeId> children = node->children;
        for (const NodeId child_id : children) {
            if (!keep_children) {
                removeNodeInternal(child_id, false);
                continue;
            }
            SceneNode* child = getNodeById(child_id);
            if (!child)
                continue;
            child->parent_id = parent ? parent_id : NULL_NODE;
            if (parent)
                parent->children.push_back(child_id);
            markTransformDirty(child_id);
        }

        const auto slot = id_to_index_.find(id);
        assert(slot != id_to_index_.end());
        const size_t erased = slot->second;
        LOG_TRACE("Removed node '{}' (id={}, children {})", nodes_[erased]->name, id,
                  keep_children ? "reparented" : "removed");

        id_to_index_.erase(slot);
        nodes_.erase(nodes_.begin() + static_cast<ptrdiff_t>(erased));
        for (auto& entry : id_to_index_) {
            entry.second -= entry.second > erased ? 1 : 0;
        }

        notifyMutation(MutationType::NODE_REMOVED);
    }

    void Scene::clear() {
        Transaction txn(*this);

        nodes_.clear();
        id_to_index_.clear();

        notifyMutation(MutationType::CLEARED);
    }

    void Scene::setNodeVisible(const NodeId id, const bool visible) {
        auto* node = getNodeById(id);
        if (!node || node->visible == visible)
            return;
        node->visible = visible;
        notifyMutation(MutationType::VISIBILITY_CHANGED);
    }

    void Scene::setSubtreeVisible(const NodeId id, const bool visible) {
        Transaction txn(*this);
        auto* node = getNodeById(id);
        if (!node)
            return;

        setNodeVisible(id, visible);
        for (const NodeId child_id : node->children) {
            setSubtreeVisible(child_id, visible);
        }
    }

    void Scene::setNodeTransform(const NodeId id, const glm::mat4& transform) {
        auto* node = getNodeById(id);
        if (!node)
            return;
        node->local_transform = transform;
        markTransformDirty(id);
        notifyMutation(MutationType::TRANSFORM_CHANGED);
    }

    glm::mat4 Scene::getNodeTransform(const NodeId id) const {
        const auto* node = getNodeById(id);
        return node ? node->local_transform : glm::mat4(1.0f);
    }

    void Scene::setNodeMaterial(const NodeId id, std::shared_ptr<Material> material) {
        auto* node = getNodeById(id);
        if (!node)
            return;
        node->material = std::move(material);
        notifyMutation(MutationType::MATERIAL_CHANGED);
    }

    const glm::mat4& Scene::getWorldTransform(const NodeId node_id) const {
        const auto* node = getNodeById(node_id);
        if (!node) {
            static const glm::mat4 IDENTITY{1.0f};
            return IDENTITY;
        }
        updateWorldTransform(*node);
        return node->world_transform;
    }

    std::vector<NodeId> Scene::getRootNodes() const {
        std::vector<NodeId> roots;
        for (const auto& node : nodes_) {
            if (node->parent_id == NULL_NODE)
                roots.push_back(node->id);
        }
        return roots;
    }

    SceneNode* Scene::getNodeById(const NodeId id) {
        return const_cast<SceneNode*>(std::as_const(*this).getNodeById(id));
    }

    const SceneNode* Scene::getNodeById(const NodeId id) const {
        const auto slot = id_to_index_.find(id);
        return slot == id_to_index_.end() ? nullptr : nodes_[slot->second].get();
    }

    NodeId Scene::findNodeByName(const std::string& name) const {
        for (const auto& node : nodes_) {
            if (node->name == name)
                return node->id;
        }
        return NULL_NODE;
    }

    std::vector<const SceneNode*> Scene::getNodes() const {
        std::vector<const SceneNode*> result;
        result.reserve(nodes_.size());
        for (const auto& node : nodes_) {
            result.push_back(node.get());
        }
        return result;
    }

    bool Scene::isNodeEffectivelyVisible(const NodeId id) const {
        const SceneNode* node = getNodeById(id);
        if (!node)
            return false;
        // Hidden anywhere on the ancestor chain means hidden
        for (; node; node = getNodeById(node->parent_id)) {
            if (!node->visible)
                return false;
        }
        return true;
    }

    bool Scene::isInSubtree(const NodeId id, const NodeId root) const {
        NodeId check = id;
        while (check != NULL_NODE) {
            if (check == root)
                return true;
            const auto* node = getNodeById(check);
            check = node ? node->parent_id : NULL_NODE;
        }
        return false;
    }

    void Scene::markTransformDirty(const NodeId node_id) {
        std::vector<NodeId> pending{node_id};
        while (!pending.empty()) {
            SceneNode* node = getNodeById(pending.back());
            pending.pop_back();
            // A dirty node already has a dirty subtree
            if (!node || node->transform_dirty)
                continue;
            node->transform_dirty = true;
            pending.insert(pending.end(), node->children.begin(), node->children.end());
        }
    }

    void Scene::updateWorldTransform(const SceneNode& node) const {
        if (!node.transform_dirty)
            return;

        glm::mat4 parent_world(1.0f);
        if (const SceneNode* parent = getNodeById(node.parent_id)) {
            updateWorldTransform(*parent);
            parent_world = parent->world_transform;
        }
        node.world_transform = parent_world * node.local_transform;
        node.transform_dirty = false;
    }

    bool Scene::getNodeBounds(const NodeId id, glm::vec3& out_min, glm::vec3& out_max,
                              const bool include_helpers) const {
        const auto* node = getNodeById(id);
        if (!node)
            return false;
        if (node->type == NodeType::HELPER && !include_helpers)
            return false;

        BoundingBox total;

        if (node->mesh && node->mesh->vertex_count() > 0) {
            total.expand(node->mesh->bounds());
        }

        for (const NodeId child_id : node->children) {
            glm::vec3 child_min, child_max;
            if (getNodeBounds(child_id, child_min, child_max, include_helpers)) {
                const auto* child = getNodeById(child_id);
                if (child) {
                    total.expand(BoundingBox(child_min, child_max).transformed(child->local_transform));
                }
            }
        }

        if (total.isEmpty())
            return false;

        out_min = total.min;
        out_max = total.max;
        return true;
    }

    BoundingBox Scene::getWorldBounds(const NodeId id, const bool include_helpers) const {
        glm::vec3 local_min, local_max;
        if (!getNodeBounds(id, local_min, local_max, include_helpers))
            return {};
        return BoundingBox(local_min, local_max).transformed(getWorldTransform(id));
    }

    BoundingBox Scene::getSceneBounds(const bool include_helpers) const {
        BoundingBox total;
        for (const NodeId root : getRootNodes()) {
            total.expand(getWorldBounds(root, include_helpers));
        }
        return total;
    }

    void Scene::forEachInSubtree(const NodeId root, const std::function<void(const SceneNode&)>& fn) const {
        const auto* node = getNodeById(root);
        if (!node)
            return;
        fn(*node);
        for (const NodeId child_id : node->children) {
            forEachInSubtree(child_id, fn);
        }
    }

    std::vector<NodeId> Scene::getMeshNodes(const NodeId root) const {
        std::vector<NodeId> result;
        const auto collect = [&result](const SceneNode& node) {
            if (node.type == NodeType::MESH && node.mesh)
                result.push_back(node.id);
        };

        if (root != NULL_NODE) {
            forEachInSubtree(root, collect);
        } else {
            for (const NodeId r : getRootNodes()) {
                forEachInSubtree(r, collect);
            }
        }
        return result;
    }

} // namespace bim::core
