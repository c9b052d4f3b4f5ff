/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/bim_metadata.hpp"
#include "core/geometry.hpp"
#include "core/scene.hpp"
#include "interaction/metadata_index.hpp"
#include "io/asset_source.hpp"
#include "io/error.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace bim::interaction {

    struct LoadProgress {
        uint64_t loaded = 0;
        uint64_t total = 0; // 0 when unknown
        float percentage = 0.0f;
    };

    /// Per-node semantic attachment. Leaves without a metadata match are generic BIM objects.
    struct NodeBinding {
        const core::SemanticElement* element = nullptr;
        bool selectable = true;
        bool is_bim_object = false;
    };

    /**
     * @brief A model attached to a scene together with its semantic data.
     *
     * Bindings are keyed by scene node id and point into the metadata index,
     * which this object keeps alive.
     */
    struct BoundModel {
        uint64_t request_id = 0;
        std::string source_url;
        core::NodeId root = core::NULL_NODE;
        core::BoundingBox bounds; // world bounds of root; kept current by the BoundModel transform overloads
        size_t bound_count = 0; // leaves correlated with an element
        size_t total_count = 0; // all leaves
        std::shared_ptr<const ModelMetadataIndex> index;
        std::unordered_map<core::NodeId, NodeBinding> bindings;

        [[nodiscard]] const NodeBinding* binding(core::NodeId id) const;
        [[nodiscard]] const core::SemanticElement* elementFor(core::NodeId id) const;

        // Nodes without a binding are selectable
        [[nodiscard]] bool isSelectable(core::NodeId id) const;
        void setSelectable(core::NodeId id, bool selectable);
    };

    using LoadFailure = io::Error;
    using LoadResult = io::Result<std::shared_ptr<BoundModel>>;

    struct LoadCallbacks {
        std::function<void(const LoadProgress&)> on_progress;
        std::function<void(LoadResult)> on_complete;
    };

    /**
     * @brief Loads assets into a scene and correlates their leaves with metadata.
     *
     * load() returns immediately. The imported tree is attached to the scene only
     * after a successful decode, so failures never leave partial nodes behind.
     * Concurrent loads are not cancelled; every result carries its request id and
     * isLatest() tells whether a newer load has been started since.
     */
    class ModelBinder {
    public:
        explicit ModelBinder(io::AssetSource& source);

        uint64_t load(core::Scene& scene,
                      const std::string& source_url,
                      std::shared_ptr<const core::ModelMetadata> metadata,
                      LoadCallbacks callbacks);

        [[nodiscard]] bool isLatest(uint64_t request_id) const { return request_id == latest_request_id_; }
        [[nodiscard]] uint64_t latestRequestId() const { return latest_request_id_; }

        // Copies a detached tree into the scene and returns the new root
        static core::NodeId materialize(core::Scene& scene, const io::ImportedNode& node,
                                        core::NodeId parent = core::NULL_NODE);

        // Correlates every leaf under root: external guid, then element id, else generic
        [[nodiscard]] static std::shared_ptr<BoundModel> bind(const core::Scene& scene, core::NodeId root,
                                                              std::shared_ptr<const ModelMetadataIndex> index);

        static void centerAtOrigin(core::Scene& scene, core::NodeId root);
        static void scaleToFit(core::Scene& scene, core::NodeId root, float target_size);
        // Same, then refresh model.bounds
        static void centerAtOrigin(core::Scene& scene, BoundModel& model);
        static void scaleToFit(core::Scene& scene, BoundModel& model, float target_size);

        [[nodiscard]] static glm::vec3 suggestCameraPosition(const core::BoundingBox& bounds, float fov_degrees,
                                                             const glm::vec3& offset = glm::vec3(0.7f, 0.5f, 0.7f));

    private:
        io::AssetSource& source_;
        uint64_t latest_request_id_ = 0;
    };

} // namespace bim::interaction
