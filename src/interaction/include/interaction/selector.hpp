/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/bim_metadata.hpp"
#include "core/geometry.hpp"
#include "core/mesh_data.hpp"
#include "core/parameters.hpp"
#include "core/scene.hpp"
#include "interaction/model_binder.hpp"
#include <glm/glm.hpp>
#include <memory>
#include <optional>

namespace bim::core {
    class ViewCamera;
}

namespace bim::interaction {

    struct PointerEvent {
        float client_x = 0.0f;
        float client_y = 0.0f;
    };

    /// Bounding rectangle of the viewport in the same space as pointer coordinates
    struct ViewportRect {
        float left = 0.0f;
        float top = 0.0f;
        float width = 0.0f;
        float height = 0.0f;
    };

    struct SelectionResult {
        core::NodeId node = core::NULL_NODE;
        const core::SemanticElement* element = nullptr; // null for generic objects
        glm::vec3 point{0.0f};                           // world space
        glm::vec3 normal{0.0f};                          // world-space face normal
        float distance = 0.0f;

        [[nodiscard]] bool hit() const { return node != core::NULL_NODE; }
    };

    struct RayHit {
        core::NodeId node = core::NULL_NODE;
        float distance = 0.0f;
        glm::vec3 point{0.0f};
        glm::vec3 normal{0.0f};
    };

    // Viewport pixel to NDC (+y up). nullopt for a zero-sized viewport.
    [[nodiscard]] std::optional<glm::vec2> pointer_to_ndc(const PointerEvent& event, const ViewportRect& viewport);

    /**
     * Nearest visible, selectable mesh hit along a world ray. Triangles are
     * two-sided; at equal distance the first node in scene order wins.
     * model may be null, in which case every mesh is selectable.
     */
    [[nodiscard]] std::optional<RayHit> raycast_scene(const core::Scene& scene, const core::Ray& ray,
                                                      const BoundModel* model);

    /**
     * @brief Picks nodes under the pointer and highlights the selection.
     *
     * The highlight is one shared material owned by the selector. The picked
     * node's own material is kept aside and put back before any other node is
     * highlighted, so at most one node shows the highlight at a time.
     * The scene passed to pick() must outlive the selection (clearSelection()
     * or destruction restores it).
     */
    class Selector {
    public:
        Selector();
        explicit Selector(const core::param::SelectionParameters& params);
        ~Selector();

        Selector(const Selector&) = delete;
        Selector& operator=(const Selector&) = delete;

        void setModel(std::shared_ptr<const BoundModel> model) { model_ = std::move(model); }

        SelectionResult pick(const PointerEvent& event, const core::ViewCamera& camera,
                             core::Scene& scene, const ViewportRect& viewport);

        // Restores the highlighted node. Safe to call repeatedly.
        void clearSelection();

        [[nodiscard]] bool hasSelection() const { return selected_node_ != core::NULL_NODE; }
        [[nodiscard]] core::NodeId getSelectedNode() const { return selected_node_; }
        [[nodiscard]] const core::SemanticElement* getSelectedElement() const;
        [[nodiscard]] const std::shared_ptr<core::Material>& highlightMaterial() const { return highlight_material_; }

    private:
        void highlight(core::Scene& scene, core::NodeId node);

        std::shared_ptr<const BoundModel> model_;
        std::shared_ptr<core::Material> highlight_material_;

        core::Scene* selected_scene_ = nullptr;
        core::NodeId selected_node_ = core::NULL_NODE;
        std::shared_ptr<core::Material> original_material_;
    };

} // namespace bim::interaction
