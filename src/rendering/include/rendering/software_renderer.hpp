/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "rendering/renderer.hpp"
#include <cstdint>
#include <vector>

namespace bim::core {
    class SceneNode;
    struct Material;
} // namespace bim::core

namespace bim::rendering {

    /**
     * @brief CPU reference renderer.
     *
     * Z-buffered triangle rasterizer with flat Lambert shading from a
     * camera-aligned headlight plus material emission. When local clipping is
     * enabled, fragments behind any published plane are discarded (helpers are
     * exempt). Faces are culled unless the material is double sided.
     */
    class SoftwareRenderer final : public Renderer {
    public:
        static constexpr float AMBIENT = 0.3f;

        SoftwareRenderer() = default;
        SoftwareRenderer(int width, int height);

        void render(const core::Scene& scene, const core::ViewCamera& camera) override;
        [[nodiscard]] Image readPixels() const override;

        [[nodiscard]] uint64_t frameCount() const { return frame_count_; }

    private:
        void clear(int width, int height);
        void drawNode(const core::Scene& scene, const core::SceneNode& node,
                      const core::ViewCamera& camera, const glm::mat4& view_proj);

        int buffer_width_ = 0;
        int buffer_height_ = 0;
        std::vector<uint8_t> color_;
        std::vector<float> depth_;
        uint64_t frame_count_ = 0;
    };

} // namespace bim::rendering
