/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/geometry.hpp"
#include "rendering/image.hpp"
#include <glm/glm.hpp>
#include <optional>
#include <vector>

namespace bim::core {
    class Scene;
    class ViewCamera;
} // namespace bim::core

namespace bim::rendering {

    /**
     * @brief Render target the interaction layer drives.
     *
     * Holds the mutable output state (size, pixel ratio, background, clear
     * colour, global clip planes). Setters are virtual so backends can react
     * to resizes; render() and readPixels() are backend specific.
     *
     * Drawing-buffer size is the CSS-like size multiplied by the pixel ratio.
     */
    class Renderer {
    public:
        virtual ~Renderer() = default;

        [[nodiscard]] glm::ivec2 getSize() const { return size_; }
        virtual void setSize(int width, int height) { size_ = {width, height}; }

        [[nodiscard]] float getPixelRatio() const { return pixel_ratio_; }
        virtual void setPixelRatio(float ratio) { pixel_ratio_ = ratio; }

        [[nodiscard]] glm::ivec2 getDrawingBufferSize() const {
            return {static_cast<int>(static_cast<float>(size_.x) * pixel_ratio_),
                    static_cast<int>(static_cast<float>(size_.y) * pixel_ratio_)};
        }

        // No background means the clear colour/alpha shows through
        [[nodiscard]] const std::optional<glm::vec3>& getBackground() const { return background_; }
        virtual void setBackground(const std::optional<glm::vec3>& color) { background_ = color; }

        [[nodiscard]] const glm::vec3& getClearColor() const { return clear_color_; }
        virtual void setClearColor(const glm::vec3& color) { clear_color_ = color; }

        [[nodiscard]] float getClearAlpha() const { return clear_alpha_; }
        virtual void setClearAlpha(float alpha) { clear_alpha_ = alpha; }

        [[nodiscard]] const std::vector<core::Plane>& getClippingPlanes() const { return clipping_planes_; }
        virtual void setClippingPlanes(std::vector<core::Plane> planes) { clipping_planes_ = std::move(planes); }

        [[nodiscard]] bool isLocalClippingEnabled() const { return local_clipping_enabled_; }
        virtual void setLocalClippingEnabled(bool enabled) { local_clipping_enabled_ = enabled; }

        virtual void render(const core::Scene& scene, const core::ViewCamera& camera) = 0;

        // RGBA8 copy of the drawing buffer from the last render()
        [[nodiscard]] virtual Image readPixels() const = 0;

    protected:
        glm::ivec2 size_{1, 1};
        float pixel_ratio_ = 1.0f;
        std::optional<glm::vec3> background_;
        glm::vec3 clear_color_{0.0f};
        float clear_alpha_ = 1.0f;
        std::vector<core::Plane> clipping_planes_;
        bool local_clipping_enabled_ = false;
    };

} // namespace bim::rendering
