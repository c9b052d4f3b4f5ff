/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "rendering/software_renderer.hpp"
#include "core/logger.hpp"
#include "core/scene.hpp"
#include "core/view_camera.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

namespace bim::rendering {

    namespace {
        constexpr float W_EPSILON = 1e-6f;

        struct ClipVertex {
            glm::vec4 clip;
            glm::vec3 world;
        };

        struct ScreenVertex {
            glm::vec2 xy;
            float z = 0.0f;
            float inv_w = 0.0f;
            glm::vec3 world_over_w{0.0f};
        };

        // Sutherland-Hodgman against the near plane (z + w >= 0 in GL clip space)
        size_t clip_near(const std::array<ClipVertex, 3>& in, std::array<ClipVertex, 4>& out) {
            size_t count = 0;
            for (size_t i = 0; i < 3; ++i) {
                const ClipVertex& a = in[i];
                const ClipVertex& b = in[(i + 1) % 3];
                const float da = a.clip.z + a.clip.w;
                const float db = b.clip.z + b.clip.w;
                if (da >= 0.0f) {
                    out[count++] = a;
                }
                if ((da >= 0.0f) != (db >= 0.0f)) {
                    const float t = da / (da - db);
                    out[count++] = ClipVertex{a.clip + (b.clip - a.clip) * t, a.world + (b.world - a.world) * t};
                }
            }
            return count;
        }

        float edge(const glm::vec2& a, const glm::vec2& b, const glm::vec2& p) {
            return (b.x - a.x) * (p.y - a.y) - (b.y - a.y) * (p.x - a.x);
        }

        uint8_t to_byte(const float v) {
            return static_cast<uint8_t>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
        }
    } // namespace

    SoftwareRenderer::SoftwareRenderer(const int width, const int height) {
        setSize(width, height);
    }

    void SoftwareRenderer::clear(const int width, const int height) {
        buffer_width_ = std::max(width, 0);
        buffer_height_ = std::max(height, 0);

        const size_t pixel_count = static_cast<size_t>(buffer_width_) * static_cast<size_t>(buffer_height_);
        color_.assign(pixel_count * 4, 0);
        depth_.assign(pixel_count, std::numeric_limits<float>::infinity());

        const glm::vec3 fill = background_.value_or(clear_color_);
        const uint8_t alpha = background_ ? 255 : to_byte(clear_alpha_);
        const std::array<uint8_t, 4> rgba = {to_byte(fill.r), to_byte(fill.g), to_byte(fill.b), alpha};
        for (size_t i = 0; i < pixel_count; ++i) {
            std::copy(rgba.begin(), rgba.end(), color_.begin() + static_cast<std::ptrdiff_t>(i * 4));
        }
    }

    void SoftwareRenderer::render(const core::Scene& scene, const core::ViewCamera& camera) {
        const auto buffer = getDrawingBufferSize();
        clear(buffer.x, buffer.y);
        ++frame_count_;

        if (buffer_width_ == 0 || buffer_height_ == 0)
            return;

        const glm::mat4 view_proj = camera.projectionMatrix() * camera.viewMatrix();

        // Opaque first, then blended surfaces over the finished depth buffer
        std::vector<const core::SceneNode*> translucent;
        for (const auto* node : scene.getNodes()) {
            if (node->type == core::NodeType::GROUP || !node->mesh)
                continue;
            if (!scene.isNodeEffectivelyVisible(node->id))
                continue;
            if (node->material && node->material->base_color.a < 1.0f) {
                translucent.push_back(node);
                continue;
            }
            drawNode(scene, *node, camera, view_proj);
        }
        for (const auto* node : translucent) {
            drawNode(scene, *node, camera, view_proj);
        }

        LOG_TRACE("Frame {} rendered at {}x{}", frame_count_, buffer_width_, buffer_height_);
    }

    void SoftwareRenderer::drawNode(const core::Scene& scene, const core::SceneNode& node,
                                    const core::ViewCamera& camera, const glm::mat4& view_proj) {
        static const core::Material DEFAULT_MATERIAL{};

        const auto& mesh = *node.mesh;
        const core::Material& material = node.material ? *node.material : DEFAULT_MATERIAL;
        const glm::mat4& model = scene.getWorldTransform(node.id);

        const bool clip = local_clipping_enabled_ && !clipping_planes_.empty() &&
                          node.type != core::NodeType::HELPER;
        const bool blend = material.base_color.a < 1.0f;
        const float alpha = std::clamp(material.base_color.a, 0.0f, 1.0f);
        const glm::vec3 light_dir = -camera.forward();
        const auto width = static_cast<float>(buffer_width_);
        const auto height = static_cast<float>(buffer_height_);

        for (const auto& tri : mesh.indices) {
            if (tri.x >= mesh.vertices.size() || tri.y >= mesh.vertices.size() || tri.z >= mesh.vertices.size())
                continue;

            std::array<ClipVertex, 3> corners;
            for (int i = 0; i < 3; ++i) {
                const glm::vec3 world = glm::vec3(model * glm::vec4(mesh.vertices[tri[i]], 1.0f));
                corners[i] = ClipVertex{view_proj * glm::vec4(world, 1.0f), world};
            }

            const glm::vec3 face = glm::cross(corners[1].world - corners[0].world, corners[2].world - corners[0].world);
            const float face_len = glm::length(face);
            if (face_len <= 0.0f)
                continue;

            // Headlight: the side facing the camera is lit
            const float lambert = std::abs(glm::dot(face / face_len, light_dir));
            const glm::vec3 rgb = glm::vec3(material.base_color) * (AMBIENT + (1.0f - AMBIENT) * lambert) +
                                  material.emissive * material.emissive_intensity;
            const std::array<uint8_t, 3> shade = {to_byte(rgb.r), to_byte(rgb.g), to_byte(rgb.b)};

            std::array<ClipVertex, 4> polygon;
            const size_t count = clip_near(corners, polygon);
            if (count < 3)
                continue;

            std::array<ScreenVertex, 4> screen;
            bool degenerate = false;
            for (size_t i = 0; i < count; ++i) {
                const glm::vec4& c = polygon[i].clip;
                if (c.w <= W_EPSILON) {
                    degenerate = true;
                    break;
                }
                const float inv_w = 1.0f / c.w;
                const glm::vec3 ndc = glm::vec3(c) * inv_w;
                screen[i].xy = {(ndc.x * 0.5f + 0.5f) * width, (0.5f - ndc.y * 0.5f) * height};
                screen[i].z = ndc.z;
                screen[i].inv_w = inv_w;
                screen[i].world_over_w = polygon[i].world * inv_w;
            }
            if (degenerate)
                continue;

            for (size_t k = 1; k + 1 < count; ++k) {
                const ScreenVertex& v0 = screen[0];
                const ScreenVertex& v1 = screen[k];
                const ScreenVertex& v2 = screen[k + 1];

                const float area = edge(v0.xy, v1.xy, v2.xy);
                if (area == 0.0f)
                    continue;
                // Screen y points down, so counter-clockwise front faces have negative area
                if (area > 0.0f && !material.double_sided)
                    continue;

                const int min_x = std::max(0, static_cast<int>(std::floor(std::min({v0.xy.x, v1.xy.x, v2.xy.x}))));
                const int max_x = std::min(buffer_width_ - 1, static_cast<int>(std::ceil(std::max({v0.xy.x, v1.xy.x, v2.xy.x}))));
                const int min_y = std::max(0, static_cast<int>(std::floor(std::min({v0.xy.y, v1.xy.y, v2.xy.y}))));
                const int max_y = std::min(buffer_height_ - 1, static_cast<int>(std::ceil(std::max({v0.xy.y, v1.xy.y, v2.xy.y}))));

                for (int py = min_y; py <= max_y; ++py) {
                    for (int px = min_x; px <= max_x; ++px) {
                        const glm::vec2 sample(static_cast<float>(px) + 0.5f, static_cast<float>(py) + 0.5f);
                        const float b0 = edge(v1.xy, v2.xy, sample) / area;
                        const float b1 = edge(v2.xy, v0.xy, sample) / area;
                        const float b2 = edge(v0.xy, v1.xy, sample) / area;
                        if (b0 < 0.0f || b1 < 0.0f || b2 < 0.0f)
                            continue;

                        const float z = b0 * v0.z + b1 * v1.z + b2 * v2.z;
                        if (z < -1.0f || z > 1.0f)
                            continue;

                        const size_t index = static_cast<size_t>(py) * static_cast<size_t>(buffer_width_) +
                                             static_cast<size_t>(px);
                        if (z >= depth_[index])
                            continue;

                        if (clip) {
                            const float inv_w = b0 * v0.inv_w + b1 * v1.inv_w + b2 * v2.inv_w;
                            const glm::vec3 world = (b0 * v0.world_over_w + b1 * v1.world_over_w + b2 * v2.world_over_w) / inv_w;
                            const bool clipped = std::any_of(clipping_planes_.begin(), clipping_planes_.end(),
                                                             [&](const core::Plane& plane) { return plane.distanceTo(world) < 0.0f; });
                            if (clipped)
                                continue;
                        }

                        uint8_t* dst = color_.data() + index * 4;
                        if (blend) {
                            for (int c = 0; c < 3; ++c) {
                                dst[c] = to_byte((shade[c] * alpha + dst[c] * (1.0f - alpha)) / 255.0f);
                            }
                            dst[3] = to_byte(alpha + (dst[3] / 255.0f) * (1.0f - alpha));
                        } else {
                            dst[0] = shade[0];
                            dst[1] = shade[1];
                            dst[2] = shade[2];
                            dst[3] = 255;
                            depth_[index] = z;
                        }
                    }
                }
            }
        }
    }

    Image SoftwareRenderer::readPixels() const {
        Image image;
        image.width = buffer_width_;
        image.height = buffer_height_;
        image.channels = 4;
        image.pixels = color_;
        return image;
    }

} // namespace bim::rendering
