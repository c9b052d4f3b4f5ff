/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace bim::rendering {

    enum class ImageFormat : uint8_t {
        Png,
        Jpeg
    };

    [[nodiscard]] constexpr std::string_view image_format_to_string(const ImageFormat format) {
        return format == ImageFormat::Jpeg ? "jpeg" : "png";
    }

    [[nodiscard]] constexpr std::string_view image_format_mime_type(const ImageFormat format) {
        return format == ImageFormat::Jpeg ? "image/jpeg" : "image/png";
    }

    [[nodiscard]] constexpr std::optional<ImageFormat> image_format_from_string(const std::string_view str) {
        if (str == "png")
            return ImageFormat::Png;
        if (str == "jpeg" || str == "jpg")
            return ImageFormat::Jpeg;
        return std::nullopt;
    }

    /// Row-major 8-bit image, first row is the top of the frame
    struct Image {
        int width = 0;
        int height = 0;
        int channels = 4;
        std::vector<uint8_t> pixels;

        [[nodiscard]] bool empty() const { return width <= 0 || height <= 0 || pixels.empty(); }

        [[nodiscard]] size_t offset(const int x, const int y) const {
            return (static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)) *
                   static_cast<size_t>(channels);
        }

        [[nodiscard]] const uint8_t* at(const int x, const int y) const { return pixels.data() + offset(x, y); }
    };

} // namespace bim::rendering
