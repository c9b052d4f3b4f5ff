/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "io/error.hpp"
#include "rendering/image.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace bim::rendering {

    constexpr float DEFAULT_JPEG_QUALITY = 0.92f;

    /// Encodes to PNG (RGBA kept) or JPEG (alpha dropped). quality in [0, 1], JPEG only.
    [[nodiscard]] io::Result<std::vector<uint8_t>> encode_image(const Image& image,
                                                                ImageFormat format,
                                                                float quality = DEFAULT_JPEG_QUALITY);

    // "data:image/png;base64,..."
    [[nodiscard]] std::string to_data_url(std::span<const uint8_t> encoded, ImageFormat format);

    // Inverse of to_data_url. Rejects anything that is not a base64 image data URL.
    [[nodiscard]] io::Result<std::vector<uint8_t>> data_url_to_bytes(std::string_view data_url);

} // namespace bim::rendering
