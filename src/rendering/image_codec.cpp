/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include "rendering/image_codec.hpp"
#include "core/base64.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace bim::rendering {

    namespace {
        constexpr std::string_view DATA_URL_PREFIX = "data:";
        constexpr std::string_view BASE64_MARKER = ";base64,";

        void append_to_vector(void* context, void* data, const int size) {
            auto* out = static_cast<std::vector<uint8_t>*>(context);
            const auto* bytes = static_cast<const uint8_t*>(data);
            out->insert(out->end(), bytes, bytes + size);
        }

        std::vector<uint8_t> drop_alpha(const Image& image) {
            const size_t pixel_count = static_cast<size_t>(image.width) * static_cast<size_t>(image.height);
            std::vector<uint8_t> rgb(pixel_count * 3);
            for (size_t i = 0; i < pixel_count; ++i) {
                rgb[i * 3 + 0] = image.pixels[i * 4 + 0];
                rgb[i * 3 + 1] = image.pixels[i * 4 + 1];
                rgb[i * 3 + 2] = image.pixels[i * 4 + 2];
            }
            return rgb;
        }
    } // namespace

    io::Result<std::vector<uint8_t>> encode_image(const Image& image,
                                                  const ImageFormat format,
                                                  const float quality) {
        if (image.empty()) {
            return io::make_error(io::ErrorCode::ENCODING_FAILED, "Cannot encode an empty image");
        }
        if (image.channels < 1 || image.channels > 4 ||
            image.pixels.size() != static_cast<size_t>(image.width) * image.height * image.channels) {
            return io::make_error(io::ErrorCode::ENCODING_FAILED,
                                  std::format("Pixel buffer does not match {}x{}x{}",
                                              image.width, image.height, image.channels));
        }

        std::vector<uint8_t> encoded;
        int ok = 0;
        if (format == ImageFormat::Png) {
            ok = stbi_write_png_to_func(append_to_vector, &encoded, image.width, image.height, image.channels,
                                        image.pixels.data(), image.width * image.channels);
        } else {
            const int jpeg_quality = std::clamp(static_cast<int>(std::lround(quality * 100.0f)), 1, 100);
            if (image.channels == 4) {
                const auto rgb = drop_alpha(image);
                ok = stbi_write_jpg_to_func(append_to_vector, &encoded, image.width, image.height, 3,
                                            rgb.data(), jpeg_quality);
            } else {
                ok = stbi_write_jpg_to_func(append_to_vector, &encoded, image.width, image.height, image.channels,
                                            image.pixels.data(), jpeg_quality);
            }
        }

        if (!ok || encoded.empty()) {
            return io::make_error(io::ErrorCode::ENCODING_FAILED,
                                  std::format("stb_image_write failed to encode {}", image_format_to_string(format)));
        }

        LOG_DEBUG("Encoded {}x{} {} ({} bytes)", image.width, image.height,
                  image_format_to_string(format), encoded.size());
        return encoded;
    }

    std::string to_data_url(const std::span<const uint8_t> encoded, const ImageFormat format) {
        return std::format("{}{}{}{}", DATA_URL_PREFIX, image_format_mime_type(format), BASE64_MARKER,
                           core::base64_encode(encoded));
    }

    io::Result<std::vector<uint8_t>> data_url_to_bytes(const std::string_view data_url) {
        if (!data_url.starts_with(DATA_URL_PREFIX)) {
            return io::make_error(io::ErrorCode::INVALID_ARGUMENT, "Not a data URL");
        }
        const auto marker = data_url.find(BASE64_MARKER);
        if (marker == std::string_view::npos) {
            return io::make_error(io::ErrorCode::INVALID_ARGUMENT, "Data URL is not base64 encoded");
        }

        auto bytes = core::base64_decode(data_url.substr(marker + BASE64_MARKER.size()));
        if (!bytes) {
            return io::make_error(io::ErrorCode::ENCODING_FAILED, "Invalid base64 payload in data URL");
        }
        return std::move(*bytes);
    }

} // namespace bim::rendering
