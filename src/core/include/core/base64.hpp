/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bim::core {

    // RFC 4648 standard alphabet with '=' padding
    [[nodiscard]] BIM_CORE_API std::string base64_encode(std::span<const uint8_t> data);

    // Returns nullopt on characters outside the alphabet or bad padding
    [[nodiscard]] BIM_CORE_API std::optional<std::vector<uint8_t>> base64_decode(std::string_view encoded);

} // namespace bim::core
