/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/base64.hpp"
#include <array>

namespace bim::core {

    namespace {
        constexpr std::string_view ALPHABET =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        constexpr int INVALID = -1;

        constexpr std::array<int, 256> make_decode_table() {
            std::array<int, 256> table{};
            for (auto& v : table)
                v = INVALID;
            for (size_t i = 0; i < ALPHABET.size(); ++i)
                table[static_cast<uint8_t>(ALPHABET[i])] = static_cast<int>(i);
            return table;
        }

        constexpr auto DECODE_TABLE = make_decode_table();
    } // namespace

    std::string base64_encode(const std::span<const uint8_t> data) {
        std::string out;
        out.reserve(((data.size() + 2) / 3) * 4);

        size_t i = 0;
        for (; i + 2 < data.size(); i += 3) {
            const uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                               (static_cast<uint32_t>(data[i + 1]) << 8) |
                               static_cast<uint32_t>(data[i + 2]);
            out.push_back(ALPHABET[(n >> 18) & 0x3F]);
            out.push_back(ALPHABET[(n >> 12) & 0x3F]);
            out.push_back(ALPHABET[(n >> 6) & 0x3F]);
            out.push_back(ALPHABET[n & 0x3F]);
        }

        const size_t rest = data.size() - i;
        if (rest == 1) {
            const uint32_t n = static_cast<uint32_t>(data[i]) << 16;
            out.push_back(ALPHABET[(n >> 18) & 0x3F]);
            out.push_back(ALPHABET[(n >> 12) & 0x3F]);
            out.append("==");
        } else if (rest == 2) {
            const uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                               (static_cast<uint32_t>(data[i + 1]) << 8);
            out.push_back(ALPHABET[(n >> 18) & 0x3F]);
            out.push_back(ALPHABET[(n >> 12) & 0x3F]);
            out.push_back(ALPHABET[(n >> 6) & 0x3F]);
            out.push_back('=');
        }
        return out;
    }

    std::optional<std::vector<uint8_t>> base64_decode(const std::string_view encoded) {
        if (encoded.size() % 4 != 0)
            return std::nullopt;

        std::vector<uint8_t> out;
        out.reserve(encoded.size() / 4 * 3);

        for (size_t i = 0; i < encoded.size(); i += 4) {
            const bool last = i + 4 == encoded.size();
            int vals[4];
            int padding = 0;
            for (int k = 0; k < 4; ++k) {
                const char c = encoded[i + k];
                if (c == '=' && last && k >= 2) {
                    vals[k] = 0;
                    ++padding;
                    continue;
                }
                if (padding > 0)
                    return std::nullopt;
                vals[k] = DECODE_TABLE[static_cast<uint8_t>(c)];
                if (vals[k] == INVALID)
                    return std::nullopt;
            }

            const uint32_t n = (static_cast<uint32_t>(vals[0]) << 18) |
                               (static_cast<uint32_t>(vals[1]) << 12) |
                               (static_cast<uint32_t>(vals[2]) << 6) |
                               static_cast<uint32_t>(vals[3]);
            out.push_back(static_cast<uint8_t>((n >> 16) & 0xFF));
            if (padding < 2)
                out.push_back(static_cast<uint8_t>((n >> 8) & 0xFF));
            if (padding < 1)
                out.push_back(static_cast<uint8_t>(n & 0xFF));
        }
        return out;
    }

} // namespace bim::core
