/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <filesystem>
#include <fstream>
#include <string>

#ifdef _WIN32
#include <windows.h>
#endif

namespace bim::core {

#ifdef _WIN32
    namespace detail {
        // Two-pass Win32 conversion; returns an empty result on failure
        template <typename Out, typename In, typename Fn>
        Out convert_utf(const In& in, Fn&& fn) {
            if (in.empty())
                return Out();
            const int needed = fn(in.c_str(), static_cast<int>(in.size()), nullptr, 0);
            if (needed <= 0)
                return Out();
            Out out(needed, 0);
            const int written = fn(in.c_str(), static_cast<int>(in.size()), out.data(), needed);
            out.resize(written > 0 ? written : 0);
            return out;
        }
    } // namespace detail
#endif

    /**
     * @brief UTF-8 representation of a path, for Assimp, log output and error messages
     *
     * path::string() yields the ANSI codepage on Windows, so go through the wide form there.
     */
    inline std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
        return detail::convert_utf<std::string>(p.wstring(), [](const wchar_t* s, int n, char* out, int cap) {
            return WideCharToMultiByte(CP_UTF8, 0, s, n, out, cap, nullptr, nullptr);
        });
#else
        return p.string();
#endif
    }

    /// Path from a UTF-8 string such as a CLI argument or a file:// URL body
    inline std::filesystem::path utf8_to_path(const std::string& utf8) {
#ifdef _WIN32
        return std::filesystem::path(detail::convert_utf<std::wstring>(utf8, [](const char* s, int n, wchar_t* out, int cap) {
            return MultiByteToWideChar(CP_UTF8, 0, s, n, out, cap);
        }));
#else
        return std::filesystem::path(utf8);
#endif
    }

    // Binary streams; the write variant truncates
    inline bool open_file_for_read(const std::filesystem::path& p, std::ifstream& stream) {
        stream.open(p, std::ios::in | std::ios::binary);
        return stream.is_open();
    }

    inline bool open_file_for_write(const std::filesystem::path& p, std::ofstream& stream) {
        stream.open(p, std::ios::out | std::ios::binary | std::ios::trunc);
        return stream.is_open();
    }

} // namespace bim::core
