/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/path_utils.hpp"
#include <expected>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>

namespace bim::io {

    /// Failure codes shared by loading, filtering, sectioning and export.
    /// The hundreds digit is the category.
    enum class ErrorCode {
        SUCCESS = 0,

        // Filesystem
        PATH_NOT_FOUND = 100,
        NOT_A_FILE = 101,
        PERMISSION_DENIED = 102,
        PATH_NOT_WRITABLE = 103,

        // Input documents and arguments
        MALFORMED_JSON = 200,
        CORRUPTED_DATA = 201,
        UNSUPPORTED_FORMAT = 202,
        EMPTY_MODEL = 203,
        INVALID_ARGUMENT = 204,

        // Model fetch and decode
        FETCH_FAILED = 300,
        READ_FAILURE = 301,
        DECODING_FAILED = 302,

        // Render and export
        RENDER_FAILED = 400,
        ENCODING_FAILED = 401,
        WRITE_FAILURE = 402,

        // Engine state
        INVALID_STATE = 500,
        CANCELLED = 501,
        INTERNAL_ERROR = 502,
    };

    enum class ErrorCategory {
        None,
        Filesystem,
        Input,
        Load,
        Export,
        State,
    };

    constexpr ErrorCategory error_category(const ErrorCode code) {
        switch (static_cast<int>(code) / 100) {
        case 1: return ErrorCategory::Filesystem;
        case 2: return ErrorCategory::Input;
        case 3: return ErrorCategory::Load;
        case 4: return ErrorCategory::Export;
        case 5: return ErrorCategory::State;
        default: return ErrorCategory::None;
        }
    }

    constexpr std::string_view error_code_to_string(const ErrorCode code) {
        switch (code) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::PATH_NOT_FOUND: return "Path not found";
        case ErrorCode::NOT_A_FILE: return "Not a file";
        case ErrorCode::PERMISSION_DENIED: return "Permission denied";
        case ErrorCode::PATH_NOT_WRITABLE: return "Path not writable";
        case ErrorCode::MALFORMED_JSON: return "Malformed JSON";
        case ErrorCode::CORRUPTED_DATA: return "Corrupted data";
        case ErrorCode::UNSUPPORTED_FORMAT: return "Unsupported format";
        case ErrorCode::EMPTY_MODEL: return "Empty model";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::FETCH_FAILED: return "Fetch failed";
        case ErrorCode::READ_FAILURE: return "Read failed";
        case ErrorCode::DECODING_FAILED: return "Decoding failed";
        case ErrorCode::RENDER_FAILED: return "Render failed";
        case ErrorCode::ENCODING_FAILED: return "Encoding failed";
        case ErrorCode::WRITE_FAILURE: return "Write failed";
        case ErrorCode::INVALID_STATE: return "Invalid state";
        case ErrorCode::CANCELLED: return "Cancelled";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
        }
        return "Unknown error";
    }

    struct Error {
        ErrorCode code;
        std::string message;
        std::filesystem::path path; // empty when the failure is not tied to a file

        Error(ErrorCode c, std::string msg, std::filesystem::path p = {})
            : code(c),
              message(std::move(msg)),
              path(std::move(p)) {}

        [[nodiscard]] ErrorCategory category() const { return error_category(code); }

        [[nodiscard]] std::string format() const {
            if (path.empty())
                return std::format("[{}] {}", error_code_to_string(code), message);
            return std::format("[{}] {}: {}", error_code_to_string(code), message, core::path_to_utf8(path));
        }
    };

    template <typename T>
    using Result = std::expected<T, Error>;

    inline std::unexpected<Error> make_error(ErrorCode code, std::string message,
                                             const std::filesystem::path& path = {}) {
        return std::unexpected(Error{code, std::move(message), path});
    }

    /// Checks that an export target can be written, creating missing parent directories
    [[nodiscard]] inline Result<void> verify_writable(const std::filesystem::path& path) {
        namespace fs = std::filesystem;
        std::error_code ec;

        if (fs::is_directory(path, ec))
            return make_error(ErrorCode::NOT_A_FILE, "Export target is a directory", path);

        if (fs::exists(path, ec)) {
            const auto perms = fs::status(path, ec).permissions();
            if (ec)
                return make_error(ErrorCode::PERMISSION_DENIED,
                                  std::format("Cannot check permissions: {}", ec.message()), path);
            if ((perms & fs::perms::owner_write) == fs::perms::none)
                return make_error(ErrorCode::PATH_NOT_WRITABLE, "Path not writable", path);
            return {};
        }

        const auto parent = path.parent_path();
        if (parent.empty() || fs::exists(parent, ec))
            return {};

        if (!fs::create_directories(parent, ec))
            return make_error(ErrorCode::PERMISSION_DENIED,
                              std::format("Cannot create directory: {}", ec.message()), parent);
        return {};
    }

} // namespace bim::io
