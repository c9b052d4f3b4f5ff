/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/bim_metadata.hpp"
#include "io/error.hpp"
#include <filesystem>
#include <string_view>

namespace bim::io {

    /**
     * @brief Reads a model metadata document.
     *
     * Layout:
     *   { "modelId", "name",
     *     "elements": [ { "id", "ifcGuid", "type", "name",
     *                     "properties": [ { "name", "value", "type", "propertySet" } ] } ],
     *     "types", "propertySets" }
     *
     * "types" and "propertySets" are derived from the elements when absent.
     */
    [[nodiscard]] Result<core::ModelMetadata> load_model_metadata(const std::filesystem::path& path);

    [[nodiscard]] Result<core::ModelMetadata> parse_model_metadata(std::string_view json_text);

} // namespace bim::io
