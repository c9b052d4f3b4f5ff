/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include "core/parameters.hpp"
#include <expected>
#include <memory>
#include <string>
#include <variant>

namespace bim::core::args {

    struct HelpMode {};

    struct SnapshotMode {
        std::unique_ptr<param::SnapshotParameters> params;
    };

    using ParsedArgs = std::variant<HelpMode, SnapshotMode>;

    // Parses the command line, initializes the logger and applies --config
    BIM_CORE_API std::expected<ParsedArgs, std::string> parse_args(int argc, const char* const argv[]);

    // "z:2.5" -> {z, 2.5}
    BIM_CORE_API std::expected<param::SectionSpec, std::string> parse_section_spec(const std::string& spec);

} // namespace bim::core::args
