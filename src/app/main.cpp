/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/application.hpp"
#include "core/argument_parser.hpp"
#include "core/logger.hpp"
#include <print>
#include <type_traits>
#include <variant>

int main(int argc, char* argv[]) {
    auto parsed = bim::core::args::parse_args(argc, argv);
    if (!parsed) {
        std::println(stderr, "{}", parsed.error());
        return 1;
    }

    return std::visit([](auto& mode) -> int {
        using Mode = std::decay_t<decltype(mode)>;
        if constexpr (std::is_same_v<Mode, bim::core::args::HelpMode>) {
            return 0;
        } else {
            bim::app::Application app;
            return app.run(std::move(mode.params));
        }
    },
                      *parsed);
}
