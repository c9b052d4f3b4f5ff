/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include <memory>

namespace bim::app {

    class Application {
    public:
        // Loads the model, applies filter and sections, writes one snapshot. Returns the exit code.
        int run(std::unique_ptr<bim::core::param::SnapshotParameters> params);
    };

} // namespace bim::app
