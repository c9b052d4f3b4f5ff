/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "io/asset.hpp"
#include "io/error.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace bim::io {

    struct FetchProgress {
        uint64_t loaded_bytes = 0;
        uint64_t total_bytes = 0; // 0 when unknown
    };

    using FetchProgressCallback = std::function<void(const FetchProgress&)>;
    using FetchCompleteCallback = std::function<void(Result<std::shared_ptr<ImportedAsset>>)>;

    /**
     * @brief Produces detached node trees from a URL or path.
     *
     * Callbacks are only ever invoked from fetch() itself or from poll(), both
     * on the caller's thread. Sources that decode in the background queue their
     * events until the host pumps poll() from its frame loop.
     */
    class AssetSource {
    public:
        virtual ~AssetSource() = default;

        virtual void fetch(const std::string& url,
                           FetchProgressCallback on_progress,
                           FetchCompleteCallback on_complete) = 0;

        // Delivers queued callbacks. Returns the number delivered.
        virtual size_t poll() { return 0; }

        [[nodiscard]] virtual bool hasPendingWork() const { return false; }
    };

} // namespace bim::io
