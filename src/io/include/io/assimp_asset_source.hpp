/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "io/asset_source.hpp"
#include <atomic>
#include <deque>
#include <filesystem>
#include <list>
#include <mutex>
#include <thread>
#include <vector>

namespace bim::io {

    /// Resolves file:// URLs and plain paths to a local path. Other schemes are rejected.
    [[nodiscard]] Result<std::filesystem::path> resolve_local_url(const std::string& url);

    /// Decodes a mesh file with Assimp into a detached node tree (blocking)
    [[nodiscard]] Result<std::shared_ptr<ImportedAsset>> import_with_assimp(
        const std::filesystem::path& path,
        const std::vector<uint8_t>* preloaded_bytes = nullptr);

    [[nodiscard]] bool is_supported_asset_extension(const std::filesystem::path& path);

    /**
     * @brief Assimp-backed asset source.
     *
     * Each fetch() runs on its own worker thread: the file is read in chunks
     * (one progress event per chunk), then decoded. Events are queued and
     * delivered on the host thread by poll().
     */
    class AssimpAssetSource final : public AssetSource {
    public:
        static constexpr size_t READ_CHUNK_BYTES = 256 * 1024;

        AssimpAssetSource() = default;
        ~AssimpAssetSource() override;

        AssimpAssetSource(const AssimpAssetSource&) = delete;
        AssimpAssetSource& operator=(const AssimpAssetSource&) = delete;

        void fetch(const std::string& url,
                   FetchProgressCallback on_progress,
                   FetchCompleteCallback on_complete) override;

        size_t poll() override;
        [[nodiscard]] bool hasPendingWork() const override;

        void shutdown();

    private:
        struct Job {
            std::jthread worker;
            std::atomic<bool> finished{false};
        };

        void enqueue(std::function<void()> event);

        mutable std::mutex mutex_;
        std::deque<std::function<void()>> pending_events_;
        std::list<Job> jobs_;
    };

} // namespace bim::io
