/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "interaction/filter_criteria.hpp"
#include "interaction/model_binder.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bim::core {
    class Scene;
}

namespace bim::interaction {

    struct FilterResult {
        size_t match_count = 0;
        size_t total_count = 0;             // bound leaves visited
        std::vector<std::string> matching_ids; // element ids, scene order
        double execution_time_ms = 0.0;
    };

    /**
     * @brief Shows the leaves whose element matches a filter and hides the rest.
     *
     * Each call walks the whole model; nothing is cached between calls. Leaves
     * without semantic data can never match a type filter and are hidden while
     * one is active, otherwise their visibility is left alone.
     */
    class FilterEngine {
    public:
        FilterEngine() = default;
        FilterEngine(core::Scene* scene, std::shared_ptr<const BoundModel> model);

        void setScene(core::Scene* scene) { scene_ = scene; }
        void setModel(std::shared_ptr<const BoundModel> model) { model_ = std::move(model); }

        FilterResult applyFilter(const FilterCriteria& criteria);
        FilterResult resetFilter();

        [[nodiscard]] const std::optional<FilterCriteria>& getActiveFilter() const { return active_filter_; }
        [[nodiscard]] bool hasActiveFilter() const { return active_filter_.has_value(); }

    private:
        core::Scene* scene_ = nullptr;
        std::shared_ptr<const BoundModel> model_;
        std::optional<FilterCriteria> active_filter_;
    };

} // namespace bim::interaction
