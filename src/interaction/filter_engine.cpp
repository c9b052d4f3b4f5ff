/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "interaction/filter_engine.hpp"
#include "core/logger.hpp"
#include "core/scene.hpp"
#include <chrono>

namespace bim::interaction {

    namespace {
        double elapsed_ms(const std::chrono::steady_clock::time_point start) {
            return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        }
    } // namespace

    FilterEngine::FilterEngine(core::Scene* scene, std::shared_ptr<const BoundModel> model)
        : scene_(scene),
          model_(std::move(model)) {}

    FilterResult FilterEngine::applyFilter(const FilterCriteria& criteria) {
        if (!scene_ || !model_) {
            LOG_DEBUG("applyFilter ignored: no scene or model");
            return {};
        }

        const auto start = std::chrono::steady_clock::now();
        FilterResult result;
        const bool restricts_types = criteria.restrictsTypes();

        {
            core::Scene::Transaction txn(*scene_);
            for (const core::NodeId id : scene_->getMeshNodes(model_->root)) {
                const auto* element = model_->elementFor(id);
                if (!element) {
                    if (restricts_types)
                        scene_->setNodeVisible(id, false);
                    continue;
                }

                ++result.total_count;
                const bool match = matches_criteria(criteria, *element);
                scene_->setNodeVisible(id, match);
                if (match) {
                    result.matching_ids.push_back(element->id);
                }
            }
        }

        result.match_count = result.matching_ids.size();
        result.execution_time_ms = elapsed_ms(start);
        active_filter_ = criteria;

        LOG_INFO("Filter matched {} of {} elements in {:.2f}ms",
                 result.match_count, result.total_count, result.execution_time_ms);
        return result;
    }

    FilterResult FilterEngine::resetFilter() {
        if (!scene_ || !model_) {
            return {};
        }

        const auto start = std::chrono::steady_clock::now();
        FilterResult result;

        {
            core::Scene::Transaction txn(*scene_);
            for (const core::NodeId id : scene_->getMeshNodes(model_->root)) {
                scene_->setNodeVisible(id, true);
                if (const auto* element = model_->elementFor(id)) {
                    ++result.total_count;
                    result.matching_ids.push_back(element->id);
                }
            }
        }

        result.match_count = result.total_count;
        result.execution_time_ms = elapsed_ms(start);
        active_filter_.reset();

        LOG_DEBUG("Filter reset, {} elements visible", result.total_count);
        return result;
    }

} // namespace bim::interaction
