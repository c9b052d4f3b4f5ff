/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "interaction/metadata_index.hpp"
#include "core/logger.hpp"

namespace bim::interaction {

    ModelMetadataIndex::ModelMetadataIndex(std::shared_ptr<const core::ModelMetadata> metadata)
        : metadata_(std::move(metadata)) {
        if (!metadata_)
            return;

        by_id_.reserve(metadata_->elements.size());
        by_guid_.reserve(metadata_->elements.size());

        size_t duplicates = 0;
        for (const auto& element : metadata_->elements) {
            if (!by_id_.emplace(element.id, &element).second) {
                ++duplicates;
                continue;
            }
            if (element.external_guid && !element.external_guid->empty()) {
                by_guid_.emplace(*element.external_guid, &element);
            }
            ++type_counts_[element.type_tag];
        }

        if (duplicates > 0) {
            LOG_WARN("Metadata '{}' has {} duplicate element ids (first occurrence kept)",
                     metadata_->model_id, duplicates);
        }
        LOG_DEBUG("Indexed {} elements ({} with external guid, {} types)",
                  by_id_.size(), by_guid_.size(), type_counts_.size());
    }

    const core::SemanticElement* ModelMetadataIndex::findByExternalGuid(const std::string_view guid) const {
        const auto it = by_guid_.find(std::string(guid));
        return it != by_guid_.end() ? it->second : nullptr;
    }

    const core::SemanticElement* ModelMetadataIndex::findById(const std::string_view id) const {
        const auto it = by_id_.find(std::string(id));
        return it != by_id_.end() ? it->second : nullptr;
    }

    const core::SemanticElement* ModelMetadataIndex::resolve(const std::string_view declared_id) const {
        if (declared_id.empty())
            return nullptr;
        if (const auto* element = findByExternalGuid(declared_id))
            return element;
        return findById(declared_id);
    }

    size_t ModelMetadataIndex::elementCount() const {
        return by_id_.size();
    }

    std::vector<std::string> ModelMetadataIndex::types() const {
        std::vector<std::string> result;
        result.reserve(type_counts_.size());
        for (const auto& [type, count] : type_counts_) {
            result.push_back(type);
        }
        return result;
    }

    size_t ModelMetadataIndex::countByType(const std::string_view type_tag) const {
        const auto it = type_counts_.find(std::string(type_tag));
        return it != type_counts_.end() ? it->second : 0;
    }

} // namespace bim::interaction
