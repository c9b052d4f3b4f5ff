/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/bim_metadata.hpp"
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bim::interaction {

    /**
     * @brief Read-only lookup from element identifiers to semantic records.
     *
     * Built once per loaded model. Owns the metadata it indexes, so element
     * pointers handed out stay valid for the index lifetime. When identifiers
     * repeat, the first element wins.
     */
    class ModelMetadataIndex {
    public:
        ModelMetadataIndex() = default;
        explicit ModelMetadataIndex(std::shared_ptr<const core::ModelMetadata> metadata);

        [[nodiscard]] const core::SemanticElement* findByExternalGuid(std::string_view guid) const;
        [[nodiscard]] const core::SemanticElement* findById(std::string_view id) const;

        // External guid first, then internal id
        [[nodiscard]] const core::SemanticElement* resolve(std::string_view declared_id) const;

        [[nodiscard]] size_t elementCount() const;
        [[nodiscard]] bool empty() const { return elementCount() == 0; }

        // Sorted distinct type tags with their element counts
        [[nodiscard]] const std::map<std::string, size_t>& typeCounts() const { return type_counts_; }
        [[nodiscard]] std::vector<std::string> types() const;
        [[nodiscard]] size_t countByType(std::string_view type_tag) const;

        [[nodiscard]] const core::ModelMetadata* metadata() const { return metadata_.get(); }

    private:
        std::shared_ptr<const core::ModelMetadata> metadata_;
        std::unordered_map<std::string, const core::SemanticElement*> by_guid_;
        std::unordered_map<std::string, const core::SemanticElement*> by_id_;
        std::map<std::string, size_t> type_counts_;
    };

} // namespace bim::interaction
