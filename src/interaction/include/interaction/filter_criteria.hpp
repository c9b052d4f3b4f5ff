/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/bim_metadata.hpp"
#include "io/error.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace bim::interaction {

    enum class FilterOperator : uint8_t {
        Equals,
        NotEquals,
        Contains,
        StartsWith,
        EndsWith,
        GreaterThan,
        LessThan,
        GreaterOrEqual,
        LessOrEqual,
        Exists,
        NotExists
    };

    [[nodiscard]] std::string_view filter_operator_to_string(FilterOperator op);
    [[nodiscard]] std::optional<FilterOperator> filter_operator_from_string(std::string_view str);

    struct PropertyPredicate {
        std::string property_name;
        std::optional<std::string> property_set; // any set when absent
        FilterOperator op = FilterOperator::Equals;
        core::PropertyScalar comparand;
    };

    struct FilterCriteria {
        std::optional<std::vector<std::string>> type_allow_list;
        std::optional<std::vector<PropertyPredicate>> property_predicates;

        // Absent and empty allow-lists both accept every type
        [[nodiscard]] bool restrictsTypes() const { return type_allow_list && !type_allow_list->empty(); }

        [[nodiscard]] static io::Result<FilterCriteria> from_json(const nlohmann::json& j);
        [[nodiscard]] nlohmann::json to_json() const;
    };

    [[nodiscard]] io::Result<FilterCriteria> parse_filter_criteria(std::string_view json_text);
    [[nodiscard]] io::Result<FilterCriteria> load_filter_criteria(const std::filesystem::path& path);

    /// Single comparison between a property value and a comparand. Null values never match.
    [[nodiscard]] bool compare_property(const core::PropertyValue& property, FilterOperator op,
                                        const core::PropertyScalar& comparand);

    /**
     * Existential: true when any property with the predicate's name (and set,
     * if given) satisfies it. With no such property only NotExists holds.
     */
    [[nodiscard]] bool evaluate_predicate(const PropertyPredicate& predicate, const core::SemanticElement& element);

    [[nodiscard]] bool matches_criteria(const FilterCriteria& criteria, const core::SemanticElement& element);

} // namespace bim::interaction
