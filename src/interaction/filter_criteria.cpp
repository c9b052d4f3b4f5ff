/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "interaction/filter_criteria.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <type_traits>
#include <utility>

namespace bim::interaction {

    namespace {
        constexpr std::array<std::pair<FilterOperator, std::string_view>, 11> OPERATOR_NAMES = {{
            {FilterOperator::Equals, "equals"},
            {FilterOperator::NotEquals, "notEquals"},
            {FilterOperator::Contains, "contains"},
            {FilterOperator::StartsWith, "startsWith"},
            {FilterOperator::EndsWith, "endsWith"},
            {FilterOperator::GreaterThan, "greaterThan"},
            {FilterOperator::LessThan, "lessThan"},
            {FilterOperator::GreaterOrEqual, "greaterOrEqual"},
            {FilterOperator::LessOrEqual, "lessOrEqual"},
            {FilterOperator::Exists, "exists"},
            {FilterOperator::NotExists, "notExists"},
        }};

        std::string to_lower(std::string_view s) {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        bool is_numeric_operator(const FilterOperator op) {
            return op == FilterOperator::GreaterThan || op == FilterOperator::LessThan ||
                   op == FilterOperator::GreaterOrEqual || op == FilterOperator::LessOrEqual;
        }

        bool is_string_operator(const FilterOperator op) {
            return op == FilterOperator::Contains || op == FilterOperator::StartsWith ||
                   op == FilterOperator::EndsWith;
        }

        // Strings compare case-insensitively, other kinds by value. Different kinds are never equal.
        bool scalars_equal(const core::PropertyScalar& a, const core::PropertyScalar& b) {
            if (a.index() != b.index())
                return false;
            if (const auto* sa = std::get_if<std::string>(&a)) {
                return to_lower(*sa) == to_lower(std::get<std::string>(b));
            }
            return a == b;
        }

        core::PropertyScalar scalar_from_json(const nlohmann::json& j) {
            if (j.is_string())
                return j.get<std::string>();
            if (j.is_boolean())
                return j.get<bool>();
            if (j.is_number())
                return j.get<double>();
            return std::monostate{};
        }

        nlohmann::json scalar_to_json(const core::PropertyScalar& value) {
            return std::visit(
                [](const auto& v) -> nlohmann::json {
                    using T = std::decay_t<decltype(v)>;
                    if constexpr (std::is_same_v<T, std::monostate>) {
                        return nullptr;
                    } else {
                        return v;
                    }
                },
                value);
        }
    } // namespace

    std::string_view filter_operator_to_string(const FilterOperator op) {
        for (const auto& [value, name] : OPERATOR_NAMES) {
            if (value == op)
                return name;
        }
        return "equals";
    }

    std::optional<FilterOperator> filter_operator_from_string(const std::string_view str) {
        for (const auto& [value, name] : OPERATOR_NAMES) {
            if (name == str)
                return value;
        }
        return std::nullopt;
    }

    bool compare_property(const core::PropertyValue& property, const FilterOperator op,
                          const core::PropertyScalar& comparand) {
        if (property.isNull())
            return false;

        if (op == FilterOperator::Equals)
            return scalars_equal(property.value, comparand);
        if (op == FilterOperator::NotEquals)
            return !scalars_equal(property.value, comparand);

        if (is_string_operator(op)) {
            const auto* text = property.asString();
            const auto* needle = std::get_if<std::string>(&comparand);
            if (!text || !needle)
                return false;

            const std::string haystack = to_lower(*text);
            const std::string lowered = to_lower(*needle);
            switch (op) {
            case FilterOperator::Contains: return haystack.find(lowered) != std::string::npos;
            case FilterOperator::StartsWith: return haystack.starts_with(lowered);
            case FilterOperator::EndsWith: return haystack.ends_with(lowered);
            default: return false;
            }
        }

        if (is_numeric_operator(op)) {
            const auto value = property.asNumber();
            const auto* limit = std::get_if<double>(&comparand);
            if (!value || !limit)
                return false;

            switch (op) {
            case FilterOperator::GreaterThan: return *value > *limit;
            case FilterOperator::LessThan: return *value < *limit;
            case FilterOperator::GreaterOrEqual: return *value >= *limit;
            case FilterOperator::LessOrEqual: return *value <= *limit;
            default: return false;
            }
        }

        return false;
    }

    bool evaluate_predicate(const PropertyPredicate& predicate, const core::SemanticElement& element) {
        const bool any_set = !predicate.property_set || predicate.property_set->empty();

        bool found = false;
        for (const auto& property : element.properties) {
            if (property.name != predicate.property_name)
                continue;
            if (!any_set && property.group_name != *predicate.property_set)
                continue;

            found = true;
            if (predicate.op == FilterOperator::Exists)
                return true;
            if (predicate.op == FilterOperator::NotExists)
                return false;
            if (compare_property(property, predicate.op, predicate.comparand))
                return true;
        }

        return !found && predicate.op == FilterOperator::NotExists;
    }

    bool matches_criteria(const FilterCriteria& criteria, const core::SemanticElement& element) {
        if (criteria.restrictsTypes()) {
            const auto& types = *criteria.type_allow_list;
            if (std::find(types.begin(), types.end(), element.type_tag) == types.end())
                return false;
        }

        if (criteria.property_predicates) {
            for (const auto& predicate : *criteria.property_predicates) {
                if (!evaluate_predicate(predicate, element))
                    return false;
            }
        }
        return true;
    }

    io::Result<FilterCriteria> FilterCriteria::from_json(const nlohmann::json& j) {
        if (!j.is_object()) {
            return io::make_error(io::ErrorCode::MALFORMED_JSON, "Filter criteria must be a JSON object");
        }

        FilterCriteria criteria;
        if (j.contains("types")) {
            if (!j["types"].is_array()) {
                return io::make_error(io::ErrorCode::MALFORMED_JSON, "'types' must be an array of strings");
            }
            std::vector<std::string> types;
            for (const auto& t : j["types"]) {
                if (!t.is_string()) {
                    return io::make_error(io::ErrorCode::MALFORMED_JSON, "'types' must be an array of strings");
                }
                types.push_back(t.get<std::string>());
            }
            criteria.type_allow_list = std::move(types);
        }

        if (j.contains("propertyFilters")) {
            if (!j["propertyFilters"].is_array()) {
                return io::make_error(io::ErrorCode::MALFORMED_JSON, "'propertyFilters' must be an array");
            }
            std::vector<PropertyPredicate> predicates;
            for (const auto& f : j["propertyFilters"]) {
                if (!f.is_object() || !f.contains("propertyName") || !f["propertyName"].is_string()) {
                    return io::make_error(io::ErrorCode::MALFORMED_JSON, "Property filter needs a 'propertyName'");
                }

                PropertyPredicate predicate;
                predicate.property_name = f["propertyName"].get<std::string>();
                if (f.contains("propertySet") && f["propertySet"].is_string()) {
                    predicate.property_set = f["propertySet"].get<std::string>();
                }

                const std::string op_name = f.contains("operator") && f["operator"].is_string()
                                                ? f["operator"].get<std::string>()
                                                : std::string("equals");
                const auto op = filter_operator_from_string(op_name);
                if (!op) {
                    return io::make_error(io::ErrorCode::INVALID_ARGUMENT,
                                          std::format("Unknown filter operator '{}'", op_name));
                }
                predicate.op = *op;

                if (f.contains("value")) {
                    predicate.comparand = scalar_from_json(f["value"]);
                }
                predicates.push_back(std::move(predicate));
            }
            criteria.property_predicates = std::move(predicates);
        }

        return criteria;
    }

    nlohmann::json FilterCriteria::to_json() const {
        nlohmann::json json = nlohmann::json::object();
        if (type_allow_list) {
            json["types"] = *type_allow_list;
        }
        if (property_predicates) {
            json["propertyFilters"] = nlohmann::json::array();
            for (const auto& predicate : *property_predicates) {
                nlohmann::json f;
                f["propertyName"] = predicate.property_name;
                if (predicate.property_set) {
                    f["propertySet"] = *predicate.property_set;
                }
                f["operator"] = filter_operator_to_string(predicate.op);
                f["value"] = scalar_to_json(predicate.comparand);
                json["propertyFilters"].push_back(std::move(f));
            }
        }
        return json;
    }

    io::Result<FilterCriteria> parse_filter_criteria(const std::string_view json_text) {
        try {
            return FilterCriteria::from_json(nlohmann::json::parse(json_text));
        } catch (const nlohmann::json::exception& e) {
            return io::make_error(io::ErrorCode::MALFORMED_JSON, std::format("JSON parse error: {}", e.what()));
        }
    }

    io::Result<FilterCriteria> load_filter_criteria(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path)) {
            return io::make_error(io::ErrorCode::PATH_NOT_FOUND, "Filter file not found", path);
        }

        std::ifstream file;
        if (!core::open_file_for_read(path, file)) {
            return io::make_error(io::ErrorCode::READ_FAILURE, "Cannot open filter file", path);
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        auto result = parse_filter_criteria(buffer.str());
        if (!result) {
            return io::make_error(result.error().code, result.error().message, path);
        }
        LOG_DEBUG("Loaded filter criteria from {}", core::path_to_utf8(path));
        return result;
    }

} // namespace bim::interaction
