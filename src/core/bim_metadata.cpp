/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/bim_metadata.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <set>
#include <type_traits>

namespace bim::core {

    std::string_view value_kind_to_string(const ValueKind kind) {
        switch (kind) {
        case ValueKind::String: return "string";
        case ValueKind::Number: return "number";
        case ValueKind::Integer: return "integer";
        case ValueKind::Boolean: return "boolean";
        case ValueKind::Null: return "null";
        }
        return "null";
    }

    std::optional<ValueKind> value_kind_from_string(const std::string_view str) {
        if (str == "string")
            return ValueKind::String;
        if (str == "number")
            return ValueKind::Number;
        if (str == "integer")
            return ValueKind::Integer;
        if (str == "boolean")
            return ValueKind::Boolean;
        if (str == "null")
            return ValueKind::Null;
        return std::nullopt;
    }

    std::optional<double> PropertyValue::asNumber() const {
        if (const auto* d = std::get_if<double>(&value))
            return *d;
        return std::nullopt;
    }

    std::optional<bool> PropertyValue::asBool() const {
        if (const auto* b = std::get_if<bool>(&value))
            return *b;
        return std::nullopt;
    }

    std::string PropertyValue::toString() const {
        return std::visit(
            [this](const auto& v) -> std::string {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return "null";
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return v;
                } else if constexpr (std::is_same_v<T, bool>) {
                    return v ? "true" : "false";
                } else {
                    if (kind == ValueKind::Integer && std::isfinite(v))
                        return std::format("{}", static_cast<int64_t>(v));
                    return std::format("{}", v);
                }
            },
            value);
    }

    PropertyValue PropertyValue::text(std::string name, std::string value, std::string group) {
        return PropertyValue{std::move(name), std::move(value), ValueKind::String, std::move(group)};
    }

    PropertyValue PropertyValue::number(std::string name, const double value, std::string group) {
        return PropertyValue{std::move(name), value, ValueKind::Number, std::move(group)};
    }

    PropertyValue PropertyValue::integer(std::string name, const int64_t value, std::string group) {
        return PropertyValue{std::move(name), static_cast<double>(value), ValueKind::Integer, std::move(group)};
    }

    PropertyValue PropertyValue::boolean(std::string name, const bool value, std::string group) {
        return PropertyValue{std::move(name), value, ValueKind::Boolean, std::move(group)};
    }

    PropertyValue PropertyValue::null(std::string name, std::string group) {
        return PropertyValue{std::move(name), std::monostate{}, ValueKind::Null, std::move(group)};
    }

    void ModelMetadata::deriveSummaries() {
        std::set<std::string> type_set;
        std::set<std::string> pset_set;
        for (const auto& element : elements) {
            if (!element.type_tag.empty())
                type_set.insert(element.type_tag);
            for (const auto& prop : element.properties) {
                if (!prop.group_name.empty())
                    pset_set.insert(prop.group_name);
            }
        }
        types.assign(type_set.begin(), type_set.end());
        property_sets.assign(pset_set.begin(), pset_set.end());
    }

} // namespace bim::core
