/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bim::core {

    enum class ValueKind : uint8_t {
        String,
        Number,
        Integer,
        Boolean,
        Null
    };

    [[nodiscard]] BIM_CORE_API std::string_view value_kind_to_string(ValueKind kind);
    [[nodiscard]] BIM_CORE_API std::optional<ValueKind> value_kind_from_string(std::string_view str);

    using PropertyScalar = std::variant<std::monostate, std::string, double, bool>;

    struct BIM_CORE_API PropertyValue {
        std::string name;
        PropertyScalar value;
        ValueKind kind = ValueKind::Null;
        std::string group_name; // property set, may be empty

        [[nodiscard]] bool isNull() const { return std::holds_alternative<std::monostate>(value); }
        [[nodiscard]] bool isNumeric() const { return std::holds_alternative<double>(value); }
        [[nodiscard]] std::optional<double> asNumber() const;
        [[nodiscard]] const std::string* asString() const { return std::get_if<std::string>(&value); }
        [[nodiscard]] std::optional<bool> asBool() const;

        // Human readable value ("null" for null)
        [[nodiscard]] std::string toString() const;

        [[nodiscard]] static PropertyValue text(std::string name, std::string value, std::string group = {});
        [[nodiscard]] static PropertyValue number(std::string name, double value, std::string group = {});
        [[nodiscard]] static PropertyValue integer(std::string name, int64_t value, std::string group = {});
        [[nodiscard]] static PropertyValue boolean(std::string name, bool value, std::string group = {});
        [[nodiscard]] static PropertyValue null(std::string name, std::string group = {});
    };

    struct SemanticElement {
        std::string id;                           // unique per model
        std::optional<std::string> external_guid; // IFC GlobalId, preferred correlation key
        std::string type_tag;                     // e.g. IfcWall
        std::string display_name;
        std::vector<PropertyValue> properties;
    };

    struct BIM_CORE_API ModelMetadata {
        std::string model_id;
        std::string name;
        std::vector<SemanticElement> elements;
        std::vector<std::string> types;         // sorted, distinct
        std::vector<std::string> property_sets; // sorted, distinct

        // Fills types / property_sets from the elements
        void deriveSummaries();
    };

} // namespace bim::core
