// SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "interaction/filter_criteria.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace bim::interaction {

    using core::PropertyValue;

    // ---------------------------------------------------------------------------
    // Single comparisons
    // ---------------------------------------------------------------------------

    TEST(CompareProperty, StringOperatorsIgnoreCase) {
        const auto prop = PropertyValue::text("Name", "Exterior Wall");

        EXPECT_TRUE(compare_property(prop, FilterOperator::Equals, std::string("exterior wall")));
        EXPECT_FALSE(compare_property(prop, FilterOperator::NotEquals, std::string("EXTERIOR WALL")));
        EXPECT_TRUE(compare_property(prop, FilterOperator::Contains, std::string("RIOR")));
        EXPECT_TRUE(compare_property(prop, FilterOperator::StartsWith, std::string("ext")));
        EXPECT_TRUE(compare_property(prop, FilterOperator::EndsWith, std::string("WALL")));
        EXPECT_FALSE(compare_property(prop, FilterOperator::StartsWith, std::string("wall")));
    }

    TEST(CompareProperty, NumericOperators) {
        const auto prop = PropertyValue::number("Height", 3.0);

        EXPECT_TRUE(compare_property(prop, FilterOperator::GreaterThan, 2.5));
        EXPECT_FALSE(compare_property(prop, FilterOperator::GreaterThan, 3.0));
        EXPECT_TRUE(compare_property(prop, FilterOperator::GreaterOrEqual, 3.0));
        EXPECT_TRUE(compare_property(prop, FilterOperator::LessThan, 3.5));
        EXPECT_TRUE(compare_property(prop, FilterOperator::LessOrEqual, 3.0));
        EXPECT_TRUE(compare_property(prop, FilterOperator::Equals, 3.0));
    }

    TEST(CompareProperty, MismatchedKindsNeverThrow) {
        const auto text = PropertyValue::text("Storey", "3");
        const auto number = PropertyValue::integer("Storey", 3);

        EXPECT_FALSE(compare_property(text, FilterOperator::GreaterThan, 1.0));
        EXPECT_FALSE(compare_property(number, FilterOperator::Contains, std::string("3")));
        EXPECT_FALSE(compare_property(text, FilterOperator::Equals, 3.0));
        EXPECT_TRUE(compare_property(text, FilterOperator::NotEquals, 3.0));
        EXPECT_FALSE(compare_property(number, FilterOperator::GreaterThan, core::PropertyScalar{}));
    }

    TEST(CompareProperty, NullSatisfiesNothing) {
        const auto prop = PropertyValue::null("Comment");
        EXPECT_FALSE(compare_property(prop, FilterOperator::Equals, core::PropertyScalar{}));
        EXPECT_FALSE(compare_property(prop, FilterOperator::NotEquals, std::string("x")));
    }

    TEST(CompareProperty, BooleanEquality) {
        const auto prop = PropertyValue::boolean("IsExternal", true);
        EXPECT_TRUE(compare_property(prop, FilterOperator::Equals, true));
        EXPECT_TRUE(compare_property(prop, FilterOperator::NotEquals, false));
    }

    // ---------------------------------------------------------------------------
    // Predicates over an element
    // ---------------------------------------------------------------------------

    TEST(EvaluatePredicate, AnyCandidateSatisfies) {
        const auto element = test::make_element("beam-1", "IfcBeam",
                                                {PropertyValue::number("Load", 5.0, "Pset_A"),
                                                 PropertyValue::number("Load", 15.0, "Pset_B")});

        const PropertyPredicate greater{"Load", std::nullopt, FilterOperator::GreaterThan, 10.0};
        EXPECT_TRUE(evaluate_predicate(greater, element));

        const PropertyPredicate less{"Load", std::nullopt, FilterOperator::LessThan, 10.0};
        EXPECT_TRUE(evaluate_predicate(less, element));

        const PropertyPredicate scoped{"Load", std::string("Pset_A"), FilterOperator::GreaterThan, 10.0};
        EXPECT_FALSE(evaluate_predicate(scoped, element));
    }

    TEST(EvaluatePredicate, ExistenceChecks) {
        const auto element = test::make_element("wall-1", "IfcWall",
                                                {PropertyValue::text("FireRating", "F90", "Pset_WallCommon")});

        EXPECT_TRUE(evaluate_predicate({"FireRating", std::nullopt, FilterOperator::Exists, {}}, element));
        EXPECT_FALSE(evaluate_predicate({"FireRating", std::nullopt, FilterOperator::NotExists, {}}, element));
        EXPECT_FALSE(evaluate_predicate({"Acoustic", std::nullopt, FilterOperator::Exists, {}}, element));
        EXPECT_TRUE(evaluate_predicate({"Acoustic", std::nullopt, FilterOperator::NotExists, {}}, element));
        EXPECT_FALSE(evaluate_predicate({"Acoustic", std::nullopt, FilterOperator::NotEquals, std::string("x")}, element));

        // Wrong property set behaves like a missing property
        EXPECT_TRUE(evaluate_predicate({"FireRating", std::string("Other"), FilterOperator::NotExists, {}}, element));
        // Empty set name means any set
        EXPECT_TRUE(evaluate_predicate({"FireRating", std::string(""), FilterOperator::Exists, {}}, element));
    }

    TEST(MatchesCriteria, TypeAllowListAndPredicates) {
        const auto wall = test::make_element("wall-001", "IfcWall",
                                             {PropertyValue::text("FireRating", "F90", "Pset_WallCommon")});

        FilterCriteria criteria;
        EXPECT_TRUE(matches_criteria(criteria, wall));

        criteria.type_allow_list = std::vector<std::string>{};
        EXPECT_FALSE(criteria.restrictsTypes());
        EXPECT_TRUE(matches_criteria(criteria, wall));

        criteria.type_allow_list = std::vector<std::string>{"IfcDoor"};
        EXPECT_FALSE(matches_criteria(criteria, wall));

        criteria.type_allow_list = std::vector<std::string>{"IfcDoor", "IfcWall"};
        criteria.property_predicates = std::vector<PropertyPredicate>{
            {"FireRating", std::nullopt, FilterOperator::Equals, std::string("F90")}};
        EXPECT_TRUE(matches_criteria(criteria, wall));

        criteria.property_predicates->push_back({"FireRating", std::nullopt, FilterOperator::StartsWith, std::string("F3")});
        EXPECT_FALSE(matches_criteria(criteria, wall));
    }

    // ---------------------------------------------------------------------------
    // JSON
    // ---------------------------------------------------------------------------

    TEST(FilterCriteriaJson, ParsesDocument) {
        const auto result = parse_filter_criteria(R"({
            "types": ["IfcWall"],
            "propertyFilters": [
                {"propertyName": "FireRating", "propertySet": "Pset_WallCommon", "operator": "equals", "value": "F90"},
                {"propertyName": "Width", "operator": "greaterOrEqual", "value": 0.2},
                {"propertyName": "IsExternal", "value": true},
                {"propertyName": "Comment", "operator": "notExists"}
            ]
        })");
        ASSERT_TRUE(result.has_value()) << result.error().format();

        ASSERT_TRUE(result->type_allow_list.has_value());
        EXPECT_EQ(*result->type_allow_list, std::vector<std::string>{"IfcWall"});

        const auto& predicates = *result->property_predicates;
        ASSERT_EQ(predicates.size(), 4u);
        EXPECT_EQ(predicates[0].property_set, "Pset_WallCommon");
        EXPECT_EQ(std::get<std::string>(predicates[0].comparand), "F90");
        EXPECT_EQ(predicates[1].op, FilterOperator::GreaterOrEqual);
        EXPECT_DOUBLE_EQ(std::get<double>(predicates[1].comparand), 0.2);
        EXPECT_EQ(predicates[2].op, FilterOperator::Equals);
        EXPECT_TRUE(std::get<bool>(predicates[2].comparand));
        EXPECT_EQ(predicates[3].op, FilterOperator::NotExists);
        EXPECT_TRUE(std::holds_alternative<std::monostate>(predicates[3].comparand));
    }

    TEST(FilterCriteriaJson, Errors) {
        EXPECT_EQ(parse_filter_criteria("[").error().code, io::ErrorCode::MALFORMED_JSON);
        EXPECT_EQ(parse_filter_criteria(R"({"types": "IfcWall"})").error().code, io::ErrorCode::MALFORMED_JSON);
        EXPECT_EQ(parse_filter_criteria(R"({"propertyFilters": [{"operator": "equals"}]})").error().code,
                  io::ErrorCode::MALFORMED_JSON);
        EXPECT_EQ(parse_filter_criteria(R"({"propertyFilters": [{"propertyName": "A", "operator": "like"}]})").error().code,
                  io::ErrorCode::INVALID_ARGUMENT);
    }

    TEST(FilterCriteriaJson, SerializesBack) {
        FilterCriteria criteria;
        criteria.type_allow_list = std::vector<std::string>{"IfcSlab"};
        criteria.property_predicates = std::vector<PropertyPredicate>{
            {"Thickness", std::nullopt, FilterOperator::LessThan, 0.3}};

        const auto json = criteria.to_json();
        EXPECT_EQ(json["types"][0], "IfcSlab");
        EXPECT_EQ(json["propertyFilters"][0]["operator"], "lessThan");
        EXPECT_FALSE(json["propertyFilters"][0].contains("propertySet"));

        const auto parsed = FilterCriteria::from_json(json);
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ((*parsed->property_predicates)[0].op, FilterOperator::LessThan);
    }

    TEST(FilterOperatorNames, KnownAndUnknown) {
        EXPECT_EQ(filter_operator_from_string("startsWith"), FilterOperator::StartsWith);
        EXPECT_EQ(filter_operator_to_string(FilterOperator::NotEquals), "notEquals");
        EXPECT_FALSE(filter_operator_from_string("StartsWith").has_value());
    }

} // namespace bim::interaction
