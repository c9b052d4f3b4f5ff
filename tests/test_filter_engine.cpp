// SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "interaction/filter_engine.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>

namespace bim::interaction {

    using core::PropertyValue;

    class FilterEngineTest : public ::testing::Test {
    protected:
        void SetUp() override {
            auto metadata = std::make_shared<core::ModelMetadata>();
            metadata->elements.push_back(test::make_element(
                "wall-001", "IfcWall", {PropertyValue::text("FireRating", "F90", "Pset_WallCommon")}));
            metadata->elements.push_back(test::make_element(
                "wall-002", "IfcWall", {PropertyValue::text("FireRating", "F30", "Pset_WallCommon")}));
            metadata->elements.push_back(test::make_element(
                "beam-001", "IfcBeam", {PropertyValue::number("Load", 5.0, "Pset_A"),
                                        PropertyValue::number("Load", 15.0, "Pset_B")}));
            metadata->elements.push_back(test::make_element("door-001", "IfcDoor"));

            root_ = scene_.addGroup("model");
            wall1_ = addLeaf("wall-001");
            wall2_ = addLeaf("wall-002");
            beam_ = addLeaf("beam-001");
            door_ = addLeaf("door-001");
            generic_ = addLeaf("unmatched-geometry");

            model_ = ModelBinder::bind(scene_, root_, std::make_shared<const ModelMetadataIndex>(std::move(metadata)));
            engine_ = FilterEngine(&scene_, model_);
        }

        core::NodeId addLeaf(const std::string& name) {
            return scene_.addMesh(name, test::make_box(glm::vec3(0.0f), glm::vec3(1.0f)), nullptr, root_);
        }

        bool visible(const core::NodeId id) const { return scene_.getNodeById(id)->visible; }

        core::Scene scene_;
        core::NodeId root_ = core::NULL_NODE;
        core::NodeId wall1_ = core::NULL_NODE;
        core::NodeId wall2_ = core::NULL_NODE;
        core::NodeId beam_ = core::NULL_NODE;
        core::NodeId door_ = core::NULL_NODE;
        core::NodeId generic_ = core::NULL_NODE;
        std::shared_ptr<BoundModel> model_;
        FilterEngine engine_;
    };

    TEST_F(FilterEngineTest, FireRatingScenario) {
        FilterCriteria criteria;
        criteria.type_allow_list = std::vector<std::string>{"IfcWall"};
        criteria.property_predicates = std::vector<PropertyPredicate>{
            {"FireRating", std::nullopt, FilterOperator::Equals, std::string("F90")}};

        const auto f90 = engine_.applyFilter(criteria);
        EXPECT_TRUE(visible(wall1_));
        EXPECT_FALSE(visible(wall2_));
        EXPECT_EQ(f90.match_count, 1u);
        EXPECT_EQ(f90.matching_ids, std::vector<std::string>{"wall-001"});

        (*criteria.property_predicates)[0].comparand = std::string("F30");
        engine_.applyFilter(criteria);
        EXPECT_FALSE(visible(wall1_));
        EXPECT_TRUE(visible(wall2_));
    }

    TEST_F(FilterEngineTest, CountsAreConsistent) {
        FilterCriteria criteria;
        criteria.type_allow_list = std::vector<std::string>{"IfcWall", "IfcDoor"};

        const auto result = engine_.applyFilter(criteria);
        EXPECT_EQ(result.total_count, 4u);
        EXPECT_EQ(result.match_count, 3u);
        EXPECT_EQ(result.match_count, result.matching_ids.size());
        EXPECT_EQ(result.matching_ids, (std::vector<std::string>{"wall-001", "wall-002", "door-001"}));
        EXPECT_GE(result.execution_time_ms, 0.0);
        EXPECT_FALSE(visible(beam_));
    }

    TEST_F(FilterEngineTest, ExistentialPredicate) {
        FilterCriteria criteria;
        criteria.property_predicates = std::vector<PropertyPredicate>{
            {"Load", std::nullopt, FilterOperator::GreaterThan, 10.0}};

        const auto result = engine_.applyFilter(criteria);
        EXPECT_EQ(result.matching_ids, std::vector<std::string>{"beam-001"});
        EXPECT_TRUE(visible(beam_));
        EXPECT_FALSE(visible(door_));
    }

    TEST_F(FilterEngineTest, UnboundLeavesOnlyHiddenByTypeFilter) {
        FilterCriteria by_property;
        by_property.property_predicates = std::vector<PropertyPredicate>{
            {"FireRating", std::nullopt, FilterOperator::Exists, {}}};
        engine_.applyFilter(by_property);
        EXPECT_TRUE(visible(generic_));

        FilterCriteria by_type;
        by_type.type_allow_list = std::vector<std::string>{"IfcBeam"};
        engine_.applyFilter(by_type);
        EXPECT_FALSE(visible(generic_));
    }

    TEST_F(FilterEngineTest, ApplyIsIdempotent) {
        FilterCriteria criteria;
        criteria.type_allow_list = std::vector<std::string>{"IfcWall"};

        const auto first = engine_.applyFilter(criteria);
        const auto second = engine_.applyFilter(criteria);
        EXPECT_EQ(first.matching_ids, second.matching_ids);
        EXPECT_EQ(first.total_count, second.total_count);
    }

    TEST_F(FilterEngineTest, ResetRestoresVisibility) {
        FilterCriteria criteria;
        criteria.type_allow_list = std::vector<std::string>{"IfcDoor"};
        engine_.applyFilter(criteria);
        ASSERT_TRUE(engine_.hasActiveFilter());

        const auto reset = engine_.resetFilter();
        EXPECT_FALSE(engine_.hasActiveFilter());
        EXPECT_EQ(reset.match_count, 4u);
        EXPECT_EQ(reset.total_count, 4u);
        for (const auto id : {wall1_, wall2_, beam_, door_, generic_}) {
            EXPECT_TRUE(visible(id));
        }
    }

    TEST_F(FilterEngineTest, ActiveFilterIsRecorded) {
        FilterCriteria criteria;
        criteria.type_allow_list = std::vector<std::string>{"IfcBeam"};
        engine_.applyFilter(criteria);

        ASSERT_TRUE(engine_.getActiveFilter().has_value());
        EXPECT_EQ(*engine_.getActiveFilter()->type_allow_list, std::vector<std::string>{"IfcBeam"});
    }

    TEST(FilterEngine, WithoutModelReturnsZeroedResult) {
        FilterEngine engine;
        FilterCriteria criteria;
        criteria.type_allow_list = std::vector<std::string>{"IfcWall"};

        const auto result = engine.applyFilter(criteria);
        EXPECT_EQ(result.match_count, 0u);
        EXPECT_EQ(result.total_count, 0u);
        EXPECT_FALSE(engine.hasActiveFilter());
        EXPECT_EQ(engine.resetFilter().total_count, 0u);
    }

} // namespace bim::interaction
