// SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "interaction/clipping_controller.hpp"
#include "rendering/renderer.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>

namespace bim::interaction {

    namespace {
        // Records what the controller publishes
        class RecordingRenderer final : public rendering::Renderer {
        public:
            void setClippingPlanes(std::vector<core::Plane> planes) override {
                ++publish_count;
                Renderer::setClippingPlanes(std::move(planes));
            }

            void render(const core::Scene&, const core::ViewCamera&) override {}
            [[nodiscard]] rendering::Image readPixels() const override { return {}; }

            int publish_count = 0;
        };
    } // namespace

    class ClippingControllerTest : public ::testing::Test {
    protected:
        void SetUp() override {
            controller_.setScene(&scene_);
            controller_.setRenderer(&renderer_);
        }

        bool helperVisible(const std::string& id) const {
            const auto* plane = controller_.getPlane(id);
            return plane && plane->hasHelper() && scene_.getNodeById(plane->helper)->visible;
        }

        core::Scene scene_;
        RecordingRenderer renderer_;
        ClippingController controller_;
    };

    TEST(PlaneAxis, Names) {
        EXPECT_EQ(plane_axis_from_string("-y"), PlaneAxis::NegativeY);
        EXPECT_EQ(plane_axis_from_string("z"), PlaneAxis::PositiveZ);
        EXPECT_FALSE(plane_axis_from_string("w").has_value());
        EXPECT_FALSE(plane_axis_from_string("Z").has_value());
        EXPECT_EQ(plane_axis_to_string(PlaneAxis::NegativeX), "-x");
        EXPECT_EQ(plane_axis_normal(PlaneAxis::NegativeZ), glm::vec3(0.0f, 0.0f, -1.0f));
    }

    TEST_F(ClippingControllerTest, ConstantFollowsPositionAndNormal) {
        const auto added = controller_.addPlane({.id = "cut", .position = {0.0f, 0.0f, 3.0f}, .normal = {0.0f, 0.0f, 2.0f}});
        ASSERT_TRUE(added.has_value());

        auto plane = controller_.getPlane("cut")->plane();
        EXPECT_FLOAT_EQ(plane.normal.z, 1.0f);
        EXPECT_FLOAT_EQ(plane.constant, -3.0f);

        ASSERT_TRUE(controller_.updatePlanePosition("cut", {0.0f, 0.0f, -1.5f}));
        EXPECT_FLOAT_EQ(controller_.getPlane("cut")->plane().constant, 1.5f);
        EXPECT_FLOAT_EQ(renderer_.getClippingPlanes()[0].constant, 1.5f);

        ASSERT_TRUE(controller_.updatePlaneNormal("cut", {0.0f, 0.0f, -1.0f}));
        plane = controller_.getPlane("cut")->plane();
        EXPECT_FLOAT_EQ(plane.normal.z, -1.0f);
        EXPECT_FLOAT_EQ(plane.constant, -1.5f);
        EXPECT_EQ(renderer_.getClippingPlanes()[0], plane);
    }

    TEST_F(ClippingControllerTest, PublishesEnabledPlanesInOrder) {
        EXPECT_FALSE(renderer_.isLocalClippingEnabled());

        controller_.createPresetPlane("a", PlaneAxis::PositiveX, 1.0f);
        controller_.createPresetPlane("b", PlaneAxis::PositiveY, 2.0f);
        controller_.createPresetPlane("c", PlaneAxis::PositiveZ, 3.0f);
        ASSERT_EQ(renderer_.getClippingPlanes().size(), 3u);
        EXPECT_TRUE(renderer_.isLocalClippingEnabled());

        controller_.setPlaneEnabled("b", false);
        const auto enabled = controller_.getEnabledPlanes();
        ASSERT_EQ(enabled.size(), 2u);
        EXPECT_EQ(renderer_.getClippingPlanes(), enabled);
        EXPECT_FLOAT_EQ(enabled[0].constant, -1.0f);
        EXPECT_FLOAT_EQ(enabled[1].constant, -3.0f);

        controller_.setPlaneEnabled("a", false);
        controller_.setPlaneEnabled("c", false);
        EXPECT_TRUE(renderer_.getClippingPlanes().empty());
        EXPECT_FALSE(renderer_.isLocalClippingEnabled());
        EXPECT_EQ(controller_.planeCount(), 3u);
    }

    TEST_F(ClippingControllerTest, RejectsZeroNormal) {
        const int before = renderer_.publish_count;
        EXPECT_FALSE(controller_.addPlane({.id = "bad", .normal = glm::vec3(0.0f)}).has_value());
        EXPECT_EQ(controller_.planeCount(), 0u);
        EXPECT_EQ(renderer_.publish_count, before);

        controller_.addPlane({.id = "ok"});
        EXPECT_FALSE(controller_.updatePlaneNormal("ok", glm::vec3(1e-10f)));
        EXPECT_FLOAT_EQ(controller_.getPlane("ok")->normal.z, 1.0f);
    }

    TEST_F(ClippingControllerTest, SameIdReplaces) {
        controller_.addPlane({.id = "first"});
        controller_.addPlane({.id = "dup", .position = {1.0f, 0.0f, 0.0f}, .normal = {1.0f, 0.0f, 0.0f}});
        const auto old_helper = controller_.getPlane("dup")->helper;

        controller_.addPlane({.id = "dup", .position = {0.0f, 4.0f, 0.0f}, .normal = {0.0f, 1.0f, 0.0f}});
        ASSERT_EQ(controller_.planeCount(), 2u);
        EXPECT_EQ(controller_.getAllPlanes().back().id, "dup");
        EXPECT_FLOAT_EQ(controller_.getPlane("dup")->plane().constant, -4.0f);
        EXPECT_EQ(scene_.getNodeById(old_helper), nullptr);
        EXPECT_EQ(renderer_.getClippingPlanes().size(), 2u);
    }

    TEST_F(ClippingControllerTest, UnknownIdsReturnFalse) {
        EXPECT_FALSE(controller_.removePlane("nope"));
        EXPECT_FALSE(controller_.updatePlanePosition("nope", glm::vec3(1.0f)));
        EXPECT_FALSE(controller_.setPlaneEnabled("nope", true));
        EXPECT_FALSE(controller_.setHelperVisible("nope", true));
    }

    // ---------------------------------------------------------------------------
    // Helpers
    // ---------------------------------------------------------------------------

    TEST_F(ClippingControllerTest, HelpersLiveUnderOneGroup) {
        controller_.createPresetPlane("x", PlaneAxis::PositiveX);
        controller_.createPresetPlane("y", PlaneAxis::NegativeY, 2.0f);

        const auto group = controller_.helperGroup();
        ASSERT_NE(group, core::NULL_NODE);
        EXPECT_EQ(scene_.getNodeById(group)->name, ClippingController::HELPER_GROUP_NAME);

        for (const auto& plane : controller_.getAllPlanes()) {
            const auto* helper = scene_.getNodeById(plane.helper);
            ASSERT_NE(helper, nullptr);
            EXPECT_EQ(helper->type, core::NodeType::HELPER);
            EXPECT_EQ(helper->parent_id, group);
            EXPECT_TRUE(helper->material->double_sided);
            EXPECT_FLOAT_EQ(helper->material->base_color.a, 0.25f);
        }

        // Helper sits at the plane position
        const auto& world = scene_.getWorldTransform(controller_.getPlane("y")->helper);
        EXPECT_FLOAT_EQ(world[3].y, -2.0f);
    }

    TEST_F(ClippingControllerTest, HelperVisibilityTracksPlane) {
        controller_.createPresetPlane("cut", PlaneAxis::PositiveZ);
        EXPECT_TRUE(helperVisible("cut"));

        controller_.setPlaneEnabled("cut", false);
        EXPECT_FALSE(helperVisible("cut"));

        controller_.setPlaneEnabled("cut", true);
        ASSERT_TRUE(controller_.setHelperVisible("cut", false));
        EXPECT_FALSE(helperVisible("cut"));
        EXPECT_EQ(renderer_.getClippingPlanes().size(), 1u);

        controller_.addPlane({.id = "bare", .show_helper = false});
        EXPECT_FALSE(controller_.getPlane("bare")->hasHelper());
        EXPECT_FALSE(controller_.setHelperVisible("bare", true));
    }

    TEST_F(ClippingControllerTest, RemoveAndClearDropHelpers) {
        controller_.createPresetPlane("a", PlaneAxis::PositiveX);
        controller_.createPresetPlane("b", PlaneAxis::PositiveY);
        const auto helper_a = controller_.getPlane("a")->helper;
        const auto helper_b = controller_.getPlane("b")->helper;

        ASSERT_TRUE(controller_.removePlane("a"));
        EXPECT_EQ(scene_.getNodeById(helper_a), nullptr);
        EXPECT_NE(scene_.getNodeById(helper_b), nullptr);

        controller_.clearAll();
        EXPECT_EQ(scene_.getNodeById(helper_b), nullptr);
        EXPECT_EQ(controller_.planeCount(), 0u);
        EXPECT_FALSE(renderer_.isLocalClippingEnabled());
        EXPECT_NE(scene_.getNodeById(controller_.helperGroup()), nullptr);
    }

    TEST_F(ClippingControllerTest, DisposeRemovesGroup) {
        controller_.createPresetPlane("a", PlaneAxis::PositiveX);
        const auto group = controller_.helperGroup();

        controller_.dispose();
        EXPECT_EQ(scene_.getNodeById(group), nullptr);
        EXPECT_EQ(controller_.helperGroup(), core::NULL_NODE);
        EXPECT_FALSE(scene_.hasNodes());
    }

    TEST_F(ClippingControllerTest, SceneClearLeavesReloadedNodesAlone) {
        controller_.createPresetPlane("p", PlaneAxis::PositiveZ);
        ASSERT_TRUE(controller_.getPlane("p")->hasHelper());

        scene_.clear();
        const auto root = scene_.addGroup("model");
        const auto wall = scene_.addMesh("wall", test::make_box(glm::vec3(-1.0f), glm::vec3(1.0f)), nullptr, root);

        ASSERT_TRUE(controller_.removePlane("p"));
        EXPECT_NE(scene_.getNodeById(wall), nullptr);

        controller_.dispose();
        EXPECT_NE(scene_.getNodeById(root), nullptr);
        EXPECT_NE(scene_.getNodeById(wall), nullptr);
        EXPECT_EQ(scene_.getNodeCount(), 2u);
    }

    TEST_F(ClippingControllerTest, HelpersExcludedFromSceneBounds) {
        scene_.addMesh("box", test::make_box(glm::vec3(-1.0f), glm::vec3(1.0f)), nullptr);
        controller_.createPresetPlane("cut", PlaneAxis::PositiveZ, 0.5f);

        const auto bounds = scene_.getSceneBounds();
        EXPECT_FLOAT_EQ(bounds.max.x, 1.0f);
        EXPECT_GT(scene_.getSceneBounds(true).max.x, 1.0f);
    }

    TEST(ClippingController, PlanesWithoutSceneGetHelpersLater) {
        ClippingController controller;
        controller.createPresetPlane("early", PlaneAxis::PositiveX, 1.0f);
        EXPECT_FALSE(controller.getPlane("early")->hasHelper());

        core::Scene first;
        controller.setScene(&first);
        ASSERT_TRUE(controller.getPlane("early")->hasHelper());
        EXPECT_NE(first.getNodeById(controller.getPlane("early")->helper), nullptr);

        core::Scene second;
        controller.setScene(&second);
        EXPECT_FALSE(first.hasNodes());
        ASSERT_TRUE(controller.getPlane("early")->hasHelper());
        EXPECT_EQ(second.getNodeById(controller.getPlane("early")->helper)->type, core::NodeType::HELPER);

        controller.setScene(nullptr);
        EXPECT_FALSE(second.hasNodes());
    }

    TEST(ClippingController, CustomHelperColor) {
        core::param::ClippingParameters params;
        params.helper_color = {1.0f, 0.0f, 0.0f};
        params.helper_size = 2.0f;

        core::Scene scene;
        ClippingController controller(params);
        controller.setScene(&scene);
        controller.createPresetPlane("cut", PlaneAxis::PositiveZ);

        const auto* helper = scene.getNodeById(controller.getPlane("cut")->helper);
        EXPECT_FLOAT_EQ(helper->material->base_color.r, 1.0f);
        EXPECT_FLOAT_EQ(helper->mesh->bounds().max.x, 1.0f);
    }

} // namespace bim::interaction
