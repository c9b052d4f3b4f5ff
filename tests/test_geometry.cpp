// SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "core/base64.hpp"
#include "core/geometry.hpp"
#include "core/view_camera.hpp"
#include <gtest/gtest.h>

namespace bim::core {

    // ---------------------------------------------------------------------------
    // Bounding box
    // ---------------------------------------------------------------------------

    TEST(BoundingBox, DefaultIsEmpty) {
        const BoundingBox box;
        EXPECT_TRUE(box.isEmpty());
        EXPECT_EQ(box.size(), glm::vec3(0.0f));
    }

    TEST(BoundingBox, ExpandAndMeasure) {
        BoundingBox box;
        box.expand(glm::vec3(-1.0f, 0.0f, 2.0f));
        box.expand(glm::vec3(3.0f, 1.0f, 2.5f));

        EXPECT_FALSE(box.isEmpty());
        EXPECT_EQ(box.center(), glm::vec3(1.0f, 0.5f, 2.25f));
        EXPECT_FLOAT_EQ(box.maxDimension(), 4.0f);
    }

    TEST(BoundingBox, ExpandWithEmptyIsNoOp) {
        BoundingBox box(glm::vec3(0.0f), glm::vec3(1.0f));
        box.expand(BoundingBox{});
        EXPECT_EQ(box.min, glm::vec3(0.0f));
        EXPECT_EQ(box.max, glm::vec3(1.0f));
    }

    // ---------------------------------------------------------------------------
    // Intersections
    // ---------------------------------------------------------------------------

    TEST(RayTriangle, HitsFromBothSides) {
        const glm::vec3 v0(-1.0f, -1.0f, 0.0f), v1(1.0f, -1.0f, 0.0f), v2(0.0f, 1.0f, 0.0f);

        const Ray front{glm::vec3(0.0f, 0.0f, 5.0f), glm::vec3(0.0f, 0.0f, -1.0f)};
        const Ray back{glm::vec3(0.0f, 0.0f, -3.0f), glm::vec3(0.0f, 0.0f, 1.0f)};

        ASSERT_TRUE(intersect_ray_triangle(front, v0, v1, v2).has_value());
        EXPECT_FLOAT_EQ(*intersect_ray_triangle(front, v0, v1, v2), 5.0f);
        ASSERT_TRUE(intersect_ray_triangle(back, v0, v1, v2).has_value());
        EXPECT_FLOAT_EQ(*intersect_ray_triangle(back, v0, v1, v2), 3.0f);
    }

    TEST(RayTriangle, MissesOutsideAndBehind) {
        const glm::vec3 v0(-1.0f, -1.0f, 0.0f), v1(1.0f, -1.0f, 0.0f), v2(0.0f, 1.0f, 0.0f);

        const Ray outside{glm::vec3(5.0f, 5.0f, 5.0f), glm::vec3(0.0f, 0.0f, -1.0f)};
        const Ray away{glm::vec3(0.0f, 0.0f, 5.0f), glm::vec3(0.0f, 0.0f, 1.0f)};
        const Ray parallel{glm::vec3(0.0f, 0.0f, 1.0f), glm::vec3(1.0f, 0.0f, 0.0f)};

        EXPECT_FALSE(intersect_ray_triangle(outside, v0, v1, v2));
        EXPECT_FALSE(intersect_ray_triangle(away, v0, v1, v2));
        EXPECT_FALSE(intersect_ray_triangle(parallel, v0, v1, v2));
    }

    TEST(RayAabb, EntryAndInside) {
        const BoundingBox box(glm::vec3(-1.0f), glm::vec3(1.0f));

        const Ray outside{glm::vec3(0.2f, 0.3f, 10.0f), glm::vec3(0.0f, 0.0f, -1.0f)};
        const auto entry = intersect_ray_aabb(outside, box);
        ASSERT_TRUE(entry.has_value());
        EXPECT_FLOAT_EQ(*entry, 9.0f);

        const Ray inside{glm::vec3(0.2f, 0.3f, 0.0f), glm::vec3(0.0f, 0.0f, -1.0f)};
        const auto exit = intersect_ray_aabb(inside, box);
        ASSERT_TRUE(exit.has_value());
        EXPECT_FLOAT_EQ(*exit, 1.0f);

        const Ray miss{glm::vec3(5.0f, 0.3f, 10.0f), glm::vec3(0.0f, 0.0f, -1.0f)};
        EXPECT_FALSE(intersect_ray_aabb(miss, box));
    }

    TEST(Plane, SignedDistance) {
        const auto plane = Plane::fromNormalAndPoint(glm::vec3(0.0f, 1.0f, 0.0f), glm::vec3(0.0f, 2.0f, 0.0f));
        EXPECT_FLOAT_EQ(plane.constant, -2.0f);
        EXPECT_FLOAT_EQ(plane.distanceTo(glm::vec3(7.0f, 5.0f, 1.0f)), 3.0f);
        EXPECT_LT(plane.distanceTo(glm::vec3(0.0f)), 0.0f);
    }

    // ---------------------------------------------------------------------------
    // Camera
    // ---------------------------------------------------------------------------

    TEST(ViewCamera, LookAtPointsForward) {
        auto camera = ViewCamera::perspective(60.0f, 1.0f, 0.1f, 100.0f);
        camera.position = glm::vec3(10.0f, 0.0f, 0.0f);
        camera.lookAt(glm::vec3(0.0f));

        const glm::vec3 f = camera.forward();
        EXPECT_NEAR(f.x, -1.0f, 1e-5f);
        EXPECT_NEAR(f.y, 0.0f, 1e-5f);
        EXPECT_NEAR(f.z, 0.0f, 1e-5f);
        EXPECT_NEAR(camera.up().y, 1.0f, 1e-5f);
    }

    TEST(ViewCamera, LookAtStraightDownStaysFinite) {
        auto camera = ViewCamera::perspective(60.0f, 1.0f, 0.1f, 100.0f);
        camera.position = glm::vec3(0.0f, 10.0f, 0.0f);
        camera.lookAt(glm::vec3(0.0f));

        const glm::vec3 f = camera.forward();
        EXPECT_NEAR(f.y, -1.0f, 1e-5f);
        EXPECT_FALSE(glm::any(glm::isnan(camera.up())));
    }

    TEST(ViewCamera, CenterRayFollowsForward) {
        auto camera = ViewCamera::perspective(50.0f, 1.5f, 0.1f, 100.0f);
        camera.position = glm::vec3(1.0f, 2.0f, 3.0f);
        camera.lookAt(glm::vec3(1.0f, 2.0f, -7.0f));

        const Ray ray = camera.rayFromNdc(glm::vec2(0.0f));
        EXPECT_NEAR(glm::distance(ray.origin, camera.position), 0.0f, 1e-4f);
        EXPECT_NEAR(glm::dot(glm::normalize(ray.direction), camera.forward()), 1.0f, 1e-5f);
    }

    TEST(ViewCamera, OrthographicRaysAreParallel) {
        auto camera = ViewCamera::orthographic(OrthoExtents{-2.0f, 2.0f, 1.0f, -1.0f}, 0.1f, 100.0f);
        camera.position = glm::vec3(0.0f, 0.0f, 10.0f);
        camera.lookAt(glm::vec3(0.0f));

        const Ray corner = camera.rayFromNdc(glm::vec2(1.0f, 1.0f));
        EXPECT_NEAR(corner.origin.x, 2.0f, 1e-4f);
        EXPECT_NEAR(corner.origin.y, 1.0f, 1e-4f);
        EXPECT_NEAR(corner.direction.z, -1.0f, 1e-5f);
        EXPECT_FLOAT_EQ(camera.aspect, 2.0f);
    }

    // ---------------------------------------------------------------------------
    // Base64
    // ---------------------------------------------------------------------------

    TEST(Base64, KnownVectors) {
        const std::string text = "foobar";
        const std::vector<uint8_t> bytes(text.begin(), text.end());

        EXPECT_EQ(base64_encode(std::span<const uint8_t>(bytes.data(), 0)), "");
        EXPECT_EQ(base64_encode(std::span<const uint8_t>(bytes.data(), 1)), "Zg==");
        EXPECT_EQ(base64_encode(std::span<const uint8_t>(bytes.data(), 2)), "Zm8=");
        EXPECT_EQ(base64_encode(bytes), "Zm9vYmFy");

        const auto decoded = base64_decode("Zm9vYg==");
        ASSERT_TRUE(decoded.has_value());
        EXPECT_EQ(std::string(decoded->begin(), decoded->end()), "foob");
    }

    TEST(Base64, RejectsInvalidInput) {
        EXPECT_FALSE(base64_decode("Zm9v!mFy"));
        EXPECT_FALSE(base64_decode("Zm9"));
    }

} // namespace bim::core
