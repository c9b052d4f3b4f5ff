// SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "io/error.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>

namespace bim::io {

    TEST(Error, CategoryFollowsCode) {
        EXPECT_EQ(error_category(ErrorCode::PATH_NOT_FOUND), ErrorCategory::Filesystem);
        EXPECT_EQ(error_category(ErrorCode::MALFORMED_JSON), ErrorCategory::Input);
        EXPECT_EQ(error_category(ErrorCode::FETCH_FAILED), ErrorCategory::Load);
        EXPECT_EQ(error_category(ErrorCode::RENDER_FAILED), ErrorCategory::Export);
        EXPECT_EQ(error_category(ErrorCode::INVALID_STATE), ErrorCategory::State);
        EXPECT_EQ(error_category(ErrorCode::SUCCESS), ErrorCategory::None);
    }

    TEST(Error, FormatIncludesPathWhenSet) {
        EXPECT_EQ(Error(ErrorCode::EMPTY_MODEL, "no meshes").format(), "[Empty model] no meshes");
        EXPECT_EQ(Error(ErrorCode::PATH_NOT_FOUND, "missing", "a/b.glb").format(), "[Path not found] missing: a/b.glb");
    }

    TEST(VerifyWritable, CreatesMissingParents) {
        const test::TempDir dir("bimscope_error");
        const auto target = dir.path() / "one" / "two" / "out.png";

        ASSERT_TRUE(verify_writable(target).has_value());
        EXPECT_TRUE(std::filesystem::is_directory(target.parent_path()));
    }

    TEST(VerifyWritable, RejectsDirectoryTarget) {
        const test::TempDir dir("bimscope_error_dir");
        const auto result = verify_writable(dir.path());
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, ErrorCode::NOT_A_FILE);
    }

} // namespace bim::io
