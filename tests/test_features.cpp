/**
 * @file test_features.cpp
 * @brief Tests for capability resolution as seen by the library build
 * @brief 库构建所见能力解析的测试
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <string_view>

#include <cpputil/features.hpp>

namespace cpputil {
namespace test {

namespace {

bool Contains(const std::vector<std::string_view>& names, std::string_view name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

}  // namespace

// ==============================================================================
// Consistency / 一致性
// ==============================================================================

/**
 * @brief Test the spdlog backend always implies the facade
 * @brief 测试 spdlog 后端总是隐含门面
 */
TEST(FeaturesTest, SpdlogImpliesLog) {
    static_assert(!features::kLogSpdlog || features::kLog, "log_spdlog implies log");
    EXPECT_EQ(CPPUTIL_HAS_LOG != 0, features::kLog);
    EXPECT_EQ(CPPUTIL_HAS_LOG_SPDLOG != 0, features::kLogSpdlog);
}

/**
 * @brief Test runtime queries agree with the constexpr flags
 * @brief 测试运行时查询与 constexpr 标志一致
 */
TEST(FeaturesTest, RuntimeQueries) {
    EXPECT_EQ(features::IsEnabled("log"), features::kLog);
    EXPECT_EQ(features::IsEnabled("log_spdlog"), features::kLogSpdlog);
    EXPECT_EQ(features::IsEnabled("macros"), features::kMacros);
    EXPECT_EQ(features::IsEnabled("types"), features::kTypes);
    EXPECT_EQ(features::IsEnabled("py"), features::kPy);
    EXPECT_EQ(features::IsEnabled("full"), features::kFull);
    EXPECT_FALSE(features::IsEnabled("serde"));
    EXPECT_FALSE(features::IsEnabled(""));
}

TEST(FeaturesTest, EnabledNamesMatchFlags) {
    const auto names = features::EnabledNames();
    size_t expected = 0;
    for (const auto& capability : features::kCapabilities) {
        EXPECT_EQ(Contains(names, capability.name), capability.enabled) << capability.name;
        expected += capability.enabled ? 1 : 0;
    }
    EXPECT_EQ(names.size(), expected);
    EXPECT_FALSE(Contains(names, "full"));
}

// ==============================================================================
// Full build / 完整构建
// ==============================================================================

#ifdef CPPUTIL_FEATURE_FULL

/**
 * @brief Test the aggregate turns every capability on
 * @brief 测试聚合选项启用所有能力
 */
TEST(FeaturesTest, FullEnablesEverything) {
    static_assert(features::kFull, "full build");
    EXPECT_TRUE(features::kLog);
    EXPECT_TRUE(features::kLogSpdlog);
    EXPECT_TRUE(features::kMacros);
    EXPECT_TRUE(features::kTypes);
    EXPECT_TRUE(features::kPy);
    EXPECT_TRUE(features::IsEnabled("full"));

    const auto names = features::EnabledNames();
    ASSERT_EQ(names.size(), 5u);
    EXPECT_EQ(names.front(), "log");
    EXPECT_EQ(names.back(), "py");
}

#endif  // CPPUTIL_FEATURE_FULL

}  // namespace test
}  // namespace cpputil
