/**
 * @file test_features_spdlog_only.cpp
 * @brief Capability closure when only CPPUTIL_FEATURE_LOG_SPDLOG is defined
 * @brief 仅定义 CPPUTIL_FEATURE_LOG_SPDLOG 时的能力闭包
 *
 * Compiled without the cpputil target, so only the definition passed to this
 * executable is visible.
 * 不链接 cpputil 目标编译，因此只有传给此可执行文件的定义可见。
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#include <gtest/gtest.h>

#include <cpputil/features.hpp>

namespace cpputil {
namespace test {

static_assert(CPPUTIL_HAS_LOG == 1, "log_spdlog pulls in log");
static_assert(CPPUTIL_HAS_LOG_SPDLOG == 1, "log_spdlog is on");

/**
 * @brief Test the full backend implies the minimal facade and nothing else
 * @brief 测试完整后端隐含基本门面且不启用其他能力
 */
TEST(FeatureClosureTest, SpdlogOnlyImpliesLog) {
    EXPECT_TRUE(features::kLog);
    EXPECT_TRUE(features::kLogSpdlog);
    EXPECT_FALSE(features::kMacros);
    EXPECT_FALSE(features::kTypes);
    EXPECT_FALSE(features::kPy);
    EXPECT_FALSE(features::kFull);

    const auto names = features::EnabledNames();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "log");
    EXPECT_EQ(names[1], "log_spdlog");
}

}  // namespace test
}  // namespace cpputil
