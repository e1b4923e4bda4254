/**
 * @file test_common.cpp
 * @brief Unit tests for Level, ErrorCode and Status
 * @brief Level、ErrorCode 与 Status 的单元测试
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#include <gtest/gtest.h>
#ifdef CPPUTIL_HAS_RAPIDCHECK
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>
#endif

#include <cpputil/common.hpp>

namespace cpputil {
namespace test {

// ==============================================================================
// Level / 日志级别
// ==============================================================================

/**
 * @brief Test Level enum values
 * @brief 测试 Level 枚举值
 */
TEST(LevelTest, EnumValues) {
    EXPECT_EQ(static_cast<uint8_t>(Level::Trace), 0);
    EXPECT_EQ(static_cast<uint8_t>(Level::Debug), 1);
    EXPECT_EQ(static_cast<uint8_t>(Level::Info), 2);
    EXPECT_EQ(static_cast<uint8_t>(Level::Warn), 3);
    EXPECT_EQ(static_cast<uint8_t>(Level::Error), 4);
    EXPECT_EQ(static_cast<uint8_t>(Level::Off), 5);
}

/**
 * @brief Test LevelToString with every style
 * @brief 测试 LevelToString 的所有样式
 */
TEST(LevelTest, LevelToStringStyles) {
    EXPECT_EQ(LevelToString(Level::Trace, LevelNameStyle::Full), "trace");
    EXPECT_EQ(LevelToString(Level::Warn, LevelNameStyle::Full), "warn");
    EXPECT_EQ(LevelToString(Level::Off, LevelNameStyle::Full), "off");

    EXPECT_EQ(LevelToString(Level::Debug, LevelNameStyle::Short4), "DBUG");
    EXPECT_EQ(LevelToString(Level::Error, LevelNameStyle::Short4), "ERRO");

    EXPECT_EQ(LevelToString(Level::Info, LevelNameStyle::Short1), "I");
    EXPECT_EQ(LevelToString(Level::Off, LevelNameStyle::Short1), "O");

    // Default is Short4 / 默认为 Short4
    EXPECT_EQ(LevelToString(Level::Info), "INFO");
}

/**
 * @brief Test StringToLevel accepts the five severities only
 * @brief 测试 StringToLevel 只接受五个严重级别
 */
TEST(LevelTest, StringToLevel) {
    EXPECT_EQ(StringToLevel("trace"), Level::Trace);
    EXPECT_EQ(StringToLevel("DEBUG"), Level::Debug);
    EXPECT_EQ(StringToLevel("Info"), Level::Info);
    EXPECT_EQ(StringToLevel("warning"), Level::Warn);
    EXPECT_EQ(StringToLevel("error"), Level::Error);

    EXPECT_FALSE(StringToLevel("off").has_value());
    EXPECT_FALSE(StringToLevel("verbose").has_value());
    EXPECT_FALSE(StringToLevel("").has_value());
}

/**
 * @brief Test StringToThreshold additionally accepts "off"
 * @brief 测试 StringToThreshold 额外接受 "off"
 */
TEST(LevelTest, StringToThreshold) {
    EXPECT_EQ(StringToThreshold("off"), Level::Off);
    EXPECT_EQ(StringToThreshold("OFF"), Level::Off);
    EXPECT_EQ(StringToThreshold("warn"), Level::Warn);
    EXPECT_FALSE(StringToThreshold("loud").has_value());
}

/**
 * @brief Test threshold filtering
 * @brief 测试阈值过滤
 */
TEST(LevelTest, PassesThreshold) {
    EXPECT_FALSE(PassesThreshold(Level::Debug, Level::Info));
    EXPECT_TRUE(PassesThreshold(Level::Info, Level::Info));
    EXPECT_TRUE(PassesThreshold(Level::Error, Level::Info));

    // Off as a threshold lets nothing through / Off 作为阈值时不允许任何记录
    EXPECT_FALSE(PassesThreshold(Level::Error, Level::Off));

    // Off is never a record level / Off 永远不是记录级别
    EXPECT_FALSE(PassesThreshold(Level::Off, Level::Trace));
    EXPECT_FALSE(PassesThreshold(Level::Off, Level::Off));

    static_assert(PassesThreshold(Level::Warn, Level::Info), "usable in constant expressions");
}

/**
 * @brief Test level count constants
 * @brief 测试级别数量常量
 */
TEST(LevelTest, LevelCount) {
    EXPECT_EQ(kLevelCount, 5u);
    EXPECT_EQ(kLevelCountWithOff, 6u);
}

// ==============================================================================
// ErrorCode / 错误码
// ==============================================================================

TEST(ErrorCodeTest, Names) {
    EXPECT_EQ(ErrorCodeToString(ErrorCode::Success), "Success");
    EXPECT_EQ(ErrorCodeToString(ErrorCode::ConfigFileNotFound), "ConfigFileNotFound");
    EXPECT_EQ(ErrorCodeToString(ErrorCode::AlreadyInitialized), "AlreadyInitialized");
    EXPECT_EQ(ErrorCodeToString(static_cast<ErrorCode>(12345)), "UnknownError");
}

/**
 * @brief Test that every code maps to its category
 * @brief 测试每个错误码映射到对应类别
 */
TEST(ErrorCodeTest, Categories) {
    EXPECT_EQ(CategoryOf(ErrorCode::Success), ErrorCategory::None);
    EXPECT_EQ(CategoryOf(ErrorCode::FileOpenFailed), ErrorCategory::IO);
    EXPECT_EQ(CategoryOf(ErrorCode::ConfigParseError), ErrorCategory::Configuration);
    EXPECT_EQ(CategoryOf(ErrorCode::ConfigMissingRequired), ErrorCategory::Configuration);
    EXPECT_EQ(CategoryOf(ErrorCode::ConfigFileNotFound), ErrorCategory::Configuration);
    EXPECT_EQ(CategoryOf(ErrorCode::ConfigInvalidValue), ErrorCategory::Validation);
    EXPECT_EQ(CategoryOf(ErrorCode::AlreadyInitialized), ErrorCategory::State);
    EXPECT_EQ(CategoryOf(ErrorCode::FlushTimeout), ErrorCategory::State);
    EXPECT_EQ(CategoryOf(ErrorCode::NotSupported), ErrorCategory::Support);
    EXPECT_EQ(CategoryOf(ErrorCode::InternalError), ErrorCategory::Internal);

    EXPECT_EQ(CategoryOf(ErrorCode::Success), ErrorCategory::None);
}

// ==============================================================================
// Status / 状态
// ==============================================================================

TEST(StatusTest, DefaultIsOk) {
    Status status;
    EXPECT_TRUE(status.IsOk());
    EXPECT_TRUE(static_cast<bool>(status));
    EXPECT_EQ(status.Code(), ErrorCode::Success);
    EXPECT_TRUE(status.Message().empty());
    EXPECT_EQ(status.ToString(), "Success");
    EXPECT_TRUE(Status::Ok().IsOk());
}

/**
 * @brief Test a failed status carries its code, category and message
 * @brief 测试失败状态携带错误码、类别和消息
 */
TEST(StatusTest, Failure) {
    Status status(ErrorCode::ConfigInvalidValue, "invalid level 'loud'");
    EXPECT_FALSE(status);
    EXPECT_EQ(status.Code(), ErrorCode::ConfigInvalidValue);
    EXPECT_EQ(status.Category(), ErrorCategory::Validation);
    EXPECT_EQ(status.Message(), "invalid level 'loud'");
    EXPECT_EQ(status.ToString(), "ConfigInvalidValue: invalid level 'loud'");
}

// ==============================================================================
// Property-Based Tests / 属性测试
// ==============================================================================

#ifdef CPPUTIL_HAS_RAPIDCHECK

/**
 * @brief Property: Full level names round-trip through StringToThreshold
 * @brief 属性：全称级别名称经 StringToThreshold 往返一致
 */
RC_GTEST_PROP(LevelPropertyTest, ThresholdRoundTrip, ()) {
    const auto level = static_cast<Level>(*rc::gen::inRange<uint8_t>(0, 6));
    const auto name = LevelToString(level, LevelNameStyle::Full);
    RC_ASSERT(StringToThreshold(name) == level);
}

/**
 * @brief Property: filtering agrees with the numeric ordering
 * @brief 属性：过滤结果与数值顺序一致
 */
RC_GTEST_PROP(LevelPropertyTest, FilteringMatchesOrdering, ()) {
    const auto levelValue = *rc::gen::inRange<uint8_t>(0, 5);
    const auto thresholdValue = *rc::gen::inRange<uint8_t>(0, 6);
    const bool expected = levelValue >= thresholdValue;
    RC_ASSERT(PassesThreshold(static_cast<Level>(levelValue),
                              static_cast<Level>(thresholdValue)) == expected);
}

#endif  // CPPUTIL_HAS_RAPIDCHECK

}  // namespace test
}  // namespace cpputil
