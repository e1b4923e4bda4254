/**
 * @file test_enum_extend.cpp
 * @brief Tests for CPPUTIL_ENUM_EXTEND
 * @brief CPPUTIL_ENUM_EXTEND 的测试
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#include <gtest/gtest.h>
#ifdef CPPUTIL_HAS_RAPIDCHECK
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>
#endif

#include <cstdint>

#include <cpputil/macros/enum_extend.hpp>

namespace cpputil {
namespace test {

#define HTTP_STATUS_LIST(X) \
    X(Ok, 200)              \
    X(NotFound, 404)        \
    X(Teapot, 418)          \
    X(Internal, 500)

CPPUTIL_ENUM_EXTEND(HttpStatus, uint16_t, HTTP_STATUS_LIST)

#define SIGN_LIST(X) \
    X(Negative, -1)  \
    X(Zero, 0)       \
    X(Positive, 1)

CPPUTIL_ENUM_EXTEND(Sign, int8_t, SIGN_LIST)

/**
 * @brief Test enumerators carry their explicit values
 * @brief 测试枚举值携带显式数值
 */
TEST(EnumExtendTest, ToValue) {
    static_assert(ToValue(HttpStatus::Teapot) == 418, "explicit value");
    EXPECT_EQ(ToValue(HttpStatus::Ok), 200);
    EXPECT_EQ(ToValue(HttpStatus::Internal), 500);
    EXPECT_EQ(ToValue(Sign::Negative), -1);
    EXPECT_EQ(HttpStatusCount, 4u);
    EXPECT_EQ(SignCount, 3u);
}

TEST(EnumExtendTest, FromValue) {
    static_assert(HttpStatusFromValue(404) == HttpStatus::NotFound, "known value");
    EXPECT_EQ(HttpStatusFromValue(200), HttpStatus::Ok);
    EXPECT_EQ(SignFromValue(-1), Sign::Negative);
    EXPECT_EQ(SignFromValue(1), Sign::Positive);
}

/**
 * @brief Test unknown values are rejected rather than cast
 * @brief 测试未知值被拒绝而不是强制转换
 */
TEST(EnumExtendTest, UnknownValueRejected) {
    EXPECT_FALSE(HttpStatusFromValue(201).has_value());
    EXPECT_FALSE(HttpStatusFromValue(0).has_value());
    EXPECT_FALSE(SignFromValue(2).has_value());
}

TEST(EnumExtendTest, Names) {
    EXPECT_EQ(ToString(HttpStatus::Teapot), "Teapot");
    EXPECT_EQ(ToString(Sign::Zero), "Zero");
    EXPECT_EQ(ToString(static_cast<HttpStatus>(999)), "unknown");
}

#ifdef CPPUTIL_HAS_RAPIDCHECK

/**
 * @brief Property: FromValue succeeds exactly for declared values and round-trips
 * @brief 属性：FromValue 仅对已声明值成功并且往返一致
 */
RC_GTEST_PROP(EnumExtendPropertyTest, FromValueRoundTrip, (uint16_t value)) {
    const auto status = HttpStatusFromValue(value);
    const bool declared = value == 200 || value == 404 || value == 418 || value == 500;
    RC_ASSERT(status.has_value() == declared);
    if (status) {
        RC_ASSERT(ToValue(*status) == value);
    }
}

#endif  // CPPUTIL_HAS_RAPIDCHECK

}  // namespace test
}  // namespace cpputil
