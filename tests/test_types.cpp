/**
 * @file test_types.cpp
 * @brief Tests for ByteOrder and Encoding with their YAML conversions
 * @brief ByteOrder、Encoding 及其 YAML 转换的测试
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <string>

#include <yaml-cpp/yaml.h>

#include <cpputil/types/byte_order.hpp>
#include <cpputil/types/encoding.hpp>

namespace cpputil {
namespace test {

namespace {

bool HostIsLittleEndian() {
    const uint16_t marker = 0x0102;
    unsigned char bytes[sizeof(marker)];
    std::memcpy(bytes, &marker, sizeof(marker));
    return bytes[0] == 0x02;
}

}  // namespace

// ==============================================================================
// ByteOrder / 字节序
// ==============================================================================

TEST(ByteOrderTest, Default) {
    EXPECT_EQ(kDefaultByteOrder, ByteOrder::Little);
    EXPECT_TRUE(IsLittle(kDefaultByteOrder));
}

/**
 * @brief Test the predicates for fixed orders
 * @brief 测试固定字节序的判断函数
 */
TEST(ByteOrderTest, FixedOrders) {
    EXPECT_TRUE(IsBig(ByteOrder::Big));
    EXPECT_FALSE(IsLittle(ByteOrder::Big));
    EXPECT_TRUE(IsLittle(ByteOrder::Little));
    EXPECT_FALSE(IsBig(ByteOrder::Little));
}

/**
 * @brief Test Native follows the target platform
 * @brief 测试 Native 跟随目标平台
 */
TEST(ByteOrderTest, NativeMatchesHost) {
    const bool little = HostIsLittleEndian();
    EXPECT_EQ(kNativeLittleEndian, little);
    EXPECT_EQ(IsLittle(ByteOrder::Native), little);
    EXPECT_EQ(IsBig(ByteOrder::Native), !little);
    EXPECT_TRUE(IsNative(ByteOrder::Native));
    EXPECT_EQ(IsNative(ByteOrder::Little), little);
    EXPECT_EQ(IsNative(ByteOrder::Big), !little);
    EXPECT_EQ(Resolve(ByteOrder::Native), little ? ByteOrder::Little : ByteOrder::Big);
    EXPECT_EQ(Resolve(ByteOrder::Big), ByteOrder::Big);
}

TEST(ByteOrderTest, Names) {
    EXPECT_EQ(ByteOrderToString(ByteOrder::Big), "big");
    EXPECT_EQ(ByteOrderToString(ByteOrder::Native), "native");
    EXPECT_EQ(StringToByteOrder("little"), ByteOrder::Little);
    EXPECT_FALSE(StringToByteOrder("Little").has_value());
    EXPECT_FALSE(StringToByteOrder("middle").has_value());
}

/**
 * @brief Test ByteOrder serializes as a lowercase YAML scalar
 * @brief 测试 ByteOrder 序列化为小写 YAML 标量
 */
TEST(ByteOrderTest, Yaml) {
    YAML::Node node;
    node["order"] = ByteOrder::Native;
    EXPECT_EQ(node["order"].as<std::string>(), "native");

    YAML::Node parsed = YAML::Load("{order: big, fallback: little}");
    EXPECT_EQ(parsed["order"].as<ByteOrder>(), ByteOrder::Big);
    EXPECT_EQ(parsed["fallback"].as<ByteOrder>(), ByteOrder::Little);

    EXPECT_THROW(YAML::Load("order: sideways")["order"].as<ByteOrder>(), YAML::BadConversion);
    EXPECT_THROW(YAML::Load("order: [big]")["order"].as<ByteOrder>(), YAML::BadConversion);
}

// ==============================================================================
// Encoding / 编码
// ==============================================================================

TEST(EncodingTest, DefaultIsUtf8) {
    EXPECT_EQ(kDefaultEncoding, Encoding::Utf8);
    EXPECT_EQ(EncodingToString(kDefaultEncoding), "utf_8");
}

TEST(EncodingTest, Names) {
    EXPECT_EQ(EncodingToString(Encoding::Ascii), "ascii");
    EXPECT_EQ(EncodingToString(Encoding::Latin1), "latin_1");
    EXPECT_EQ(EncodingToString(Encoding::ShiftJis), "shift_jis");
    EXPECT_EQ(EncodingToString(Encoding::Zlib), "zlib");
    EXPECT_EQ(EncodingToString(static_cast<Encoding>(kEncodingCount)), "unknown");
}

/**
 * @brief Test lookup ignores case and accepts '-' for '_'
 * @brief 测试查找忽略大小写并接受 '-' 代替 '_'
 */
TEST(EncodingTest, Lookup) {
    EXPECT_EQ(StringToEncoding("utf_8"), Encoding::Utf8);
    EXPECT_EQ(StringToEncoding("UTF-8"), Encoding::Utf8);
    EXPECT_EQ(StringToEncoding("Shift-JIS"), Encoding::ShiftJis);
    EXPECT_EQ(StringToEncoding("cp1252"), Encoding::Cp1252);
    EXPECT_FALSE(StringToEncoding("utf8").has_value());
    EXPECT_FALSE(StringToEncoding("").has_value());
}

TEST(EncodingTest, EveryNameResolves) {
    for (size_t i = 0; i < kEncodingCount; ++i) {
        const auto encoding = static_cast<Encoding>(i);
        EXPECT_EQ(StringToEncoding(EncodingToString(encoding)), encoding) << i;
    }
}

TEST(EncodingTest, Yaml) {
    YAML::Node node;
    node["encoding"] = Encoding::Gb18030;
    EXPECT_EQ(node["encoding"].as<std::string>(), "gb18030");
    EXPECT_EQ(YAML::Load("encoding: UTF-16-LE")["encoding"].as<Encoding>(), Encoding::Utf16le);
    EXPECT_THROW(YAML::Load("encoding: klingon")["encoding"].as<Encoding>(), YAML::BadConversion);
}

}  // namespace test
}  // namespace cpputil
