/**
 * @file byte_order.hpp
 * @brief Byte order (endianness) selection
 * @brief 字节序选择
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#pragma once

#include "cpputil/features.hpp"

#if !CPPUTIL_HAS_TYPES
#error "cpputil/types/byte_order.hpp requires CPPUTIL_FEATURE_TYPES"
#endif

#include <cstdint>
#include <optional>
#include <string_view>

#include <yaml-cpp/yaml.h>

namespace cpputil {

// ==============================================================================
// Target Endianness / 目标字节序
// ==============================================================================

#if defined(__BYTE_ORDER__) && defined(__ORDER_BIG_ENDIAN__) && \
    __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
constexpr bool kNativeLittleEndian = false;
#else
constexpr bool kNativeLittleEndian = true;
#endif

// ==============================================================================
// ByteOrder / 字节序
// ==============================================================================

/**
 * @brief Byte order used to interpret multi-byte data
 * @brief 用于解释多字节数据的字节序
 *
 * Native follows the target platform. The default is Little.
 * Native 跟随目标平台。默认值为 Little。
 */
enum class ByteOrder : uint8_t {
    Big,     ///< Most significant byte first / 高位字节在前
    Little,  ///< Least significant byte first / 低位字节在前
    Native   ///< Target platform order / 目标平台字节序
};

constexpr ByteOrder kDefaultByteOrder = ByteOrder::Little;

constexpr bool IsLittle(ByteOrder order) noexcept {
    switch (order) {
        case ByteOrder::Big:
            return false;
        case ByteOrder::Little:
            return true;
        default:
            return kNativeLittleEndian;
    }
}

constexpr bool IsBig(ByteOrder order) noexcept {
    switch (order) {
        case ByteOrder::Big:
            return true;
        case ByteOrder::Little:
            return false;
        default:
            return !kNativeLittleEndian;
    }
}

constexpr bool IsNative(ByteOrder order) noexcept {
    switch (order) {
        case ByteOrder::Big:
            return !kNativeLittleEndian;
        case ByteOrder::Little:
            return kNativeLittleEndian;
        default:
            return true;
    }
}

/**
 * @brief Replace Native with the concrete order of the target
 * @brief 将 Native 替换为目标平台的具体字节序
 */
constexpr ByteOrder Resolve(ByteOrder order) noexcept {
    return IsLittle(order) ? ByteOrder::Little : ByteOrder::Big;
}

/**
 * @brief Lowercase name: "big", "little", "native"
 * @brief 小写名称："big"、"little"、"native"
 */
constexpr std::string_view ByteOrderToString(ByteOrder order) noexcept {
    switch (order) {
        case ByteOrder::Big:
            return "big";
        case ByteOrder::Little:
            return "little";
        case ByteOrder::Native:
            return "native";
        default:
            return "unknown";
    }
}

constexpr std::optional<ByteOrder> StringToByteOrder(std::string_view name) noexcept {
    if (name == "big") {
        return ByteOrder::Big;
    }
    if (name == "little") {
        return ByteOrder::Little;
    }
    if (name == "native") {
        return ByteOrder::Native;
    }
    return std::nullopt;
}

}  // namespace cpputil

// ==============================================================================
// YAML conversion / YAML 转换
// ==============================================================================

namespace YAML {

template <>
struct convert<cpputil::ByteOrder> {
    static Node encode(const cpputil::ByteOrder& rhs);
    static bool decode(const Node& node, cpputil::ByteOrder& rhs);
};

}  // namespace YAML
