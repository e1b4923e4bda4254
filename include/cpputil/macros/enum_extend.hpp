/**
 * @file enum_extend.hpp
 * @brief Enum with explicit underlying values and two-way conversion
 * @brief 带显式底层值并支持双向转换的枚举
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#pragma once

#include "cpputil/features.hpp"

#if !CPPUTIL_HAS_MACROS
#error "cpputil/macros/enum_extend.hpp requires CPPUTIL_FEATURE_MACROS"
#endif

#include <cstddef>
#include <optional>
#include <string_view>

// ==============================================================================
// Expansion helpers / 展开辅助宏
// ==============================================================================

#define CPPUTIL_DETAIL_ENUM_DECLARE(variant, value) variant = value,
#define CPPUTIL_DETAIL_ENUM_COUNT(variant, value) +1
#define CPPUTIL_DETAIL_ENUM_FROM_VALUE(variant, value) \
    case value:                                        \
        return EnumType::variant;
#define CPPUTIL_DETAIL_ENUM_TO_STRING(variant, value) \
    case EnumType::variant:                           \
        return #variant;

// ==============================================================================
// CPPUTIL_ENUM_EXTEND
// ==============================================================================

/**
 * @brief Define an enum class with explicit values plus conversion helpers
 * @brief 定义带显式值的枚举类以及转换辅助函数
 *
 * LIST is an X-macro taking a macro of (variant, value). Use at namespace
 * scope. Duplicate values are rejected by the compiler.
 * LIST 是一个接收 (variant, value) 宏的 X 宏。需在命名空间作用域使用。
 * 重复的值会被编译器拒绝。
 *
 * Generates / 生成:
 * - enum class Name : ValueType
 * - constexpr ValueType ToValue(Name)
 * - constexpr std::optional<Name> Name##FromValue(ValueType)   (nullopt for unknown values)
 * - constexpr std::string_view ToString(Name)                  (variant name)
 * - constexpr size_t Name##Count
 *
 * @code
 * #define PACKET_TYPES(X) \
 *     X(Ping, 0x01)       \
 *     X(Pong, 0x02)
 * CPPUTIL_ENUM_EXTEND(PacketType, uint8_t, PACKET_TYPES)
 *
 * static_assert(ToValue(PacketType::Pong) == 0x02);
 * static_assert(PacketTypeFromValue(0x01) == PacketType::Ping);
 * static_assert(!PacketTypeFromValue(0x03).has_value());
 * @endcode
 */
#define CPPUTIL_ENUM_EXTEND(Name, ValueType, LIST)                                   \
    enum class Name : ValueType { LIST(CPPUTIL_DETAIL_ENUM_DECLARE) };               \
                                                                                     \
    constexpr std::size_t Name##Count = 0 LIST(CPPUTIL_DETAIL_ENUM_COUNT);           \
                                                                                     \
    constexpr ValueType ToValue(Name value) noexcept {                               \
        return static_cast<ValueType>(value);                                        \
    }                                                                                \
                                                                                     \
    constexpr std::optional<Name> Name##FromValue(ValueType value) noexcept {        \
        using EnumType = Name;                                                       \
        switch (value) {                                                             \
            LIST(CPPUTIL_DETAIL_ENUM_FROM_VALUE)                                     \
            default:                                                                 \
                return std::nullopt;                                                 \
        }                                                                            \
    }                                                                                \
                                                                                     \
    constexpr std::string_view ToString(Name value) noexcept {                       \
        using EnumType = Name;                                                       \
        switch (value) {                                                             \
            LIST(CPPUTIL_DETAIL_ENUM_TO_STRING)                                      \
            default:                                                                 \
                return "unknown";                                                    \
        }                                                                            \
    }
