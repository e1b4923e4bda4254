/**
 * @file features.hpp
 * @brief Compile-time capability resolution for cpputil
 * @brief cpputil 编译期能力解析
 *
 * The host program selects capabilities with preprocessor definitions (the CMake
 * options of the same name set them on the cpputil target):
 * 宿主程序通过预处理器定义选择能力（CMake 中同名选项会设置它们）：
 *
 * - CPPUTIL_FEATURE_LOG:        logging facade with the built-in backend / 日志门面与内置后端
 * - CPPUTIL_FEATURE_LOG_SPDLOG: spdlog backend, implies CPPUTIL_FEATURE_LOG / spdlog 后端，隐含 LOG
 * - CPPUTIL_FEATURE_MACROS:     helper macros / 辅助宏
 * - CPPUTIL_FEATURE_TYPES:      ByteOrder, Encoding and YAML glue / 类型与 YAML 转换
 * - CPPUTIL_FEATURE_PY:         Python-style With helpers / Python 风格的 With 辅助
 * - CPPUTIL_FEATURE_FULL:       all of the above / 以上全部
 *
 * After this header every capability is visible as CPPUTIL_HAS_<NAME> (0 or 1)
 * and as a constexpr flag in cpputil::features.
 * 包含此头文件后，每个能力都以 CPPUTIL_HAS_<NAME>（0 或 1）以及
 * cpputil::features 中的 constexpr 标志形式可见。
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#ifndef CPPUTIL_FEATURES_HPP
#define CPPUTIL_FEATURES_HPP

#include <array>
#include <cstddef>
#include <string_view>
#include <vector>

// ==============================================================================
// Aggregate and implied capabilities / 聚合与隐含能力
// ==============================================================================

#ifdef CPPUTIL_FEATURE_FULL
#ifndef CPPUTIL_FEATURE_LOG
#define CPPUTIL_FEATURE_LOG
#endif
#ifndef CPPUTIL_FEATURE_LOG_SPDLOG
#define CPPUTIL_FEATURE_LOG_SPDLOG
#endif
#ifndef CPPUTIL_FEATURE_MACROS
#define CPPUTIL_FEATURE_MACROS
#endif
#ifndef CPPUTIL_FEATURE_TYPES
#define CPPUTIL_FEATURE_TYPES
#endif
#ifndef CPPUTIL_FEATURE_PY
#define CPPUTIL_FEATURE_PY
#endif
#endif  // CPPUTIL_FEATURE_FULL

// The full backend is useless without the facade in front of it
// 完整后端依赖门面
#if defined(CPPUTIL_FEATURE_LOG_SPDLOG) && !defined(CPPUTIL_FEATURE_LOG)
#define CPPUTIL_FEATURE_LOG
#endif

// ==============================================================================
// Resolved capability macros / 解析后的能力宏
// ==============================================================================

#ifdef CPPUTIL_FEATURE_LOG
#define CPPUTIL_HAS_LOG 1
#else
#define CPPUTIL_HAS_LOG 0
#endif

#ifdef CPPUTIL_FEATURE_LOG_SPDLOG
#define CPPUTIL_HAS_LOG_SPDLOG 1
#else
#define CPPUTIL_HAS_LOG_SPDLOG 0
#endif

#ifdef CPPUTIL_FEATURE_MACROS
#define CPPUTIL_HAS_MACROS 1
#else
#define CPPUTIL_HAS_MACROS 0
#endif

#ifdef CPPUTIL_FEATURE_TYPES
#define CPPUTIL_HAS_TYPES 1
#else
#define CPPUTIL_HAS_TYPES 0
#endif

#ifdef CPPUTIL_FEATURE_PY
#define CPPUTIL_HAS_PY 1
#else
#define CPPUTIL_HAS_PY 0
#endif

namespace cpputil {
namespace features {

constexpr bool kLog = CPPUTIL_HAS_LOG != 0;              ///< Minimal logging / 基本日志
constexpr bool kLogSpdlog = CPPUTIL_HAS_LOG_SPDLOG != 0; ///< spdlog backend / spdlog 后端
constexpr bool kMacros = CPPUTIL_HAS_MACROS != 0;        ///< Helper macros / 辅助宏
constexpr bool kTypes = CPPUTIL_HAS_TYPES != 0;          ///< Types glue / 类型
constexpr bool kPy = CPPUTIL_HAS_PY != 0;                ///< With helpers / With 辅助

/// True when every capability is enabled / 所有能力均启用时为 true
constexpr bool kFull = kLog && kLogSpdlog && kMacros && kTypes && kPy;

static_assert(!kLogSpdlog || kLog,
              "cpputil: CPPUTIL_FEATURE_LOG_SPDLOG requires CPPUTIL_FEATURE_LOG");

/**
 * @brief Name and state of a single capability
 * @brief 单个能力的名称与状态
 */
struct Capability {
    std::string_view name;  ///< Capability name ("log", "log_spdlog", ...) / 能力名称
    bool enabled;           ///< Whether compiled in / 是否编译进来
};

/**
 * @brief All capabilities known to this build
 * @brief 此构建已知的所有能力
 */
constexpr std::array<Capability, 5> kCapabilities = {{
    {"log", kLog},
    {"log_spdlog", kLogSpdlog},
    {"macros", kMacros},
    {"types", kTypes},
    {"py", kPy},
}};

/**
 * @brief Check a capability by name at runtime
 * @brief 运行时按名称检查能力
 *
 * "full" is accepted and reports whether every capability is on.
 * 接受 "full"，表示是否所有能力都已启用。
 */
constexpr bool IsEnabled(std::string_view name) noexcept {
    if (name == "full") {
        return kFull;
    }
    for (const auto& capability : kCapabilities) {
        if (capability.name == name) {
            return capability.enabled;
        }
    }
    return false;
}

/**
 * @brief Names of the enabled capabilities, in declaration order
 * @brief 已启用能力的名称（按声明顺序）
 */
inline std::vector<std::string_view> EnabledNames() {
    std::vector<std::string_view> names;
    for (const auto& capability : kCapabilities) {
        if (capability.enabled) {
            names.push_back(capability.name);
        }
    }
    return names;
}

}  // namespace features
}  // namespace cpputil

#endif  // CPPUTIL_FEATURES_HPP
