/**
 * @file macros.hpp
 * @brief Logging macros for cpputil
 * @brief cpputil 日志宏定义
 *
 * The expansion depends on the enabled capabilities:
 * 宏的展开取决于启用的能力：
 *
 * - CPPUTIL_FEATURE_LOG on: forward to cpputil::log (arguments are evaluated
 *   only when the level is enabled)
 *   启用 CPPUTIL_FEATURE_LOG：转发到 cpputil::log（仅在级别启用时求值参数）
 * - logging off, debug build: expand to nothing, arguments are not evaluated
 *   关闭日志，调试构建：展开为空，参数不求值
 * - logging off, release build (NDEBUG): compile error naming CPPUTIL_FEATURE_LOG
 *   关闭日志，发布构建（NDEBUG）：编译错误，指明 CPPUTIL_FEATURE_LOG
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#pragma once

#include "cpputil/features.hpp"

#if CPPUTIL_HAS_LOG
#include "cpputil/log/facade.hpp"
#endif

// ==============================================================================
// Compile-time floor / 编译期下限
// ==============================================================================

/**
 * @brief Call sites below this level are compiled out (0 = Trace ... 5 = Off)
 * @brief 低于此级别的调用点被编译移除（0 = Trace ... 5 = Off）
 */
#ifndef CPPUTIL_ACTIVE_LEVEL
#define CPPUTIL_ACTIVE_LEVEL 0
#endif

#if CPPUTIL_ACTIVE_LEVEL > 0 && !defined(CPPUTIL_DISABLE_TRACE)
#define CPPUTIL_DISABLE_TRACE
#endif

#if CPPUTIL_ACTIVE_LEVEL > 1 && !defined(CPPUTIL_DISABLE_DEBUG)
#define CPPUTIL_DISABLE_DEBUG
#endif

#if CPPUTIL_ACTIVE_LEVEL > 2 && !defined(CPPUTIL_DISABLE_INFO)
#define CPPUTIL_DISABLE_INFO
#endif

#if CPPUTIL_ACTIVE_LEVEL > 3 && !defined(CPPUTIL_DISABLE_WARN)
#define CPPUTIL_DISABLE_WARN
#endif

#if CPPUTIL_ACTIVE_LEVEL > 4 && !defined(CPPUTIL_DISABLE_ERROR)
#define CPPUTIL_DISABLE_ERROR
#endif

#if CPPUTIL_HAS_LOG

// ==============================================================================
// Level macros / 级别宏
// ==============================================================================

// CPPUTIL_<LEVEL>(fmt, args...) checks the installed threshold before the
// arguments are evaluated. Defining CPPUTIL_DISABLE_<LEVEL> removes the call.
// CPPUTIL_<LEVEL>(fmt, args...) 在求值参数前检查已安装的阈值。
// 定义 CPPUTIL_DISABLE_<LEVEL> 会移除该调用。
#define CPPUTIL_DETAIL_LOG_FMT(level, func, ...) \
    do { \
        if (::cpputil::log::ShouldLog(level)) { \
            (void)::cpputil::log::func(__VA_ARGS__); \
        } \
    } while (0)

#ifndef CPPUTIL_DISABLE_TRACE
#define CPPUTIL_TRACE(...) CPPUTIL_DETAIL_LOG_FMT(::cpputil::Level::Trace, Trace, __VA_ARGS__)
#else
#define CPPUTIL_TRACE(...) ((void)0)
#endif

#ifndef CPPUTIL_DISABLE_DEBUG
#define CPPUTIL_DEBUG(...) CPPUTIL_DETAIL_LOG_FMT(::cpputil::Level::Debug, Debug, __VA_ARGS__)
#else
#define CPPUTIL_DEBUG(...) ((void)0)
#endif

#ifndef CPPUTIL_DISABLE_INFO
#define CPPUTIL_INFO(...) CPPUTIL_DETAIL_LOG_FMT(::cpputil::Level::Info, Info, __VA_ARGS__)
#else
#define CPPUTIL_INFO(...) ((void)0)
#endif

#ifndef CPPUTIL_DISABLE_WARN
#define CPPUTIL_WARN(...) CPPUTIL_DETAIL_LOG_FMT(::cpputil::Level::Warn, Warn, __VA_ARGS__)
#else
#define CPPUTIL_WARN(...) ((void)0)
#endif

#ifndef CPPUTIL_DISABLE_ERROR
#define CPPUTIL_ERROR(...) CPPUTIL_DETAIL_LOG_FMT(::cpputil::Level::Error, Error, __VA_ARGS__)
#else
#define CPPUTIL_ERROR(...) ((void)0)
#endif

/**
 * @brief Log a plain message with optional context at a runtime level
 * @brief 以运行时级别记录纯文本消息，可附带上下文
 *
 * CPPUTIL_LOG(::cpputil::Level::Warn, "disk full", {{"path", "/var"}});
 */
#define CPPUTIL_LOG(level, ...) \
    do { \
        if (static_cast<int>(level) >= CPPUTIL_ACTIVE_LEVEL && ::cpputil::log::ShouldLog(level)) { \
            (void)::cpputil::log::Log(level, __VA_ARGS__); \
        } \
    } while (0)

// ==============================================================================
// Conditional forms / 条件形式
// ==============================================================================

#define CPPUTIL_TRACE_IF(condition, ...) \
    do { if (condition) { CPPUTIL_TRACE(__VA_ARGS__); } } while (0)

#define CPPUTIL_DEBUG_IF(condition, ...) \
    do { if (condition) { CPPUTIL_DEBUG(__VA_ARGS__); } } while (0)

#define CPPUTIL_INFO_IF(condition, ...) \
    do { if (condition) { CPPUTIL_INFO(__VA_ARGS__); } } while (0)

#define CPPUTIL_WARN_IF(condition, ...) \
    do { if (condition) { CPPUTIL_WARN(__VA_ARGS__); } } while (0)

#define CPPUTIL_ERROR_IF(condition, ...) \
    do { if (condition) { CPPUTIL_ERROR(__VA_ARGS__); } } while (0)

#elif defined(NDEBUG)

// ==============================================================================
// Release build without logging / 无日志能力的发布构建
// ==============================================================================

#define CPPUTIL_DETAIL_LOG_MISSING() \
    do { \
        static_assert(::cpputil::features::kLog, \
                      "logging call site compiled without a logging backend: " \
                      "enable CPPUTIL_FEATURE_LOG (or CPPUTIL_FEATURE_LOG_SPDLOG)"); \
    } while (0)

#define CPPUTIL_TRACE(...) CPPUTIL_DETAIL_LOG_MISSING()
#define CPPUTIL_DEBUG(...) CPPUTIL_DETAIL_LOG_MISSING()
#define CPPUTIL_INFO(...) CPPUTIL_DETAIL_LOG_MISSING()
#define CPPUTIL_WARN(...) CPPUTIL_DETAIL_LOG_MISSING()
#define CPPUTIL_ERROR(...) CPPUTIL_DETAIL_LOG_MISSING()
#define CPPUTIL_LOG(level, ...) CPPUTIL_DETAIL_LOG_MISSING()
#define CPPUTIL_TRACE_IF(condition, ...) CPPUTIL_DETAIL_LOG_MISSING()
#define CPPUTIL_DEBUG_IF(condition, ...) CPPUTIL_DETAIL_LOG_MISSING()
#define CPPUTIL_INFO_IF(condition, ...) CPPUTIL_DETAIL_LOG_MISSING()
#define CPPUTIL_WARN_IF(condition, ...) CPPUTIL_DETAIL_LOG_MISSING()
#define CPPUTIL_ERROR_IF(condition, ...) CPPUTIL_DETAIL_LOG_MISSING()

#else

// ==============================================================================
// Debug build without logging / 无日志能力的调试构建
// ==============================================================================

#define CPPUTIL_TRACE(...) ((void)0)
#define CPPUTIL_DEBUG(...) ((void)0)
#define CPPUTIL_INFO(...) ((void)0)
#define CPPUTIL_WARN(...) ((void)0)
#define CPPUTIL_ERROR(...) ((void)0)
#define CPPUTIL_LOG(level, ...) ((void)0)
#define CPPUTIL_TRACE_IF(condition, ...) ((void)0)
#define CPPUTIL_DEBUG_IF(condition, ...) ((void)0)
#define CPPUTIL_INFO_IF(condition, ...) ((void)0)
#define CPPUTIL_WARN_IF(condition, ...) ((void)0)
#define CPPUTIL_ERROR_IF(condition, ...) ((void)0)

#endif  // CPPUTIL_HAS_LOG
