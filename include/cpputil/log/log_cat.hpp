/**
 * @file log_cat.hpp
 * @brief Tagged logger routed through the facade
 * @brief 通过门面路由的带标签日志器
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#pragma once

#include "cpputil/features.hpp"

#if !CPPUTIL_HAS_LOG
#error "cpputil/log/log_cat.hpp requires CPPUTIL_FEATURE_LOG"
#endif

#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "cpputil/common.hpp"
#include "cpputil/log/facade.hpp"

namespace cpputil {
namespace log {

/**
 * @brief Logger that prefixes every message with "<tag> - "
 * @brief 为每条消息添加 "<tag> - " 前缀的日志器
 *
 * LogCat holds no backend of its own; it is cheap to copy and safe to share
 * between threads.
 * LogCat 不持有自己的后端；复制开销小，可在线程间共享。
 *
 * @code
 * cpputil::log::LogCat cat("APP");
 * cat.Info("started in {} ms", 42);    // "APP - started in 42 ms"
 * @endcode
 */
class LogCat {
public:
    explicit LogCat(std::string tag) : m_tag(std::move(tag)) {}

    const std::string& Tag() const { return m_tag; }

    bool Log(Level level, std::string_view message, const Context& context = {}) const {
        if (!ShouldLog(level)) {
            return false;
        }
        return ::cpputil::log::Log(level, Prefix(message), context);
    }

    template <typename... Args>
    bool Trace(fmt::format_string<Args...> format, Args&&... args) const {
        return Emit(Level::Trace, fmt::string_view(format), fmt::make_format_args(args...));
    }

    template <typename... Args>
    bool Debug(fmt::format_string<Args...> format, Args&&... args) const {
        return Emit(Level::Debug, fmt::string_view(format), fmt::make_format_args(args...));
    }

    template <typename... Args>
    bool Info(fmt::format_string<Args...> format, Args&&... args) const {
        return Emit(Level::Info, fmt::string_view(format), fmt::make_format_args(args...));
    }

    template <typename... Args>
    bool Warn(fmt::format_string<Args...> format, Args&&... args) const {
        return Emit(Level::Warn, fmt::string_view(format), fmt::make_format_args(args...));
    }

    template <typename... Args>
    bool Error(fmt::format_string<Args...> format, Args&&... args) const {
        return Emit(Level::Error, fmt::string_view(format), fmt::make_format_args(args...));
    }

private:
    std::string Prefix(std::string_view message) const {
        std::string result;
        result.reserve(m_tag.size() + 3 + message.size());
        result += m_tag;
        result += " - ";
        result += message;
        return result;
    }

    bool Emit(Level level, fmt::string_view format, fmt::format_args args) const {
        if (!ShouldLog(level)) {
            return false;
        }
        return detail::VLogTagged(level, m_tag, format, args);
    }

    std::string m_tag;  ///< Tag / 标签
};

}  // namespace log
}  // namespace cpputil
