/**
 * @file backend.hpp
 * @brief Backend interface behind the logging facade
 * @brief 日志门面背后的后端接口
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#pragma once

#include "cpputil/features.hpp"

#if !CPPUTIL_HAS_LOG
#error "cpputil/log/backend.hpp requires CPPUTIL_FEATURE_LOG"
#endif

#include <cstdint>
#include <memory>
#include <string_view>

#include "cpputil/common.hpp"
#include "cpputil/log/config.hpp"

namespace cpputil {
namespace log {

/**
 * @brief A constructed, ready-to-use logging backend
 * @brief 已构建、可直接使用的日志后端
 *
 * Backends are built from a LoggingPlan by MakeBackend() and owned by the
 * facade. Log() must not throw; failures are counted in DroppedCount().
 * 后端由 MakeBackend() 根据 LoggingPlan 构建，由门面持有。
 * Log() 不得抛出异常；失败计入 DroppedCount()。
 */
class Backend {
public:
    virtual ~Backend() = default;

    /// "builtin" or "spdlog" / "builtin" 或 "spdlog"
    virtual std::string_view Name() const = 0;

    /// Root level / 根级别
    virtual Level GetLevel() const = 0;

    bool ShouldLog(Level level) const { return PassesThreshold(level, GetLevel()); }

    /**
     * @brief Hand one message to every appender whose threshold it meets
     * @brief 将消息交给所有满足阈值的输出器
     *
     * @return true if the record was accepted / 记录被接受则返回 true
     */
    virtual bool Log(Level level, std::string_view message) noexcept = 0;

    /**
     * @brief Flush pending output
     * @brief 刷新待处理的输出
     */
    virtual void Flush() = 0;

    /**
     * @brief Flush and release every resource; the backend is unusable afterwards
     * @brief 刷新并释放所有资源；之后后端不可再用
     */
    virtual void Close() = 0;

    virtual uint64_t DroppedCount() const = 0;
};

/**
 * @brief Build the backend a plan asks for
 * @brief 构建计划所请求的后端
 *
 * Errors / 错误:
 * - NotSupported: the plan asks for spdlog and CPPUTIL_FEATURE_LOG_SPDLOG is off
 * - FileOpenFailed: a file appender could not be opened (message names the path)
 */
Status MakeBackend(const LoggingPlan& plan, std::shared_ptr<Backend>& backend);

}  // namespace log
}  // namespace cpputil
