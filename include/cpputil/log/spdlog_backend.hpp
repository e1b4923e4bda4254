/**
 * @file spdlog_backend.hpp
 * @brief spdlog-based logger backend
 * @brief 基于 spdlog 的日志后端
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#pragma once

#include "cpputil/features.hpp"

#if !CPPUTIL_HAS_LOG_SPDLOG
#error "cpputil/log/spdlog_backend.hpp requires CPPUTIL_FEATURE_LOG_SPDLOG"
#endif

#include <atomic>
#include <cstdint>
#include <memory>
#include <string_view>

#include <spdlog/logger.h>

#include "cpputil/common.hpp"
#include "cpputil/log/backend.hpp"
#include "cpputil/log/config.hpp"

namespace cpputil {
namespace log {

/**
 * @brief Map a cpputil level to the spdlog level
 * @brief 将 cpputil 级别映射到 spdlog 级别
 */
constexpr spdlog::level::level_enum ToSpdlogLevel(Level level) noexcept {
    switch (level) {
        case Level::Trace:
            return spdlog::level::trace;
        case Level::Debug:
            return spdlog::level::debug;
        case Level::Info:
            return spdlog::level::info;
        case Level::Warn:
            return spdlog::level::warn;
        case Level::Error:
            return spdlog::level::err;
        default:
            return spdlog::level::off;
    }
}

/**
 * @brief Backend writing through a private spdlog::logger
 * @brief 通过私有 spdlog::logger 写入的后端
 *
 * The logger is not registered in spdlog's global registry, so hosts that use
 * spdlog themselves are not affected. Sinks are the thread-safe `_mt` variants
 * and writes are synchronous.
 * 该日志器不注册到 spdlog 的全局注册表中，因此不影响自行使用 spdlog 的宿主程序。
 * Sink 均为线程安全的 `_mt` 版本，写入是同步的。
 */
class SpdlogBackend : public Backend {
public:
    /// Logger name inside spdlog / spdlog 中的日志器名称
    static constexpr const char* kLoggerName = "cpputil";

    SpdlogBackend(std::shared_ptr<spdlog::logger> logger, Level level);
    ~SpdlogBackend() override;

    /**
     * @brief Build an spdlog logger from a plan
     * @brief 根据计划构建 spdlog 日志器
     *
     * @return FileOpenFailed naming the path if a file sink cannot be opened
     */
    static Status Create(const LoggingPlan& plan, std::shared_ptr<SpdlogBackend>& backend);

    std::string_view Name() const override { return "spdlog"; }
    Level GetLevel() const override { return m_level; }

    bool Log(Level level, std::string_view message) noexcept override;
    void Flush() override;
    void Close() override;

    /// Records spdlog reported through its error handler / spdlog 通过错误处理器报告的记录数
    uint64_t DroppedCount() const override { return m_dropped->load(std::memory_order_relaxed); }

    const std::shared_ptr<spdlog::logger>& GetLogger() const { return m_logger; }

private:
    std::shared_ptr<spdlog::logger> m_logger;  ///< Private logger / 私有日志器
    Level m_level;                             ///< Root level / 根级别
    std::shared_ptr<std::atomic<uint64_t>> m_dropped;  ///< Shared with the error handler / 与错误处理器共享
    std::atomic<bool> m_closed{false};         ///< Closed flag / 已关闭标志
};

}  // namespace log
}  // namespace cpputil
