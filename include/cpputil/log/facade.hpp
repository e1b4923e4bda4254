/**
 * @file facade.hpp
 * @brief Process-wide logging facade
 * @brief 进程级日志门面
 *
 * Lifecycle / 生命周期:
 *   Uninitialized → Initialize() → Installed → Shutdown() → Uninitialized
 *
 * At most one backend is installed at a time. Log calls made while nothing is
 * installed are no-ops.
 * 同一时间最多安装一个后端。未安装时的日志调用为空操作。
 *
 * @code
 * auto status = cpputil::log::Initialize(cpputil::log::LoggerConfig::Inline("debug"));
 * if (!status) {
 *     std::fprintf(stderr, "%s\n", status.ToString().c_str());
 * }
 * cpputil::log::Info("listening on port {}", 8080);
 * cpputil::log::Log(cpputil::Level::Warn, "disk almost full", {{"path", "/var"}});
 * @endcode
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#pragma once

#include "cpputil/features.hpp"

#if !CPPUTIL_HAS_LOG
#error "cpputil/log/facade.hpp requires CPPUTIL_FEATURE_LOG"
#endif

#include <chrono>
#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "cpputil/common.hpp"
#include "cpputil/log/backend.hpp"
#include "cpputil/log/config.hpp"
#include "cpputil/log/record.hpp"

namespace cpputil {
namespace log {

/// Default upper bound for Shutdown() / Shutdown() 的默认等待上限
constexpr std::chrono::milliseconds kDefaultShutdownTimeout{2000};

// ==============================================================================
// Lifecycle / 生命周期
// ==============================================================================

/**
 * @brief Resolve the configuration, build a backend and install it
 * @brief 解析配置、构建后端并安装
 *
 * Concurrent callers are serialized; exactly one can succeed. A failure
 * installs nothing.
 * 并发调用会被串行化，只有一个能成功。失败时不安装任何内容。
 *
 * The first successful call also registers std::atexit, std::at_quick_exit and
 * std::terminate handlers that call Shutdown().
 * 第一次成功调用还会注册调用 Shutdown() 的 std::atexit、std::at_quick_exit
 * 和 std::terminate 处理函数。
 *
 * @return Ok, or one of / 成功，或以下之一:
 * - ConfigFileNotFound, ConfigParseError, ConfigMissingRequired
 * - ConfigInvalidValue (names the value / 指明出错值)
 * - FileOpenFailed (names the path / 指明路径)
 * - NotSupported (names the missing capability / 指明缺失的能力)
 * - AlreadyInitialized
 */
Status Initialize(const LoggerConfig& config);

/**
 * @brief Detach the installed backend, then flush and close it
 * @brief 卸载已安装的后端，然后刷新并关闭
 *
 * Log calls after the detach are no-ops. Waits at most `timeout` for the
 * backend to finish.
 * 卸载后的日志调用为空操作。最多等待 `timeout` 让后端完成。
 *
 * @return FlushTimeout if the deadline passed, Ok otherwise (also when nothing
 *         is installed) / 超时返回 FlushTimeout，否则返回成功（未安装时也成功）
 */
Status Shutdown(std::chrono::milliseconds timeout = kDefaultShutdownTimeout);

bool IsInitialized() noexcept;

/**
 * @brief Get the installed root level, Level::Off when nothing is installed
 * @brief 获取已安装的根级别，未安装时返回 Level::Off
 */
Level GetLevel() noexcept;

/**
 * @brief Check if a record at `level` would be handed to the backend
 * @brief 检查 `level` 级别的记录是否会交给后端
 */
bool ShouldLog(Level level) noexcept;

/**
 * @brief Flush the installed backend, if any
 * @brief 刷新已安装的后端（如有）
 */
void Flush();

/**
 * @brief Records that were accepted but could not be written
 * @brief 已接受但未能写出的记录数
 */
uint64_t DroppedCount() noexcept;

/**
 * @brief The installed backend, nullptr when nothing is installed
 * @brief 已安装的后端，未安装时为 nullptr
 */
std::shared_ptr<Backend> GetBackend();

// ==============================================================================
// Logging / 日志记录
// ==============================================================================

/**
 * @brief Log a message with optional key/value context
 * @brief 记录一条消息，可附带键值上下文
 *
 * Never throws and never reports errors.
 * 从不抛出异常，也不报告错误。
 *
 * @return true if the record was handed to the backend / 记录交给后端则返回 true
 */
bool Log(Level level, std::string_view message, const Context& context = {}) noexcept;

namespace detail {

/**
 * @brief Install an already built backend through the install-once gate
 * @brief 通过单次安装闸门安装已构建的后端
 *
 * Initialize() ends here after building its backend. Same results:
 * AlreadyInitialized while another backend is installed, and the exit
 * handlers are registered on the first success.
 * Initialize() 构建后端后也经由此处安装。结果相同：已有后端时返回
 * AlreadyInitialized，首次成功时注册退出处理函数。
 */
Status Install(std::shared_ptr<Backend> backend);

/**
 * @brief Format and log; format errors are counted as drops
 * @brief 格式化并记录；格式化错误计为丢弃
 */
bool VLog(Level level, fmt::string_view format, fmt::format_args args) noexcept;

/**
 * @brief Same as VLog, with "<tag> - " in front of the message
 * @brief 与 VLog 相同，消息前加 "<tag> - "
 */
bool VLogTagged(Level level, std::string_view tag, fmt::string_view format,
                fmt::format_args args) noexcept;

}  // namespace detail

template <typename... Args>
bool Trace(fmt::format_string<Args...> format, Args&&... args) {
    if (!ShouldLog(Level::Trace)) {
        return false;
    }
    return detail::VLog(Level::Trace, fmt::string_view(format), fmt::make_format_args(args...));
}

template <typename... Args>
bool Debug(fmt::format_string<Args...> format, Args&&... args) {
    if (!ShouldLog(Level::Debug)) {
        return false;
    }
    return detail::VLog(Level::Debug, fmt::string_view(format), fmt::make_format_args(args...));
}

template <typename... Args>
bool Info(fmt::format_string<Args...> format, Args&&... args) {
    if (!ShouldLog(Level::Info)) {
        return false;
    }
    return detail::VLog(Level::Info, fmt::string_view(format), fmt::make_format_args(args...));
}

template <typename... Args>
bool Warn(fmt::format_string<Args...> format, Args&&... args) {
    if (!ShouldLog(Level::Warn)) {
        return false;
    }
    return detail::VLog(Level::Warn, fmt::string_view(format), fmt::make_format_args(args...));
}

template <typename... Args>
bool Error(fmt::format_string<Args...> format, Args&&... args) {
    if (!ShouldLog(Level::Error)) {
        return false;
    }
    return detail::VLog(Level::Error, fmt::string_view(format), fmt::make_format_args(args...));
}

// ==============================================================================
// ScopedLogging / 作用域日志
// ==============================================================================

/**
 * @brief RAII guard: initializes on construction, shuts down on destruction
 * @brief RAII 守卫：构造时初始化，析构时关闭
 *
 * Only a guard whose initialization succeeded shuts the logger down.
 * 只有初始化成功的守卫才会关闭日志器。
 *
 * @code
 * int main() {
 *     cpputil::log::ScopedLogging logging(cpputil::log::LoggerConfig::Inline("info"));
 *     if (!logging.IsOk()) {
 *         return 1;
 *     }
 *     cpputil::log::Info("started");
 * }
 * @endcode
 */
class ScopedLogging {
public:
    explicit ScopedLogging(const LoggerConfig& config,
                           std::chrono::milliseconds shutdownTimeout = kDefaultShutdownTimeout);
    ~ScopedLogging();

    ScopedLogging(const ScopedLogging&) = delete;
    ScopedLogging& operator=(const ScopedLogging&) = delete;

    const Status& GetStatus() const { return m_status; }
    bool IsOk() const { return m_status.IsOk(); }

private:
    Status m_status;                       ///< Initialization result / 初始化结果
    std::chrono::milliseconds m_timeout;   ///< Shutdown timeout / 关闭超时
};

}  // namespace log
}  // namespace cpputil
