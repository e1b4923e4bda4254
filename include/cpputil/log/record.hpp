/**
 * @file record.hpp
 * @brief Log record structure for cpputil
 * @brief cpputil 日志记录结构
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cpputil/common.hpp"

namespace cpputil {
namespace log {

// ==============================================================================
// Structured Context / 结构化上下文
// ==============================================================================

/// One key/value pair attached to a record / 附加到记录上的一个键值对
using Field = std::pair<std::string, std::string>;

/// Ordered key/value pairs, rendered as " key=value" / 有序键值对，渲染为 " key=value"
using Context = std::vector<Field>;

// ==============================================================================
// Log Record / 日志记录
// ==============================================================================

/**
 * @brief A single log record handed to a backend
 * @brief 交给后端的一条日志记录
 *
 * The message already carries the rendered context, so sinks and formatters
 * only deal with text.
 * 消息中已包含渲染后的上下文，因此 Sink 和格式化器只处理文本。
 */
struct LogRecord {
    uint64_t timestamp{0};     ///< Nanosecond timestamp / 纳秒级时间戳
    uint32_t threadId{0};      ///< Thread ID / 线程 ID
    uint32_t processId{0};     ///< Process ID / 进程 ID
    Level level{Level::Info};  ///< Log level / 日志级别
    std::string message;       ///< Message with context / 带上下文的消息
};

/**
 * @brief Build a record stamped with the current time, thread and process
 * @brief 构建带有当前时间、线程和进程信息的记录
 */
LogRecord MakeRecord(Level level, std::string message);

/**
 * @brief Append context pairs to a message
 * @brief 将上下文键值对追加到消息后
 *
 * "disk full" + {{"path", "/tmp"}} -> "disk full path=/tmp"
 */
std::string RenderMessage(std::string_view message, const Context& context);

/// Wall-clock time in nanoseconds since the Unix epoch / 自 Unix 纪元起的纳秒数
uint64_t GetNanosecondTimestamp();

/**
 * @brief OS-level id of the calling thread, cached per thread
 * @brief 调用线程的系统级 ID（按线程缓存）
 *
 * On Linux this is the kernel tid shown by `ps -L`; elsewhere a hash of
 * std::thread::id.
 * Linux 上为 `ps -L` 显示的内核 tid；其他平台为 std::thread::id 的哈希值。
 */
uint32_t GetCurrentThreadId();
uint32_t GetCurrentProcessId();

}  // namespace log
}  // namespace cpputil
