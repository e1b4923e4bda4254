/**
 * @file logger.hpp
 * @brief Built-in asynchronous logger backend
 * @brief 内置异步日志后端
 *
 * Data flow / 数据流:
 *   Log() → LogRecord → WriterThread queue → Format → Sink
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#pragma once

#include "cpputil/features.hpp"

#if !CPPUTIL_HAS_LOG
#error "cpputil/log/logger.hpp requires CPPUTIL_FEATURE_LOG"
#endif

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "cpputil/common.hpp"
#include "cpputil/log/backend.hpp"
#include "cpputil/log/config.hpp"
#include "cpputil/log/format.hpp"
#include "cpputil/log/sink.hpp"
#include "cpputil/log/writer_thread.hpp"

namespace cpputil {
namespace log {

/**
 * @brief A sink paired with its format and threshold
 * @brief 与格式和阈值配对的 Sink
 */
struct Appender {
    std::string name;                ///< Appender name / 输出器名称
    std::shared_ptr<Sink> sink;      ///< Output target / 输出目标
    std::shared_ptr<Format> format;  ///< Formatter / 格式化器
    Level threshold{Level::Trace};   ///< Appender threshold / 输出器阈值
};

/**
 * @brief Built-in logger backend
 * @brief 内置日志后端
 *
 * Records below the root level are rejected on the calling thread. Accepted
 * records are queued and written by a single WriterThread, so per-thread order
 * is preserved. When the queue is full the newest record is dropped and counted.
 *
 * 低于根级别的记录在调用线程上被拒绝。被接受的记录入队，由单个 WriterThread
 * 写出，因此保持每个线程内的顺序。队列满时丢弃最新记录并计数。
 */
class Logger : public Backend {
public:
    /**
     * @brief Construct a logger
     * @brief 构造日志器
     *
     * @param level Root level / 根级别
     * @param queueCapacity Writer queue capacity / 写入队列容量
     */
    explicit Logger(Level level = Level::Info,
                    size_t queueCapacity = WriterThread::kDefaultCapacity);

    ~Logger() override;

    // Non-copyable
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Build and start a logger from a plan
     * @brief 根据计划构建并启动日志器
     *
     * @return FileOpenFailed naming the path if a file appender cannot be opened
     */
    static Status Create(const LoggingPlan& plan, std::shared_ptr<Logger>& logger);

    /**
     * @brief Add an appender; ignored once the logger is started
     * @brief 添加输出器；启动后忽略
     */
    void AddAppender(Appender appender);

    /**
     * @brief Start the writer thread
     * @brief 启动写入线程
     */
    void Start();

    std::string_view Name() const override { return "builtin"; }

    Level GetLevel() const override { return m_level.load(std::memory_order_acquire); }
    void SetLevel(Level level) { m_level.store(level, std::memory_order_release); }

    bool Log(Level level, std::string_view message) noexcept override;

    /**
     * @brief Wait for queued records to be written, then flush every sink
     * @brief 等待排队记录写出，然后刷新所有 Sink
     */
    void Flush() override;

    /**
     * @brief Drain the queue, stop the writer thread and close every sink
     * @brief 排空队列、停止写入线程并关闭所有 Sink
     */
    void Close() override;

    /// Queue overflows plus failed sink writes and flushes / 队列溢出数加上 Sink 写入与刷新失败数
    uint64_t DroppedCount() const override { return m_dropped.load(std::memory_order_relaxed); }

    size_t AppenderCount() const { return m_appenders.size(); }
    const std::vector<Appender>& GetAppenders() const { return m_appenders; }

private:
    void Dispatch(const LogRecord& record);
    void FlushSinks();

    std::atomic<Level> m_level;                ///< Root level / 根级别
    std::vector<Appender> m_appenders;         ///< Fixed after Start() / Start() 后固定
    std::unique_ptr<WriterThread> m_writer;    ///< Background writer / 后台写入线程
    std::atomic<uint64_t> m_dropped{0};        ///< Dropped records / 丢弃的记录数
    std::atomic<bool> m_started{false};        ///< Started flag / 已启动标志
    std::atomic<bool> m_closed{false};         ///< Closed flag / 已关闭标志
    std::mutex m_mutex;                        ///< Guards lifecycle / 保护生命周期
};

}  // namespace log
}  // namespace cpputil
