/**
 * @file writer_thread.hpp
 * @brief Background consumer for the built-in backend
 * @brief 内置后端的后台消费线程
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

#include "cpputil/log/record.hpp"

namespace cpputil {
namespace log {

/**
 * @brief Bounded FIFO of records drained by one worker thread
 * @brief 由单个工作线程排空的有界记录 FIFO
 *
 * Producers call TryPush() from any thread. The worker takes everything
 * queued so far in one swap and feeds it to the handler in push order.
 * A full queue rejects the incoming record; counting the drop is up to the caller.
 * 生产者可在任意线程调用 TryPush()。工作线程一次交换取走已排队的全部记录，
 * 并按推入顺序交给处理函数。队列满时拒绝新记录，由调用方负责计数。
 */
class WriterThread {
public:
    using Handler = std::function<void(const LogRecord&)>;

    static constexpr size_t kDefaultCapacity = 8192;

    /// @param capacity clamped to at least 1 / 至少为 1
    explicit WriterThread(Handler handler, size_t capacity = kDefaultCapacity);
    ~WriterThread();

    WriterThread(const WriterThread&) = delete;
    WriterThread& operator=(const WriterThread&) = delete;

    void Start();
    /// Drains what is queued, then joins / 排空已排队的记录后 join
    void Stop();

    bool TryPush(LogRecord record);

    /// @return false if records are still pending after @p timeout / 超时仍有待处理记录时返回 false
    bool WaitUntilDrained(std::chrono::milliseconds timeout);

    bool IsRunning() const;
    size_t GetCapacity() const { return m_capacity; }
    size_t Pending() const;

private:
    void Run();

    Handler m_handler;
    const size_t m_capacity;

    mutable std::mutex m_mutex;
    std::condition_variable m_wake;
    std::condition_variable m_idle;
    std::deque<LogRecord> m_queue;
    size_t m_busy{0};
    bool m_running{false};
    std::thread m_worker;
};

}  // namespace log
}  // namespace cpputil
