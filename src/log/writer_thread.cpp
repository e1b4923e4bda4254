/**
 * @file writer_thread.cpp
 * @brief WriterThread implementation
 * @brief WriterThread 实现
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#include "cpputil/log/writer_thread.hpp"

#include <utility>

namespace cpputil {
namespace log {

WriterThread::WriterThread(Handler handler, size_t capacity)
    : m_handler(std::move(handler))
    , m_capacity(capacity == 0 ? 1 : capacity) {}

WriterThread::~WriterThread() {
    Stop();
}

void WriterThread::Start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running) {
        return;
    }
    m_running = true;
    m_worker = std::thread([this] { Run(); });
}

void WriterThread::Stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return;
        }
        m_running = false;
    }
    m_wake.notify_all();
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

bool WriterThread::IsRunning() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running;
}

bool WriterThread::TryPush(LogRecord record) {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_running || m_queue.size() >= m_capacity) {
        return false;
    }
    m_queue.push_back(std::move(record));
    lock.unlock();
    m_wake.notify_one();
    return true;
}

bool WriterThread::WaitUntilDrained(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idle.wait_for(lock, timeout, [this] { return m_queue.empty() && m_busy == 0; });
}

size_t WriterThread::Pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size() + m_busy;
}

void WriterThread::Run() {
    std::deque<LogRecord> batch;
    std::unique_lock<std::mutex> lock(m_mutex);

    for (;;) {
        m_wake.wait(lock, [this] { return !m_queue.empty() || !m_running; });
        if (m_queue.empty()) {
            break;
        }

        batch.swap(m_queue);
        m_busy = batch.size();
        lock.unlock();

        for (const LogRecord& record : batch) {
            m_handler(record);
        }
        batch.clear();

        lock.lock();
        m_busy = 0;
        m_idle.notify_all();
    }
    m_idle.notify_all();
}

}  // namespace log
}  // namespace cpputil
