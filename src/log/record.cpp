/**
 * @file record.cpp
 * @brief Log record helpers
 * @brief 日志记录辅助函数
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#include "cpputil/log/record.hpp"

#include <chrono>
#include <functional>
#include <iterator>
#include <thread>

#include <fmt/format.h>

#if defined(__linux__)
#include <sys/syscall.h>
#include <unistd.h>
#elif defined(_WIN32)
#include <process.h>
#else
#include <unistd.h>
#endif

namespace cpputil {
namespace log {

namespace {

uint32_t QueryThreadId() {
#if defined(__linux__)
    return static_cast<uint32_t>(::syscall(SYS_gettid));
#else
    return static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
#endif
}

}  // namespace

LogRecord MakeRecord(Level level, std::string message) {
    LogRecord record;
    record.level = level;
    record.timestamp = GetNanosecondTimestamp();
    record.threadId = GetCurrentThreadId();
    record.processId = GetCurrentProcessId();
    record.message = std::move(message);
    return record;
}

std::string RenderMessage(std::string_view message, const Context& context) {
    fmt::memory_buffer out;
    out.append(message.data(), message.data() + message.size());
    for (const auto& [key, value] : context) {
        fmt::format_to(std::back_inserter(out), " {}={}", key, value);
    }
    return fmt::to_string(out);
}

uint64_t GetNanosecondTimestamp() {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count());
}

uint32_t GetCurrentThreadId() {
    thread_local const uint32_t id = QueryThreadId();
    return id;
}

uint32_t GetCurrentProcessId() {
#if defined(_WIN32)
    return static_cast<uint32_t>(::_getpid());
#else
    return static_cast<uint32_t>(::getpid());
#endif
}

}  // namespace log
}  // namespace cpputil
