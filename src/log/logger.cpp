/**
 * @file logger.cpp
 * @brief Built-in logger backend implementation
 * @brief 内置日志后端实现
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#include "cpputil/log/logger.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include <fmt/format.h>

namespace cpputil {
namespace log {

namespace {

/// Upper bound for Flush() to wait on the writer / Flush() 等待写入线程的上限
constexpr std::chrono::milliseconds kFlushWait{5000};

std::shared_ptr<Sink> MakeSink(const AppenderSpec& spec, Status& status) {
    if (spec.kind == AppenderKind::Console) {
        auto stream = spec.stream == ConsoleTarget::StdOut ? ConsoleSink::Stream::StdOut
                                                           : ConsoleSink::Stream::StdErr;
        return std::make_shared<ConsoleSink>(stream, spec.color);
    }

    auto sink = std::make_shared<FileSink>(spec.path, spec.append);
    if (sink->HasError()) {
        status = Status(ErrorCode::FileOpenFailed,
                        fmt::format("{} ({})", spec.path, sink->GetLastError()));
        return nullptr;
    }
    if (spec.kind == AppenderKind::RollingFile) {
        sink->SetMaxSize(spec.maxSize);
        sink->SetMaxFiles(spec.maxFiles);
    }
    return sink;
}

}  // namespace

Logger::Logger(Level level, size_t queueCapacity)
    : m_level(level)
    , m_writer(std::make_unique<WriterThread>(
          [this](const LogRecord& record) { Dispatch(record); }, queueCapacity)) {}

Logger::~Logger() {
    Close();
}

Status Logger::Create(const LoggingPlan& plan, std::shared_ptr<Logger>& logger) {
    auto result = std::make_shared<Logger>(plan.rootLevel);

    for (const auto& spec : plan.appenders) {
        Status status;
        auto sink = MakeSink(spec, status);
        if (!sink) {
            return status;
        }

        Appender appender;
        appender.name = spec.name;
        appender.sink = std::move(sink);
        appender.format = std::make_shared<PatternFormat>(
            spec.pattern.empty() ? std::string(PatternFormat::kDefaultPattern) : spec.pattern);
        appender.threshold = spec.threshold;
        result->AddAppender(std::move(appender));
    }

    result->Start();
    logger = std::move(result);
    return Status::Ok();
}

void Logger::AddAppender(Appender appender) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_started.load(std::memory_order_acquire) || !appender.sink || !appender.format) {
        return;
    }
    m_appenders.push_back(std::move(appender));
}

void Logger::Start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_started.load(std::memory_order_acquire) || m_closed.load(std::memory_order_acquire)) {
        return;
    }
    m_writer->Start();
    m_started.store(true, std::memory_order_release);
}

bool Logger::Log(Level level, std::string_view message) noexcept {
    if (!ShouldLog(level) || m_closed.load(std::memory_order_acquire)) {
        return false;
    }

    try {
        if (m_writer->TryPush(MakeRecord(level, std::string(message)))) {
            return true;
        }
    } catch (const std::exception&) {
        // Counted below / 在下方计数
    }
    m_dropped.fetch_add(1, std::memory_order_relaxed);
    return false;
}

void Logger::Flush() {
    if (m_started.load(std::memory_order_acquire) && !m_writer->WaitUntilDrained(kFlushWait)) {
        return;
    }
    FlushSinks();
}

void Logger::Close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    // Stop drains whatever is still queued / Stop 会排空仍在排队的记录
    m_writer->Stop();

    FlushSinks();
    for (auto& appender : m_appenders) {
        appender.sink->Close();
    }
}

void Logger::FlushSinks() {
    for (auto& appender : m_appenders) {
        if (!appender.sink->Flush()) {
            m_dropped.fetch_add(1, std::memory_order_relaxed);
        }
    }
}

void Logger::Dispatch(const LogRecord& record) {
    for (auto& appender : m_appenders) {
        if (!PassesThreshold(record.level, appender.threshold)) {
            continue;
        }
        bool written = false;
        try {
            written = appender.sink->Write(record.level, appender.format->FormatRecord(record));
        } catch (const std::exception&) {
            // Counted below / 在下方计数
        }
        if (!written) {
            m_dropped.fetch_add(1, std::memory_order_relaxed);
        }
    }
}

}  // namespace log
}  // namespace cpputil
