/**
 * @file spdlog_backend.cpp
 * @brief spdlog-based logger backend implementation
 * @brief 基于 spdlog 的日志后端实现
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#include "cpputil/log/spdlog_backend.hpp"

#include <exception>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/common.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace cpputil {
namespace log {

namespace {

void EnsureDirectoryExists(const std::string& filePath) {
    std::filesystem::path path(filePath);
    if (path.has_parent_path()) {
        std::error_code ec;
        // A failure here surfaces as an open error from the sink
        // 此处失败会以 Sink 打开错误的形式体现
        std::filesystem::create_directories(path.parent_path(), ec);
    }
}

spdlog::sink_ptr CreateConsoleSink(const AppenderSpec& spec) {
    auto mode = spec.color ? spdlog::color_mode::automatic : spdlog::color_mode::never;
    if (spec.stream == ConsoleTarget::StdOut) {
        return std::make_shared<spdlog::sinks::stdout_color_sink_mt>(mode);
    }
    return std::make_shared<spdlog::sinks::stderr_color_sink_mt>(mode);
}

spdlog::sink_ptr CreateSink(const AppenderSpec& spec) {
    spdlog::sink_ptr sink;
    switch (spec.kind) {
        case AppenderKind::Console:
            sink = CreateConsoleSink(spec);
            break;
        case AppenderKind::File:
            EnsureDirectoryExists(spec.path);
            sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(spec.path, !spec.append);
            break;
        case AppenderKind::RollingFile:
            EnsureDirectoryExists(spec.path);
            sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                spec.path, spec.maxSize, spec.maxFiles);
            break;
    }

    sink->set_level(ToSpdlogLevel(spec.threshold));
    if (!spec.pattern.empty()) {
        sink->set_pattern(spec.pattern);
    }
    return sink;
}

}  // namespace

SpdlogBackend::SpdlogBackend(std::shared_ptr<spdlog::logger> logger, Level level)
    : m_logger(std::move(logger))
    , m_level(level)
    , m_dropped(std::make_shared<std::atomic<uint64_t>>(0)) {
    // Sink failures are counted instead of going to spdlog's default stderr report.
    // Sink 失败只计数，不走 spdlog 默认的 stderr 报告。
    m_logger->set_error_handler([dropped = m_dropped](const std::string& /*message*/) {
        dropped->fetch_add(1, std::memory_order_relaxed);
    });
}

SpdlogBackend::~SpdlogBackend() {
    Close();
}

Status SpdlogBackend::Create(const LoggingPlan& plan, std::shared_ptr<SpdlogBackend>& backend) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.reserve(plan.appenders.size());

    for (const auto& spec : plan.appenders) {
        try {
            sinks.push_back(CreateSink(spec));
        } catch (const spdlog::spdlog_ex& e) {
            return Status(ErrorCode::FileOpenFailed, fmt::format("{} ({})", spec.path, e.what()));
        }
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(ToSpdlogLevel(plan.rootLevel));
    logger->flush_on(spdlog::level::err);

    backend = std::make_shared<SpdlogBackend>(std::move(logger), plan.rootLevel);
    return Status::Ok();
}

bool SpdlogBackend::Log(Level level, std::string_view message) noexcept {
    if (!ShouldLog(level) || m_closed.load(std::memory_order_acquire)) {
        return false;
    }
    try {
        m_logger->log(spdlog::source_loc{}, ToSpdlogLevel(level),
                      spdlog::string_view_t(message.data(), message.size()));
        return true;
    } catch (const std::exception&) {
        m_dropped->fetch_add(1, std::memory_order_relaxed);
        return false;
    }
}

void SpdlogBackend::Flush() {
    m_logger->flush();
}

void SpdlogBackend::Close() {
    if (m_closed.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    m_logger->flush();
}

}  // namespace log
}  // namespace cpputil
