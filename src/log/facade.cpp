/**
 * @file facade.cpp
 * @brief Process-wide logging facade implementation
 * @brief 进程级日志门面实现
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#include "cpputil/log/facade.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <future>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace cpputil {
namespace log {

// ==============================================================================
// Global State / 全局状态
// ==============================================================================

namespace {

/**
 * @brief The install-once gate and the installed backend
 * @brief 单次安装闸门以及已安装的后端
 *
 * `mutex` serializes installs and shutdowns. Log calls never take it: they
 * read `installed` and load `backend` with the atomic shared_ptr functions.
 * `mutex` 串行化安装与关闭。日志调用从不获取它：它们读取 `installed`，
 * 并以 shared_ptr 原子函数加载 `backend`。
 */
struct FacadeState {
    std::mutex mutex;                                   ///< Install gate / 安装闸门
    std::shared_ptr<Backend> backend;                   ///< Atomic access only / 仅原子访问
    std::atomic<bool> installed{false};                 ///< Fast path flag / 快速路径标志
    std::atomic<Level> level{Level::Off};               ///< Cached root level / 缓存的根级别
    std::atomic<uint64_t> dropped{0};                   ///< Facade-side drops / 门面侧丢弃数
};

FacadeState& State() {
    static FacadeState state;
    return state;
}

std::shared_ptr<Backend> CurrentBackend() {
    return std::atomic_load_explicit(&State().backend, std::memory_order_acquire);
}

std::terminate_handler g_previousTerminate = nullptr;

void ReportShutdownFailure(const Status& status) {
    std::fprintf(stderr, "cpputil: logger shutdown failed: %s\n", status.ToString().c_str());
}

void ShutdownAtExit() {
    Status status = Shutdown();
    if (!status) {
        ReportShutdownFailure(status);
    }
}

[[noreturn]] void ShutdownOnTerminate() {
    ShutdownAtExit();
    if (g_previousTerminate != nullptr) {
        g_previousTerminate();
    }
    std::abort();
}

void RegisterExitHandlers() {
    static std::once_flag once;
    std::call_once(once, [] {
        std::atexit(&ShutdownAtExit);
        std::at_quick_exit(&ShutdownAtExit);
        g_previousTerminate = std::set_terminate(&ShutdownOnTerminate);
    });
}

}  // namespace

// ==============================================================================
// Lifecycle / 生命周期
// ==============================================================================

namespace {

Status AlreadyInstalled(const Backend& backend) {
    return Status(ErrorCode::AlreadyInitialized,
                  fmt::format("a '{}' logger is already installed", backend.Name()));
}

// Caller holds state.mutex / 调用方持有 state.mutex
void Publish(FacadeState& state, std::shared_ptr<Backend> backend) {
    state.level.store(backend->GetLevel(), std::memory_order_release);
    std::atomic_store_explicit(&state.backend, std::move(backend), std::memory_order_release);
    state.installed.store(true, std::memory_order_release);
}

}  // namespace

Status Initialize(const LoggerConfig& config) {
    auto& state = State();
    std::lock_guard<std::mutex> lock(state.mutex);

    // Checked before building so a losing caller opens no files
    // 在构建前检查，使失败的调用方不会打开任何文件
    if (auto current = CurrentBackend()) {
        return AlreadyInstalled(*current);
    }

    try {
        LoggingPlan plan;
        Status status = ResolvePlan(config, plan);
        if (!status) {
            return status;
        }

        std::shared_ptr<Backend> backend;
        status = MakeBackend(plan, backend);
        if (!status) {
            return status;
        }
        Publish(state, std::move(backend));
    } catch (const std::exception& e) {
        return Status(ErrorCode::InternalError, e.what());
    }

    RegisterExitHandlers();
    return Status::Ok();
}

namespace detail {

Status Install(std::shared_ptr<Backend> backend) {
    if (!backend) {
        return Status(ErrorCode::InternalError, "cannot install a null backend");
    }
    auto& state = State();
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (auto current = CurrentBackend()) {
            return AlreadyInstalled(*current);
        }
        Publish(state, std::move(backend));
    }
    RegisterExitHandlers();
    return Status::Ok();
}

}  // namespace detail

Status Shutdown(std::chrono::milliseconds timeout) {
    auto& state = State();
    std::shared_ptr<Backend> backend;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        state.installed.store(false, std::memory_order_release);
        state.level.store(Level::Off, std::memory_order_release);
        backend = std::atomic_exchange_explicit(&state.backend, std::shared_ptr<Backend>(),
                                                std::memory_order_acq_rel);
    }

    if (!backend) {
        return Status::Ok();
    }

    // Close on a helper thread so a stuck sink cannot hold the caller past the
    // deadline. The helper keeps the backend alive until Close() returns.
    // 在辅助线程上关闭，避免卡住的 Sink 让调用方超过截止时间。
    // 辅助线程在 Close() 返回前保持后端存活。
    auto done = std::make_shared<std::promise<void>>();
    std::future<void> finished = done->get_future();
    try {
        std::thread([backend, done] {
            try {
                backend->Close();
                done->set_value();
            } catch (const std::exception&) {
                done->set_exception(std::current_exception());
            }
        }).detach();
    } catch (const std::system_error&) {
        // No thread available, close inline / 无法创建线程，直接关闭
        backend->Close();
        return Status::Ok();
    }
    backend.reset();

    if (finished.wait_for(timeout) == std::future_status::timeout) {
        return Status(ErrorCode::FlushTimeout,
                      fmt::format("backend did not close within {} ms", timeout.count()));
    }
    try {
        finished.get();
    } catch (const std::exception& e) {
        return Status(ErrorCode::InternalError, e.what());
    }
    return Status::Ok();
}

bool IsInitialized() noexcept {
    return State().installed.load(std::memory_order_acquire);
}

Level GetLevel() noexcept {
    return State().level.load(std::memory_order_acquire);
}

bool ShouldLog(Level level) noexcept {
    return IsInitialized() && PassesThreshold(level, GetLevel());
}

void Flush() {
    auto backend = CurrentBackend();
    if (backend) {
        backend->Flush();
    }
}

uint64_t DroppedCount() noexcept {
    auto& state = State();
    uint64_t count = state.dropped.load(std::memory_order_relaxed);
    if (auto backend = CurrentBackend()) {
        count += backend->DroppedCount();
    }
    return count;
}

std::shared_ptr<Backend> GetBackend() {
    return CurrentBackend();
}

// ==============================================================================
// Logging / 日志记录
// ==============================================================================

bool Log(Level level, std::string_view message, const Context& context) noexcept {
    if (!ShouldLog(level)) {
        return false;
    }

    auto backend = CurrentBackend();
    if (!backend) {
        return false;
    }
    if (context.empty()) {
        return backend->Log(level, message);
    }

    try {
        return backend->Log(level, RenderMessage(message, context));
    } catch (const std::exception&) {
        State().dropped.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
}

namespace detail {

bool VLog(Level level, fmt::string_view format, fmt::format_args args) noexcept {
    try {
        std::string message = fmt::vformat(format, args);
        return Log(level, message);
    } catch (const std::exception&) {
        State().dropped.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
}

bool VLogTagged(Level level, std::string_view tag, fmt::string_view format,
                fmt::format_args args) noexcept {
    try {
        fmt::memory_buffer buffer;
        fmt::format_to(std::back_inserter(buffer), "{} - ", tag);
        fmt::vformat_to(std::back_inserter(buffer), format, args);
        return Log(level, std::string_view(buffer.data(), buffer.size()));
    } catch (const std::exception&) {
        State().dropped.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
}

}  // namespace detail

// ==============================================================================
// ScopedLogging / 作用域日志
// ==============================================================================

ScopedLogging::ScopedLogging(const LoggerConfig& config, std::chrono::milliseconds shutdownTimeout)
    : m_status(Initialize(config))
    , m_timeout(shutdownTimeout) {}

ScopedLogging::~ScopedLogging() {
    if (!m_status.IsOk()) {
        return;
    }
    Status status = Shutdown(m_timeout);
    if (!status) {
        ReportShutdownFailure(status);
    }
}

}  // namespace log
}  // namespace cpputil
