/**
 * @file sink.hpp
 * @brief Appender targets used by the built-in backend
 * @brief 内置后端使用的 appender 目标
 *
 * A Sink receives one already-rendered line at a time. The built-in backend
 * owns one Sink per configured appender and calls it from the writer thread.
 * Sink 每次接收一行已渲染的文本。内置后端为每个 appender 持有一个 Sink，
 * 并在写线程中调用。
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#pragma once

#include <cstdio>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

#include "cpputil/common.hpp"

namespace cpputil {
namespace log {

/**
 * @brief Destination for rendered lines
 * @brief 渲染后文本行的输出目标
 *
 * Implementations never throw from Write(). A failure returns false, latches
 * HasError() and keeps a description in GetLastError().
 * 实现不会在 Write() 中抛出异常。失败时返回 false，置位 HasError() 并在
 * GetLastError() 中保留描述。
 */
class Sink {
public:
    virtual ~Sink() = default;

    /// Append @p line followed by a newline / 追加 @p line 并换行
    virtual bool Write(Level level, std::string_view line) = 0;
    /// @return false if buffered lines could not be written out / 缓冲内容无法写出时返回 false
    virtual bool Flush() = 0;
    virtual void Close() = 0;

    virtual bool HasError() const = 0;
    virtual std::string GetLastError() const = 0;
};

// ==============================================================================
// ConsoleSink
// ==============================================================================

/**
 * @brief Terminal appender
 * @brief 终端 appender
 *
 * Lines go to stdout or stderr. With color on, each line is wrapped in the
 * ANSI escape for its level and a trailing reset.
 * 输出到 stdout 或 stderr。开启颜色时，每行以对应级别的 ANSI 转义开头，并以重置码结尾。
 */
class ConsoleSink : public Sink {
public:
    enum class Stream { StdOut, StdErr };

    explicit ConsoleSink(Stream stream = Stream::StdErr, bool colorEnabled = false)
        : m_stream(stream)
        , m_colorEnabled(colorEnabled) {}

    bool Write(Level level, std::string_view line) override;
    bool Flush() override;
    void Close() override {}

    bool HasError() const override;
    std::string GetLastError() const override;

    void SetColorEnabled(bool enable) { m_colorEnabled = enable; }
    bool IsColorEnabled() const { return m_colorEnabled; }
    Stream GetStream() const { return m_stream; }

    /// Escape sequence for @p level; Off maps to the reset code
    /// @p level 对应的转义序列；Off 返回重置码
    static const char* GetLevelColor(Level level);
    static const char* GetResetColor();

private:
    std::FILE* Target() const;

    Stream m_stream;
    bool m_colorEnabled;
    bool m_hasError{false};
    std::string m_lastError;
    mutable std::mutex m_mutex;
};

// ==============================================================================
// FileSink
// ==============================================================================

/**
 * @brief File appender with optional size-based rolling
 * @brief 支持按大小滚动的文件 appender
 *
 * The constructor creates missing parent directories and opens the file.
 * It does not throw: a sink that could not open reports HasError().
 * 构造函数会创建缺失的父目录并打开文件。不会抛出异常：无法打开时 HasError() 为真。
 *
 * When a limit is set, a write that would push the file past it first moves
 * `name` to `name.1` (older backups shift up, the oldest beyond the limit is
 * removed) and reopens an empty `name`.
 * 设置上限后，若写入会超过上限，先将 `name` 移为 `name.1`（旧备份依次后移，
 * 超出数量的最旧备份被删除），再重新打开空的 `name`。
 */
class FileSink : public Sink {
public:
    /**
     * @param filename Log file path / 日志文件路径
     * @param append false truncates an existing file / 为 false 时截断已有文件
     */
    explicit FileSink(const std::string& filename, bool append = true);
    ~FileSink() override;

    bool Write(Level level, std::string_view line) override;
    bool Flush() override;
    void Close() override;

    bool HasError() const override;
    std::string GetLastError() const override;

    /// Size limit in bytes, 0 disables rolling / 字节上限，0 表示不滚动
    void SetMaxSize(size_t bytes);
    /// Number of backups kept, clamped to 1 / 保留的备份数，最少为 1
    void SetMaxFiles(size_t count);

    size_t GetCurrentSize() const;
    const std::string& GetFilename() const { return m_filename; }

private:
    void Open(bool append);
    void Roll();
    void Fail(std::string what);

    std::string m_filename;
    std::ofstream m_out;
    size_t m_limit{0};
    size_t m_backups{1};
    size_t m_written{0};
    bool m_hasError{false};
    std::string m_lastError;
    mutable std::mutex m_mutex;
};

}  // namespace log
}  // namespace cpputil
