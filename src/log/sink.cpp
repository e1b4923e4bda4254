/**
 * @file sink.cpp
 * @brief Console and file appenders
 * @brief 控制台与文件 appender
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#include "cpputil/log/sink.hpp"

#include <array>
#include <filesystem>
#include <system_error>
#include <utility>

namespace cpputil {
namespace log {

namespace {

constexpr const char* kReset = "\033[0m";

// Indexed by Level; Off has no color of its own.
constexpr std::array<const char*, kLevelCountWithOff> kLevelColors = {
    "\033[95m",  // trace
    "\033[96m",  // debug
    "\033[32m",  // info
    "\033[33m",  // warn
    "\033[31m",  // error
    kReset,
};

std::string Backup(const std::string& filename, size_t index) {
    return filename + "." + std::to_string(index);
}

}  // namespace

// ==============================================================================
// ConsoleSink
// ==============================================================================

const char* ConsoleSink::GetLevelColor(Level level) {
    const auto index = static_cast<size_t>(level);
    return index < kLevelColors.size() ? kLevelColors[index] : kReset;
}

const char* ConsoleSink::GetResetColor() {
    return kReset;
}

std::FILE* ConsoleSink::Target() const {
    return m_stream == Stream::StdOut ? stdout : stderr;
}

bool ConsoleSink::Write(Level level, std::string_view line) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::FILE* out = Target();

    bool ok = true;
    if (m_colorEnabled) {
        ok = std::fputs(GetLevelColor(level), out) >= 0;
    }
    ok = std::fwrite(line.data(), 1, line.size(), out) == line.size() && ok;
    if (m_colorEnabled) {
        ok = std::fputs(kReset, out) >= 0 && ok;
    }
    ok = std::fputc('\n', out) != EOF && ok;

    if (!ok) {
        m_hasError = true;
        m_lastError = m_stream == Stream::StdOut ? "write to stdout failed"
                                                 : "write to stderr failed";
    }
    return ok;
}

bool ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (std::fflush(Target()) != 0) {
        m_hasError = true;
        m_lastError = "flush failed";
        return false;
    }
    return true;
}

bool ConsoleSink::HasError() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_hasError;
}

std::string ConsoleSink::GetLastError() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastError;
}

// ==============================================================================
// FileSink
// ==============================================================================

FileSink::FileSink(const std::string& filename, bool append)
    : m_filename(filename) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Open(append);
}

FileSink::~FileSink() {
    Close();
}

bool FileSink::Write(Level /*level*/, std::string_view line) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_out.is_open()) {
        Fail("file not open: " + m_filename);
        return false;
    }

    const size_t bytes = line.size() + 1;
    if (m_limit > 0 && m_written > 0 && m_written + bytes > m_limit) {
        Roll();
        if (!m_out.is_open()) {
            return false;
        }
    }

    m_out << line << '\n';
    m_written += bytes;
    if (!m_out) {
        Fail("write failed: " + m_filename);
        return false;
    }
    return true;
}

bool FileSink::Flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_out.is_open()) {
        return true;
    }
    // A stream that already failed has nothing left it can write.
    if (!m_out || !m_out.flush()) {
        Fail("flush failed: " + m_filename);
        return false;
    }
    return true;
}

void FileSink::Close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_out.is_open()) {
        m_out.close();
    }
}

bool FileSink::HasError() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_hasError;
}

std::string FileSink::GetLastError() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastError;
}

void FileSink::SetMaxSize(size_t bytes) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_limit = bytes;
}

void FileSink::SetMaxFiles(size_t count) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_backups = count == 0 ? 1 : count;
}

size_t FileSink::GetCurrentSize() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_written;
}

void FileSink::Fail(std::string what) {
    m_hasError = true;
    m_lastError = std::move(what);
}

void FileSink::Open(bool append) {
    namespace fs = std::filesystem;

    const fs::path parent = fs::path(m_filename).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            Fail("cannot create " + parent.string() + ": " + ec.message());
            return;
        }
    }

    m_out.open(m_filename, append ? std::ios::app : std::ios::trunc);
    if (!m_out.is_open()) {
        Fail("cannot open " + m_filename);
        return;
    }

    std::error_code ec;
    const auto size = fs::file_size(m_filename, ec);
    m_written = ec ? 0 : static_cast<size_t>(size);
    m_hasError = false;
    m_lastError.clear();
}

void FileSink::Roll() {
    namespace fs = std::filesystem;
    m_out.close();

    std::error_code ec;
    fs::remove(Backup(m_filename, m_backups), ec);
    for (size_t i = m_backups; i > 1; --i) {
        const std::string from = Backup(m_filename, i - 1);
        if (fs::exists(from, ec)) {
            fs::rename(from, Backup(m_filename, i), ec);
        }
    }

    fs::rename(m_filename, Backup(m_filename, 1), ec);
    if (ec) {
        // The live file stays in place and keeps growing.
        const std::string reason = ec.message();
        Open(true);
        Fail("cannot roll " + m_filename + ": " + reason);
        return;
    }
    Open(false);
}

}  // namespace log
}  // namespace cpputil
