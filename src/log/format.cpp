/**
 * @file format.cpp
 * @brief PatternFormat implementation
 * @brief PatternFormat 实现
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#include "cpputil/log/format.hpp"

#include <ctime>
#include <iterator>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace cpputil {
namespace log {

namespace {

constexpr std::string_view kFields = "tlLTPm";

bool IsField(char c) {
    return kFields.find(c) != std::string_view::npos;
}

// Local wall-clock time of a nanosecond epoch stamp, with milliseconds.
void AppendLocalTime(std::string& out, uint64_t nanos, const std::string& layout) {
    const auto seconds = static_cast<std::time_t>(nanos / 1000000000ULL);
    const auto millis = static_cast<unsigned>(nanos / 1000000ULL % 1000ULL);
    const std::tm local = fmt::localtime(seconds);

    char buf[128];
    const size_t n = std::strftime(buf, sizeof(buf), layout.c_str(), &local);
    out.append(buf, n);
    fmt::format_to(std::back_inserter(out), ".{:03}", millis);
}

}  // namespace

PatternFormat::PatternFormat(const std::string& pattern)
    : m_pattern(pattern) {
    Compile();
}

void PatternFormat::SetPattern(const std::string& pattern) {
    m_pattern = pattern;
    Compile();
}

std::string PatternFormat::FormatRecord(const LogRecord& record) const {
    std::string line;
    line.reserve(record.message.size() + 48);

    for (const Piece& piece : m_pieces) {
        switch (piece.field) {
            case 't':
                AppendLocalTime(line, record.timestamp, m_timestampFormat);
                break;
            case 'l':
                line += LevelToString(record.level, LevelNameStyle::Short4);
                break;
            case 'L':
                line += LevelToString(record.level, LevelNameStyle::Full);
                break;
            case 'T':
                fmt::format_to(std::back_inserter(line), "{}", record.threadId);
                break;
            case 'P':
                fmt::format_to(std::back_inserter(line), "{}", record.processId);
                break;
            case 'm':
                line += record.message;
                break;
            default:
                line += piece.text;
                break;
        }
    }
    return line;
}

void PatternFormat::Compile() {
    m_pieces.clear();
    const std::string_view pattern = m_pattern;
    std::string text;

    for (size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] != '%' || i + 1 == pattern.size()) {
            text += pattern[i];
            continue;
        }
        const char next = pattern[++i];
        if (!IsField(next)) {
            // "%%" collapses, anything else stays as written
            if (next != '%') {
                text += '%';
            }
            text += next;
            continue;
        }
        if (!text.empty()) {
            m_pieces.push_back({0, std::move(text)});
            text.clear();
        }
        m_pieces.push_back({next, {}});
    }

    if (!text.empty()) {
        m_pieces.push_back({0, std::move(text)});
    }
}

}  // namespace log
}  // namespace cpputil
