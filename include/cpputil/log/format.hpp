/**
 * @file format.hpp
 * @brief Line layouts for the built-in backend
 * @brief 内置后端的行布局
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#pragma once

#include <string>
#include <vector>

#include "cpputil/common.hpp"
#include "cpputil/log/record.hpp"

namespace cpputil {
namespace log {

/**
 * @brief Turns a LogRecord into one output line
 * @brief 将 LogRecord 转换为一行输出
 */
class Format {
public:
    virtual ~Format() = default;
    virtual std::string FormatRecord(const LogRecord& record) const = 0;
};

/**
 * @brief Layout driven by a `%`-specifier pattern
 * @brief 由 `%` 说明符模式驱动的布局
 *
 * | token | expands to                             |
 * |-------|----------------------------------------|
 * | %t    | local time, strftime layout + ".mmm"   |
 * | %l    | level, four letters (INFO, ERRO)       |
 * | %L    | level, full lowercase name             |
 * | %T    | thread id                              |
 * | %P    | process id                             |
 * | %m    | rendered message with context          |
 * | %%    | a single '%'                           |
 *
 * Any other `%x` pair, and a lone trailing `%`, is copied through unchanged.
 * 其他 `%x` 组合以及末尾单独的 `%` 原样输出。
 */
class PatternFormat : public Format {
public:
    static constexpr const char* kDefaultPattern = "[%t] [%l] %m";
    static constexpr const char* kDefaultTimestampFormat = "%Y-%m-%d %H:%M:%S";

    explicit PatternFormat(const std::string& pattern = kDefaultPattern);

    std::string FormatRecord(const LogRecord& record) const override;

    void SetPattern(const std::string& pattern);
    const std::string& GetPattern() const { return m_pattern; }

    /// strftime layout used by %t / %t 使用的 strftime 布局
    void SetTimestampFormat(const std::string& format) { m_timestampFormat = format; }
    const std::string& GetTimestampFormat() const { return m_timestampFormat; }

private:
    // A piece is either literal text (field == 0) or one specifier letter.
    struct Piece {
        char field;
        std::string text;
    };

    void Compile();

    std::string m_pattern;
    std::string m_timestampFormat{kDefaultTimestampFormat};
    std::vector<Piece> m_pieces;
};

}  // namespace log
}  // namespace cpputil
