/**
 * @file common.hpp
 * @brief Severity levels and the Status error type
 * @brief 严重级别与 Status 错误类型
 *
 * Everything here is header-only and usable without any logging capability
 * compiled in.
 * 此处内容均为纯头文件，不依赖任何已编译的日志能力。
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#ifndef CPPUTIL_COMMON_HPP
#define CPPUTIL_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace cpputil {

// ==============================================================================
// Level / 级别
// ==============================================================================

/**
 * @brief Record severity, ascending
 * @brief 记录严重级别（升序）
 *
 * Off never labels a record. As a threshold it rejects everything.
 * Off 从不用于标记记录；作为阈值时拒绝所有记录。
 */
enum class Level : uint8_t { Trace, Debug, Info, Warn, Error, Off };

enum class LevelNameStyle : uint8_t {
    Full,    ///< trace, debug, info, warn, error
    Short4,  ///< TRAC, DBUG, INFO, WARN, ERRO
    Short1   ///< T, D, I, W, E
};

constexpr size_t kLevelCount = 5;
constexpr size_t kLevelCountWithOff = 6;

namespace detail {

struct LevelNames {
    std::string_view full;
    std::string_view short4;
    std::string_view short1;
};

inline constexpr LevelNames kLevelNames[kLevelCountWithOff] = {
    {"trace", "TRAC", "T"}, {"debug", "DBUG", "D"}, {"info", "INFO", "I"},
    {"warn", "WARN", "W"},  {"error", "ERRO", "E"}, {"off", "OFF", "O"},
};

constexpr char AsciiLower(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

constexpr bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (AsciiLower(a[i]) != AsciiLower(b[i])) {
            return false;
        }
    }
    return true;
}

}  // namespace detail

constexpr std::string_view LevelToString(Level level,
                                          LevelNameStyle style = LevelNameStyle::Short4) noexcept {
    const auto idx = static_cast<size_t>(level);
    if (idx >= kLevelCountWithOff) {
        return "UNKN";
    }
    const detail::LevelNames& names = detail::kLevelNames[idx];
    switch (style) {
        case LevelNameStyle::Full:
            return names.full;
        case LevelNameStyle::Short1:
            return names.short1;
        default:
            return names.short4;
    }
}

/**
 * @brief Parse a severity name, ignoring ASCII case
 * @brief 解析严重级别名称（忽略 ASCII 大小写）
 *
 * Accepts the full names plus "warning". "off" is not a severity and is
 * rejected here; use StringToThreshold for thresholds.
 * 接受全称以及 "warning"。"off" 不是严重级别，此处拒绝；阈值请使用 StringToThreshold。
 */
constexpr std::optional<Level> StringToLevel(std::string_view name) noexcept {
    for (size_t i = 0; i < kLevelCount; ++i) {
        if (detail::EqualsIgnoreCase(name, detail::kLevelNames[i].full)) {
            return static_cast<Level>(i);
        }
    }
    if (detail::EqualsIgnoreCase(name, "warning")) {
        return Level::Warn;
    }
    return std::nullopt;
}

/// Like StringToLevel but also accepts "off" / 同 StringToLevel，另接受 "off"
constexpr std::optional<Level> StringToThreshold(std::string_view name) noexcept {
    if (detail::EqualsIgnoreCase(name, "off")) {
        return Level::Off;
    }
    return StringToLevel(name);
}

constexpr bool PassesThreshold(Level level, Level threshold) noexcept {
    return level < Level::Off && level >= threshold;
}

// ==============================================================================
// ErrorCode / 错误码
// ==============================================================================

/**
 * @brief Failure kinds reported through Status
 * @brief 通过 Status 报告的失败类型
 *
 * Values are grouped in hundreds: 3xx appender I/O, 6xx configuration,
 * 9xx lifecycle and capability.
 * 数值按百位分组：3xx 为 appender I/O，6xx 为配置，9xx 为生命周期与能力。
 */
enum class ErrorCode : int32_t {
    Success = 0,

    FileOpenFailed = 300,
    FileWriteFailed = 301,

    ConfigParseError = 600,
    ConfigInvalidValue = 601,
    ConfigMissingRequired = 602,
    ConfigFileNotFound = 603,

    NotInitialized = 901,
    AlreadyInitialized = 902,
    NotSupported = 903,  ///< capability not compiled in / 能力未编译
    FlushTimeout = 904,
    InternalError = 999
};

enum class ErrorCategory : uint8_t {
    None,
    Configuration,  ///< malformed or missing configuration / 配置格式错误或缺失
    Validation,     ///< a value outside its allowed set / 值不在允许范围内
    IO,             ///< appender target unusable / 输出目标不可用
    State,          ///< lifecycle conflict / 生命周期冲突
    Support,
    Internal
};

constexpr std::string_view ErrorCodeToString(ErrorCode code) noexcept {
#define CPPUTIL_ERROR_CODE_NAME(name) \
    case ErrorCode::name:             \
        return #name;
    switch (code) {
        CPPUTIL_ERROR_CODE_NAME(Success)
        CPPUTIL_ERROR_CODE_NAME(FileOpenFailed)
        CPPUTIL_ERROR_CODE_NAME(FileWriteFailed)
        CPPUTIL_ERROR_CODE_NAME(ConfigParseError)
        CPPUTIL_ERROR_CODE_NAME(ConfigInvalidValue)
        CPPUTIL_ERROR_CODE_NAME(ConfigMissingRequired)
        CPPUTIL_ERROR_CODE_NAME(ConfigFileNotFound)
        CPPUTIL_ERROR_CODE_NAME(NotInitialized)
        CPPUTIL_ERROR_CODE_NAME(AlreadyInitialized)
        CPPUTIL_ERROR_CODE_NAME(NotSupported)
        CPPUTIL_ERROR_CODE_NAME(FlushTimeout)
        CPPUTIL_ERROR_CODE_NAME(InternalError)
    }
#undef CPPUTIL_ERROR_CODE_NAME
    return "UnknownError";
}

constexpr ErrorCategory CategoryOf(ErrorCode code) noexcept {
    const auto value = static_cast<int32_t>(code);
    if (value == 0) {
        return ErrorCategory::None;
    }
    if (value / 100 == 3) {
        return ErrorCategory::IO;
    }
    if (code == ErrorCode::ConfigInvalidValue) {
        return ErrorCategory::Validation;
    }
    if (value / 100 == 6) {
        return ErrorCategory::Configuration;
    }
    if (code == ErrorCode::NotSupported) {
        return ErrorCategory::Support;
    }
    if (value >= 901 && value <= 904) {
        return ErrorCategory::State;
    }
    return ErrorCategory::Internal;
}

// ==============================================================================
// Status / 状态
// ==============================================================================

/**
 * @brief Result of a fallible operation
 * @brief 可能失败的操作的结果
 *
 * A default-constructed Status is a success. Failures carry an ErrorCode and a
 * message that names the offending value, path or location.
 * 默认构造的 Status 表示成功。失败时携带错误码以及指明出错值、路径或位置的消息。
 */
class Status {
public:
    Status() = default;

    Status(ErrorCode code, std::string message)
        : m_code(code), m_message(std::move(message)) {}

    static Status Ok() { return Status(); }

    bool IsOk() const noexcept { return m_code == ErrorCode::Success; }
    explicit operator bool() const noexcept { return IsOk(); }

    ErrorCode Code() const noexcept { return m_code; }
    ErrorCategory Category() const noexcept { return CategoryOf(m_code); }
    const std::string& Message() const noexcept { return m_message; }

    /**
     * @brief Render as "<Code>: <message>"
     * @brief 渲染为 "<错误码>: <消息>"
     */
    std::string ToString() const {
        std::string result(ErrorCodeToString(m_code));
        if (!m_message.empty()) {
            result += ": ";
            result += m_message;
        }
        return result;
    }

private:
    ErrorCode m_code{ErrorCode::Success};
    std::string m_message;
};

}  // namespace cpputil

#endif  // CPPUTIL_COMMON_HPP
