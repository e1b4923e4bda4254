/**
 * @file config.hpp
 * @brief Logger configuration: inline parameters, YAML files and the resolved plan
 * @brief 日志器配置：内联参数、YAML 文件以及解析后的计划
 *
 * Both configuration forms resolve into a LoggingPlan, which is the only input
 * the backends understand:
 * - InlineConfig: a level string and a target descriptor
 * - Configuration file: named appenders plus a root routing rule
 *
 * 两种配置形式都会解析为 LoggingPlan，这是后端唯一理解的输入：
 * - InlineConfig：级别字符串和目标描述
 * - 配置文件：命名的输出器以及根路由规则
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#pragma once

#include "cpputil/features.hpp"

#if !CPPUTIL_HAS_LOG
#error "cpputil/log/config.hpp requires CPPUTIL_FEATURE_LOG"
#endif

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "cpputil/common.hpp"

namespace cpputil {
namespace log {

// ==============================================================================
// Backend Kind / 后端类型
// ==============================================================================

/**
 * @brief Which backend a plan asks for
 * @brief 计划请求的后端类型
 */
enum class BackendKind : uint8_t {
    Auto,     ///< spdlog when compiled in, otherwise built-in / 编译了 spdlog 则用之，否则用内置
    Builtin,  ///< Built-in asynchronous Logger / 内置异步 Logger
    Spdlog    ///< spdlog logger / spdlog 日志器
};

constexpr std::string_view BackendKindToString(BackendKind kind) noexcept {
    switch (kind) {
        case BackendKind::Auto:
            return "auto";
        case BackendKind::Builtin:
            return "builtin";
        case BackendKind::Spdlog:
            return "spdlog";
        default:
            return "unknown";
    }
}

constexpr std::optional<BackendKind> StringToBackendKind(std::string_view name) noexcept {
    if (name == "auto") {
        return BackendKind::Auto;
    }
    if (name == "builtin") {
        return BackendKind::Builtin;
    }
    if (name == "spdlog") {
        return BackendKind::Spdlog;
    }
    return std::nullopt;
}

// ==============================================================================
// Appender Spec / 输出器规格
// ==============================================================================

/**
 * @brief Appender kind
 * @brief 输出器类型
 */
enum class AppenderKind : uint8_t {
    Console,     ///< stdout or stderr / 标准输出或标准错误
    File,        ///< Plain file / 普通文件
    RollingFile  ///< Size-rotated file / 按大小轮转的文件
};

constexpr std::string_view AppenderKindToString(AppenderKind kind) noexcept {
    switch (kind) {
        case AppenderKind::Console:
            return "console";
        case AppenderKind::File:
            return "file";
        case AppenderKind::RollingFile:
            return "rolling_file";
        default:
            return "unknown";
    }
}

constexpr std::optional<AppenderKind> StringToAppenderKind(std::string_view name) noexcept {
    if (name == "console") {
        return AppenderKind::Console;
    }
    if (name == "file") {
        return AppenderKind::File;
    }
    if (name == "rolling_file") {
        return AppenderKind::RollingFile;
    }
    return std::nullopt;
}

/**
 * @brief Console stream selection
 * @brief 控制台流选择
 */
enum class ConsoleTarget : uint8_t {
    StdOut,  ///< Standard output / 标准输出
    StdErr   ///< Standard error / 标准错误
};

/// Default number of rotated files kept by rolling_file / rolling_file 默认保留的轮转文件数
constexpr size_t kDefaultMaxFiles = 3;

/**
 * @brief One named output destination
 * @brief 一个命名的输出目标
 *
 * An empty pattern means the backend's default pattern.
 * 空模式表示使用后端的默认模式。
 */
struct AppenderSpec {
    std::string name;                              ///< Appender name / 输出器名称
    AppenderKind kind{AppenderKind::Console};      ///< Kind / 类型
    Level threshold{Level::Trace};                 ///< Per-appender threshold / 输出器阈值
    std::string pattern;                           ///< Output pattern / 输出模式
    ConsoleTarget stream{ConsoleTarget::StdErr};   ///< Console only / 仅控制台
    bool color{false};                             ///< Console only / 仅控制台
    std::string path;                              ///< File kinds only / 仅文件类型
    bool append{true};                             ///< File kinds only / 仅文件类型
    size_t maxSize{0};                             ///< rolling_file only, bytes / 仅轮转文件，字节
    size_t maxFiles{kDefaultMaxFiles};             ///< rolling_file only / 仅轮转文件
};

/**
 * @brief Fully resolved logging configuration
 * @brief 完全解析后的日志配置
 */
struct LoggingPlan {
    BackendKind backend{BackendKind::Auto};  ///< Backend preference / 后端偏好
    Level rootLevel{Level::Info};            ///< Root level / 根级别
    std::vector<AppenderSpec> appenders;     ///< Routed appenders, in order / 按顺序路由的输出器
};

// ==============================================================================
// Logger Config / 日志器配置
// ==============================================================================

/**
 * @brief Inline configuration parameters
 * @brief 内联配置参数
 *
 * target:
 * - "console" or "stderr": standard error / 标准错误
 * - "stdout": standard output / 标准输出
 * - "file:<path>" or any other string: a file path / 文件路径
 */
struct InlineConfig {
    std::string level{"info"};              ///< Root level name / 根级别名称
    std::string target{"console"};          ///< Target descriptor / 目标描述
    std::string pattern;                    ///< Optional pattern / 可选模式
    BackendKind backend{BackendKind::Auto}; ///< Backend preference / 后端偏好
};

/**
 * @brief Configuration passed to Initialize
 * @brief 传递给 Initialize 的配置
 *
 * Exactly one form is active: inline parameters or a configuration file path.
 * 只有一种形式有效：内联参数或配置文件路径。
 *
 * @code
 * auto status = cpputil::log::Initialize(cpputil::log::LoggerConfig::Inline("debug", "logs/app.log"));
 * auto status = cpputil::log::Initialize(cpputil::log::LoggerConfig::FromFile("log.yaml"));
 * @endcode
 */
class LoggerConfig {
public:
    static LoggerConfig Inline(std::string level = "info", std::string target = "console",
                               std::string pattern = "",
                               BackendKind backend = BackendKind::Auto);

    static LoggerConfig FromInline(InlineConfig config);

    static LoggerConfig FromFile(std::string path);

    bool IsInline() const { return std::holds_alternative<InlineConfig>(m_source); }
    bool IsFile() const { return std::holds_alternative<std::string>(m_source); }

    /// nullptr unless IsInline() / 仅当 IsInline() 时非空
    const InlineConfig* GetInline() const { return std::get_if<InlineConfig>(&m_source); }

    /// nullptr unless IsFile() / 仅当 IsFile() 时非空
    const std::string* GetFilePath() const { return std::get_if<std::string>(&m_source); }

private:
    explicit LoggerConfig(std::variant<InlineConfig, std::string> source)
        : m_source(std::move(source)) {}

    std::variant<InlineConfig, std::string> m_source;
};

// ==============================================================================
// Plan Resolution / 计划解析
// ==============================================================================

/**
 * @brief Validate inline parameters and turn them into a one-appender plan
 * @brief 校验内联参数并转换为单输出器计划
 */
Status BuildPlan(const InlineConfig& config, LoggingPlan& plan);

/**
 * @brief Parse a YAML document into a plan
 * @brief 将 YAML 文档解析为计划
 *
 * Parser errors are reported with the parser's own message, which carries
 * line and column.
 * 解析器错误以解析器自身的消息报告，其中包含行号和列号。
 */
Status ParsePlanFromYaml(std::string_view text, LoggingPlan& plan);

/**
 * @brief Load and parse a YAML configuration file
 * @brief 加载并解析 YAML 配置文件
 */
Status LoadPlanFromFile(const std::string& path, LoggingPlan& plan);

/**
 * @brief Resolve either configuration form into a plan
 * @brief 将任一配置形式解析为计划
 */
Status ResolvePlan(const LoggerConfig& config, LoggingPlan& plan);

}  // namespace log
}  // namespace cpputil
