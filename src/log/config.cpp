/**
 * @file config.cpp
 * @brief Logger configuration parsing and validation
 * @brief 日志器配置解析与校验
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#include "cpputil/log/config.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <system_error>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace cpputil {
namespace log {

// ==============================================================================
// LoggerConfig / 日志器配置
// ==============================================================================

LoggerConfig LoggerConfig::Inline(std::string level, std::string target, std::string pattern,
                                  BackendKind backend) {
    InlineConfig config;
    config.level = std::move(level);
    config.target = std::move(target);
    config.pattern = std::move(pattern);
    config.backend = backend;
    return LoggerConfig(std::move(config));
}

LoggerConfig LoggerConfig::FromInline(InlineConfig config) {
    return LoggerConfig(std::move(config));
}

LoggerConfig LoggerConfig::FromFile(std::string path) {
    return LoggerConfig(std::move(path));
}

// ==============================================================================
// Inline Parameters / 内联参数
// ==============================================================================

Status BuildPlan(const InlineConfig& config, LoggingPlan& plan) {
    auto level = StringToLevel(config.level);
    if (!level) {
        return Status(ErrorCode::ConfigInvalidValue,
                      fmt::format("invalid level '{}'", config.level));
    }
    if (config.target.empty()) {
        return Status(ErrorCode::ConfigInvalidValue, "target must not be empty");
    }

    AppenderSpec appender;
    appender.pattern = config.pattern;

    constexpr std::string_view kFilePrefix = "file:";
    std::string_view target = config.target;
    if (target == "console" || target == "stderr") {
        appender.name = "console";
        appender.kind = AppenderKind::Console;
        appender.stream = ConsoleTarget::StdErr;
    } else if (target == "stdout") {
        appender.name = "console";
        appender.kind = AppenderKind::Console;
        appender.stream = ConsoleTarget::StdOut;
    } else {
        if (target.substr(0, kFilePrefix.size()) == kFilePrefix) {
            target.remove_prefix(kFilePrefix.size());
        }
        if (target.empty()) {
            return Status(ErrorCode::ConfigInvalidValue,
                          fmt::format("invalid target '{}': empty file path", config.target));
        }
        appender.name = "file";
        appender.kind = AppenderKind::File;
        appender.path = std::string(target);
    }

    LoggingPlan result;
    result.backend = config.backend;
    result.rootLevel = *level;
    result.appenders.push_back(std::move(appender));
    plan = std::move(result);
    return Status::Ok();
}

// ==============================================================================
// YAML Document / YAML 文档
// ==============================================================================

namespace {

/**
 * @brief Read an optional scalar field, reporting conversion failures by key
 * @brief 读取可选标量字段，按键报告转换失败
 */
template <typename T>
Status ReadOptional(const YAML::Node& parent, const std::string& key, const std::string& where,
                    T& out) {
    const YAML::Node node = parent[key];
    if (!node) {
        return Status::Ok();
    }
    if (!node.IsScalar()) {
        return Status(ErrorCode::ConfigInvalidValue,
                      fmt::format("{}.{}: expected a scalar value", where, key));
    }
    try {
        out = node.as<T>();
    } catch (const YAML::BadConversion&) {
        return Status(ErrorCode::ConfigInvalidValue,
                      fmt::format("{}.{}: invalid value '{}'", where, key, node.Scalar()));
    }
    return Status::Ok();
}

Status ParseThreshold(const YAML::Node& parent, const std::string& key, const std::string& where,
                      Level& out) {
    std::string name;
    if (!parent[key]) {
        return Status::Ok();
    }
    Status status = ReadOptional(parent, key, where, name);
    if (!status) {
        return status;
    }
    auto level = StringToThreshold(name);
    if (!level) {
        return Status(ErrorCode::ConfigInvalidValue,
                      fmt::format("{}.{}: invalid level '{}'", where, key, name));
    }
    out = *level;
    return Status::Ok();
}

Status ParseAppender(const std::string& name, const YAML::Node& node, AppenderSpec& spec) {
    const std::string where = "appenders." + name;
    if (!node.IsMap()) {
        return Status(ErrorCode::ConfigParseError, fmt::format("{}: expected a map", where));
    }

    spec = AppenderSpec{};
    spec.name = name;

    if (!node["kind"]) {
        return Status(ErrorCode::ConfigMissingRequired, fmt::format("{}.kind", where));
    }
    std::string kindName;
    Status status = ReadOptional(node, "kind", where, kindName);
    if (!status) {
        return status;
    }
    auto kind = StringToAppenderKind(kindName);
    if (!kind) {
        return Status(ErrorCode::ConfigParseError,
                      fmt::format("{}.kind: unknown appender kind '{}'", where, kindName));
    }
    spec.kind = *kind;

    if (!(status = ParseThreshold(node, "threshold", where, spec.threshold))) {
        return status;
    }
    if (!(status = ReadOptional(node, "pattern", where, spec.pattern))) {
        return status;
    }

    if (spec.kind == AppenderKind::Console) {
        std::string target = "stderr";
        if (!(status = ReadOptional(node, "target", where, target))) {
            return status;
        }
        if (target == "stdout") {
            spec.stream = ConsoleTarget::StdOut;
        } else if (target == "stderr") {
            spec.stream = ConsoleTarget::StdErr;
        } else {
            return Status(ErrorCode::ConfigInvalidValue,
                          fmt::format("{}.target: invalid value '{}'", where, target));
        }
        return ReadOptional(node, "color", where, spec.color);
    }

    // File kinds / 文件类型
    if (!node["path"]) {
        return Status(ErrorCode::ConfigMissingRequired, fmt::format("{}.path", where));
    }
    if (!(status = ReadOptional(node, "path", where, spec.path))) {
        return status;
    }
    if (spec.path.empty()) {
        return Status(ErrorCode::ConfigInvalidValue, fmt::format("{}.path: empty path", where));
    }
    if (!(status = ReadOptional(node, "append", where, spec.append))) {
        return status;
    }

    if (spec.kind == AppenderKind::RollingFile) {
        if (!node["max_size"]) {
            return Status(ErrorCode::ConfigMissingRequired, fmt::format("{}.max_size", where));
        }
        if (!(status = ReadOptional(node, "max_size", where, spec.maxSize))) {
            return status;
        }
        if (!(status = ReadOptional(node, "max_files", where, spec.maxFiles))) {
            return status;
        }
        if (spec.maxSize == 0) {
            return Status(ErrorCode::ConfigInvalidValue,
                          fmt::format("{}.max_size: must be greater than 0", where));
        }
        if (spec.maxFiles == 0) {
            return Status(ErrorCode::ConfigInvalidValue,
                          fmt::format("{}.max_files: must be greater than 0", where));
        }
    }
    return Status::Ok();
}

Status ParsePlanFromNode(const YAML::Node& doc, LoggingPlan& plan) {
    if (!doc.IsMap()) {
        if (doc.IsNull()) {
            return Status(ErrorCode::ConfigMissingRequired, "appenders");
        }
        return Status(ErrorCode::ConfigParseError, "configuration document must be a map");
    }

    LoggingPlan result;

    if (doc["backend"]) {
        std::string backendName;
        Status status = ReadOptional(doc, "backend", "config", backendName);
        if (!status) {
            return status;
        }
        auto backend = StringToBackendKind(backendName);
        if (!backend) {
            return Status(ErrorCode::ConfigInvalidValue,
                          fmt::format("backend: invalid value '{}'", backendName));
        }
        result.backend = *backend;
    }

    const YAML::Node appenders = doc["appenders"];
    if (!appenders) {
        return Status(ErrorCode::ConfigMissingRequired, "appenders");
    }
    if (!appenders.IsMap()) {
        return Status(ErrorCode::ConfigParseError, "appenders: expected a map");
    }

    const YAML::Node root = doc["root"];
    if (!root) {
        return Status(ErrorCode::ConfigMissingRequired, "root");
    }
    if (!root.IsMap()) {
        return Status(ErrorCode::ConfigParseError, "root: expected a map");
    }

    Status status = ParseThreshold(root, "level", "root", result.rootLevel);
    if (!status) {
        return status;
    }

    const YAML::Node routed = root["appenders"];
    if (!routed) {
        return Status(ErrorCode::ConfigMissingRequired, "root.appenders");
    }
    if (!routed.IsSequence()) {
        return Status(ErrorCode::ConfigParseError, "root.appenders: expected a list");
    }
    if (routed.size() == 0) {
        return Status(ErrorCode::ConfigMissingRequired,
                      "root.appenders: at least one appender is required");
    }

    std::set<std::string> seen;
    for (const auto& item : routed) {
        if (!item.IsScalar()) {
            return Status(ErrorCode::ConfigParseError,
                          "root.appenders: expected a list of appender names");
        }
        const std::string name = item.Scalar();
        if (!seen.insert(name).second) {
            return Status(ErrorCode::ConfigInvalidValue,
                          fmt::format("root.appenders: appender '{}' listed twice", name));
        }
        const YAML::Node definition = appenders[name];
        if (!definition) {
            return Status(ErrorCode::ConfigParseError,
                          fmt::format("root.appenders: unknown appender '{}'", name));
        }
        AppenderSpec spec;
        if (!(status = ParseAppender(name, definition, spec))) {
            return status;
        }
        result.appenders.push_back(std::move(spec));
    }

    plan = std::move(result);
    return Status::Ok();
}

}  // namespace

Status ParsePlanFromYaml(std::string_view text, LoggingPlan& plan) {
    YAML::Node doc;
    try {
        doc = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        return Status(ErrorCode::ConfigParseError, e.what());
    }

    try {
        return ParsePlanFromNode(doc, plan);
    } catch (const YAML::Exception& e) {
        return Status(ErrorCode::ConfigParseError, e.what());
    }
}

Status LoadPlanFromFile(const std::string& path, LoggingPlan& plan) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Status(ErrorCode::ConfigFileNotFound, path);
    }

    YAML::Node doc;
    try {
        doc = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        return Status(ErrorCode::ConfigFileNotFound, fmt::format("cannot read {}", path));
    } catch (const YAML::Exception& e) {
        return Status(ErrorCode::ConfigParseError, fmt::format("{}: {}", path, e.what()));
    }

    try {
        Status status = ParsePlanFromNode(doc, plan);
        if (!status) {
            return Status(status.Code(), fmt::format("{}: {}", path, status.Message()));
        }
        return status;
    } catch (const YAML::Exception& e) {
        return Status(ErrorCode::ConfigParseError, fmt::format("{}: {}", path, e.what()));
    }
}

Status ResolvePlan(const LoggerConfig& config, LoggingPlan& plan) {
    if (const InlineConfig* inlineConfig = config.GetInline()) {
        return BuildPlan(*inlineConfig, plan);
    }
    if (const std::string* path = config.GetFilePath()) {
        return LoadPlanFromFile(*path, plan);
    }
    return Status(ErrorCode::InternalError, "empty logger configuration");
}

}  // namespace log
}  // namespace cpputil
