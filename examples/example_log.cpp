/**
 * @file example_log.cpp
 * @brief Logging facade example for cpputil
 * @brief cpputil 日志门面示例
 *
 * Features demonstrated / 演示的功能:
 * - Inline configuration and the logging macros / 内联配置与日志宏
 * - Structured context fields / 结构化上下文字段
 * - Tagged logging with LogCat / 使用 LogCat 的标签日志
 * - YAML configuration files / YAML 配置文件
 * - ScopedLogging / 作用域日志
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#include <iostream>
#include <string>

#include <cpputil/cpputil.hpp>

#ifndef CPPUTIL_EXAMPLE_CONFIG
#define CPPUTIL_EXAMPLE_CONFIG "examples/log.yaml"
#endif

using cpputil::Level;
using cpputil::Status;
namespace logging = cpputil::log;

// ==============================================================================
// Example 1: Inline Configuration
// 示例 1: 内联配置
// ==============================================================================

void InlineExample() {
    std::cout << "\n=== Example 1: Inline configuration / 内联配置 ===" << std::endl;

    Status status = logging::Initialize(logging::LoggerConfig::Inline("debug", "stdout"));
    if (!status) {
        std::cerr << "initialize failed: " << status.ToString() << std::endl;
        return;
    }

    CPPUTIL_TRACE("filtered by the root level {}", "debug");
    CPPUTIL_DEBUG("loaded {} plugins", 3);
    CPPUTIL_INFO("listening on {}:{}", "0.0.0.0", 8080);
    CPPUTIL_WARN("cache {:.1f}% full", 91.5);
    CPPUTIL_ERROR_IF(true, "request {} failed", 17);

    // Context fields are appended as key=value / 上下文字段以 key=value 追加
    logging::Log(Level::Info, "user login", {{"user", "alice"}, {"method", "token"}});

    // A second Initialize is rejected / 第二次 Initialize 被拒绝
    Status again = logging::Initialize(logging::LoggerConfig::Inline("trace"));
    std::cout << "second initialize: " << again.ToString() << std::endl;

    status = logging::Shutdown();
    std::cout << "shutdown: " << status.ToString() << std::endl;
}

// ==============================================================================
// Example 2: Tagged Logging
// 示例 2: 标签日志
// ==============================================================================

void LogCatExample() {
    std::cout << "\n=== Example 2: LogCat / 标签日志 ===" << std::endl;

    logging::ScopedLogging scope(logging::LoggerConfig::Inline("info", "stdout"));
    if (!scope.IsOk()) {
        std::cerr << "initialize failed: " << scope.GetStatus().ToString() << std::endl;
        return;
    }

    logging::LogCat net("net");
    logging::LogCat db("db");
    net.Info("connected to {}", "10.0.0.7");
    db.Warn("slow query took {} ms", 1250);
    db.Debug("not shown at info");
}

// ==============================================================================
// Example 3: Configuration File
// 示例 3: 配置文件
// ==============================================================================

void ConfigFileExample() {
    std::cout << "\n=== Example 3: YAML configuration / YAML 配置 ===" << std::endl;

    Status status = logging::Initialize(logging::LoggerConfig::FromFile(CPPUTIL_EXAMPLE_CONFIG));
    if (!status) {
        std::cerr << "initialize failed: " << status.ToString() << std::endl;
        return;
    }

    const auto level = cpputil::LevelToString(logging::GetLevel(), cpputil::LevelNameStyle::Full);
    std::cout << "backend: " << logging::GetBackend()->Name() << ", level: " << level << std::endl;

    for (int i = 0; i < 5; ++i) {
        CPPUTIL_INFO("processing batch {}", i);
    }
    CPPUTIL_ERROR("batch {} rejected", 4);

    logging::Flush();
    std::cout << "dropped: " << logging::DroppedCount() << std::endl;
    status = logging::Shutdown();
    if (!status) {
        std::cerr << "shutdown failed: " << status.ToString() << std::endl;
    }
}

// ==============================================================================
// Example 4: Configuration Errors
// 示例 4: 配置错误
// ==============================================================================

void ConfigErrorExample() {
    std::cout << "\n=== Example 4: Configuration errors / 配置错误 ===" << std::endl;

    Status missing = logging::Initialize(logging::LoggerConfig::FromFile("no/such/log.yaml"));
    std::cout << missing.ToString() << std::endl;

    Status badLevel = logging::Initialize(logging::LoggerConfig::Inline("verbose"));
    std::cout << badLevel.ToString() << std::endl;

    std::cout << "initialized: " << std::boolalpha << logging::IsInitialized() << std::endl;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "cpputil Logging Examples" << std::endl;
    std::cout << "cpputil 日志示例" << std::endl;
    std::cout << "========================================" << std::endl;

    InlineExample();
    LogCatExample();
    ConfigFileExample();
    ConfigErrorExample();

    std::cout << "\n========================================" << std::endl;
    std::cout << "All logging examples completed!" << std::endl;
    std::cout << "所有日志示例完成！" << std::endl;
    std::cout << "========================================" << std::endl;

    return 0;
}
