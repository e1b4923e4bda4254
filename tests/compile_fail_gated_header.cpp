/**
 * @file compile_fail_gated_header.cpp
 * @brief Must not compile: the logging facade header without its capability
 * @brief 必须编译失败：未启用能力时包含日志门面头文件
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#include <cpputil/log/facade.hpp>

int main() {
    return 0;
}
