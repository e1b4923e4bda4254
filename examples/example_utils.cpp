/**
 * @file example_utils.cpp
 * @brief Utility example for cpputil (macros, types, With helpers)
 * @brief cpputil 工具示例（宏、类型、With 辅助函数）
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#include <cstdint>
#include <iostream>
#include <string>

#include <yaml-cpp/yaml.h>

#include <cpputil/cpputil.hpp>

using cpputil::ErrorCode;
using cpputil::Status;

// ==============================================================================
// Example 1: Enum Extension
// 示例 1: 枚举扩展
// ==============================================================================

#define OPCODE_LIST(X) \
    X(Nop, 0x00)       \
    X(Load, 0x10)      \
    X(Store, 0x11)     \
    X(Halt, 0xff)

CPPUTIL_ENUM_EXTEND(Opcode, uint8_t, OPCODE_LIST)

void EnumExtendExample() {
    std::cout << "\n=== Example 1: CPPUTIL_ENUM_EXTEND / 枚举扩展 ===" << std::endl;

    const uint8_t program[] = {0x10, 0x11, 0x42, 0xff};
    for (uint8_t byte : program) {
        auto opcode = OpcodeFromValue(byte);
        if (opcode) {
            std::cout << static_cast<int>(byte) << " -> " << ToString(*opcode) << std::endl;
        } else {
            std::cout << static_cast<int>(byte) << " -> invalid opcode" << std::endl;
        }
    }
    std::cout << "known opcodes: " << OpcodeCount << std::endl;
}

// ==============================================================================
// Example 2: ByteOrder and Encoding
// 示例 2: 字节序与编码
// ==============================================================================

void TypesExample() {
    std::cout << "\n=== Example 2: ByteOrder / Encoding ===" << std::endl;

    YAML::Node settings = YAML::Load("order: native\nencoding: Shift-JIS\n");
    auto order = settings["order"].as<cpputil::ByteOrder>();
    auto encoding = settings["encoding"].as<cpputil::Encoding>();

    std::cout << "order " << cpputil::ByteOrderToString(order) << " is little endian: "
              << std::boolalpha << cpputil::IsLittle(order) << std::endl;
    std::cout << "encoding: " << cpputil::EncodingToString(encoding) << std::endl;

    YAML::Node out;
    out["order"] = cpputil::Resolve(order);
    out["encoding"] = cpputil::kDefaultEncoding;
    std::cout << out << std::endl;
}

// ==============================================================================
// Example 3: With
// 示例 3: With
// ==============================================================================

class Transaction {
public:
    explicit Transaction(bool available) : m_available(available) {}

    Status Enter() {
        if (!m_available) {
            return Status(ErrorCode::NotInitialized, "database offline");
        }
        std::cout << "BEGIN" << std::endl;
        return Status::Ok();
    }

    void Exit() { std::cout << "COMMIT" << std::endl; }

    Status Execute(const std::string& sql) {
        std::cout << "  " << sql << std::endl;
        return Status::Ok();
    }

private:
    bool m_available;
};

void WithExample() {
    std::cout << "\n=== Example 3: With / 上下文管理 ===" << std::endl;

    Status status = cpputil::py::With(Transaction(true), [](Transaction& tx) {
        return tx.Execute("UPDATE accounts SET balance = balance - 10");
    });
    std::cout << "result: " << status.ToString() << std::endl;

    status = cpputil::py::With(Transaction(false), [](Transaction& tx) {
        return tx.Execute("never runs");
    });
    std::cout << "result: " << status.ToString() << std::endl;
}

int main() {
    EnumExtendExample();
    TypesExample();
    WithExample();
    return 0;
}
