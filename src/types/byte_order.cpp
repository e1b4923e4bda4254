/**
 * @file byte_order.cpp
 * @brief YAML conversion for ByteOrder
 * @brief ByteOrder 的 YAML 转换
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#include "cpputil/types/byte_order.hpp"

#include <string>

namespace YAML {

Node convert<cpputil::ByteOrder>::encode(const cpputil::ByteOrder& rhs) {
    return Node(std::string(cpputil::ByteOrderToString(rhs)));
}

bool convert<cpputil::ByteOrder>::decode(const Node& node, cpputil::ByteOrder& rhs) {
    if (!node.IsScalar()) {
        return false;
    }
    auto order = cpputil::StringToByteOrder(node.Scalar());
    if (!order) {
        return false;
    }
    rhs = *order;
    return true;
}

}  // namespace YAML
