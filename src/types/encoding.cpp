/**
 * @file encoding.cpp
 * @brief Codec identifier names and YAML conversion
 * @brief 编解码器标识名称与 YAML 转换
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#include "cpputil/types/encoding.hpp"

#include <array>
#include <string>

namespace cpputil {

namespace {

#define CPPUTIL_DETAIL_ENCODING_NAME(name, codec) codec,
constexpr std::array<std::string_view, kEncodingCount> kEncodingNames = {
    CPPUTIL_ENCODING_LIST(CPPUTIL_DETAIL_ENCODING_NAME)};
#undef CPPUTIL_DETAIL_ENCODING_NAME

constexpr char Normalize(char c) noexcept {
    if (c == '-') {
        return '_';
    }
    if (c >= 'A' && c <= 'Z') {
        return static_cast<char>(c - 'A' + 'a');
    }
    return c;
}

bool SameCodecName(std::string_view name, std::string_view codec) noexcept {
    if (name.size() != codec.size()) {
        return false;
    }
    for (size_t i = 0; i < name.size(); ++i) {
        if (Normalize(name[i]) != codec[i]) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string_view EncodingToString(Encoding encoding) noexcept {
    const auto idx = static_cast<size_t>(encoding);
    if (idx >= kEncodingNames.size()) {
        return "unknown";
    }
    return kEncodingNames[idx];
}

std::optional<Encoding> StringToEncoding(std::string_view name) noexcept {
    for (size_t i = 0; i < kEncodingNames.size(); ++i) {
        if (SameCodecName(name, kEncodingNames[i])) {
            return static_cast<Encoding>(i);
        }
    }
    return std::nullopt;
}

}  // namespace cpputil

namespace YAML {

Node convert<cpputil::Encoding>::encode(const cpputil::Encoding& rhs) {
    return Node(std::string(cpputil::EncodingToString(rhs)));
}

bool convert<cpputil::Encoding>::decode(const Node& node, cpputil::Encoding& rhs) {
    if (!node.IsScalar()) {
        return false;
    }
    auto encoding = cpputil::StringToEncoding(node.Scalar());
    if (!encoding) {
        return false;
    }
    rhs = *encoding;
    return true;
}

}  // namespace YAML
