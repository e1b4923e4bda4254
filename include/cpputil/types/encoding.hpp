/**
 * @file encoding.hpp
 * @brief Text and binary codec identifiers (Python codec names)
 * @brief 文本与二进制编解码器标识（Python 编解码器名称）
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#pragma once

#include "cpputil/features.hpp"

#if !CPPUTIL_HAS_TYPES
#error "cpputil/types/encoding.hpp requires CPPUTIL_FEATURE_TYPES"
#endif

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include <yaml-cpp/yaml.h>

// X(Enumerator, "codec name")
#define CPPUTIL_ENCODING_LIST(X)          \
    X(Ascii, "ascii")                     \
    X(Base64, "base64")                   \
    X(Big5, "big5")                       \
    X(Big5HkScs, "big5hkscs")             \
    X(Bz2, "bz2")                         \
    X(Cp037, "cp037")                     \
    X(Cp1026, "cp1026")                   \
    X(Cp1125, "cp1125")                   \
    X(Cp1140, "cp1140")                   \
    X(Cp1250, "cp1250")                   \
    X(Cp1251, "cp1251")                   \
    X(Cp1252, "cp1252")                   \
    X(Cp1253, "cp1253")                   \
    X(Cp1254, "cp1254")                   \
    X(Cp1255, "cp1255")                   \
    X(Cp1256, "cp1256")                   \
    X(Cp1257, "cp1257")                   \
    X(Cp1258, "cp1258")                   \
    X(Cp273, "cp273")                     \
    X(Cp424, "cp424")                     \
    X(Cp437, "cp437")                     \
    X(Cp500, "cp500")                     \
    X(Cp775, "cp775")                     \
    X(Cp850, "cp850")                     \
    X(Cp852, "cp852")                     \
    X(Cp855, "cp855")                     \
    X(Cp857, "cp857")                     \
    X(Cp858, "cp858")                     \
    X(Cp860, "cp860")                     \
    X(Cp861, "cp861")                     \
    X(Cp862, "cp862")                     \
    X(Cp863, "cp863")                     \
    X(Cp864, "cp864")                     \
    X(Cp865, "cp865")                     \
    X(Cp866, "cp866")                     \
    X(Cp869, "cp869")                     \
    X(Cp932, "cp932")                     \
    X(Cp949, "cp949")                     \
    X(Cp950, "cp950")                     \
    X(EucJis2004, "euc_jis_2004")         \
    X(EucJisx0213, "euc_jisx0213")        \
    X(EucJp, "euc_jp")                    \
    X(EucKr, "euc_kr")                    \
    X(Gb18030, "gb18030")                 \
    X(Gb2312, "gb2312")                   \
    X(Gbk, "gbk")                         \
    X(Hex, "hex")                         \
    X(HpRoman8, "hp_roman8")              \
    X(Hz, "hz")                           \
    X(Iso2022Jp, "iso2022_jp")            \
    X(Iso2022Jp1, "iso2022_jp_1")         \
    X(Iso2022Jp2, "iso2022_jp_2")         \
    X(Iso2022Jp2004, "iso2022_jp_2004")   \
    X(Iso2022Jp3, "iso2022_jp_3")         \
    X(Iso2022JpExt, "iso2022_jp_ext")     \
    X(Iso2022Kr, "iso2022_kr")            \
    X(Iso8859_10, "iso8859_10")           \
    X(Iso8859_11, "iso8859_11")           \
    X(Iso8859_13, "iso8859_13")           \
    X(Iso8859_14, "iso8859_14")           \
    X(Iso8859_15, "iso8859_15")           \
    X(Iso8859_16, "iso8859_16")           \
    X(Iso8859_1, "iso8859_1")             \
    X(Iso8859_2, "iso8859_2")             \
    X(Iso8859_3, "iso8859_3")             \
    X(Iso8859_4, "iso8859_4")             \
    X(Iso8859_5, "iso8859_5")             \
    X(Iso8859_6, "iso8859_6")             \
    X(Iso8859_7, "iso8859_7")             \
    X(Iso8859_8, "iso8859_8")             \
    X(Iso8859_9, "iso8859_9")             \
    X(Johab, "johab")                     \
    X(Koi8R, "koi8_r")                    \
    X(Kz1048, "kz1048")                   \
    X(Latin1, "latin_1")                  \
    X(MacCyrillic, "mac_cyrillic")        \
    X(MacGreek, "mac_greek")              \
    X(MacIceland, "mac_iceland")          \
    X(MacLatin2, "mac_latin2")            \
    X(MacRoman, "mac_roman")              \
    X(MacTurkish, "mac_turkish")          \
    X(Mbcs, "mbcs")                       \
    X(Ptcp154, "ptcp154")                 \
    X(Quopri, "quopri")                   \
    X(Rot13, "rot_13")                    \
    X(ShiftJis, "shift_jis")              \
    X(ShiftJis2004, "shift_jis_2004")     \
    X(ShiftJisx0213, "shift_jisx0213")    \
    X(Tis620, "tis_620")                  \
    X(Utf16, "utf_16")                    \
    X(Utf16be, "utf_16_be")               \
    X(Utf16le, "utf_16_le")               \
    X(Utf32, "utf_32")                    \
    X(Utf32be, "utf_32_be")               \
    X(Utf32le, "utf_32_le")               \
    X(Utf7, "utf_7")                      \
    X(Utf8, "utf_8")                      \
    X(UU, "uu")                           \
    X(Zlib, "zlib")

namespace cpputil {

#define CPPUTIL_DETAIL_ENCODING_ENUMERATOR(name, codec) name,
#define CPPUTIL_DETAIL_ENCODING_COUNT(name, codec) +1

/**
 * @brief Codec identifier
 * @brief 编解码器标识
 */
enum class Encoding : uint8_t { CPPUTIL_ENCODING_LIST(CPPUTIL_DETAIL_ENCODING_ENUMERATOR) };

constexpr Encoding kDefaultEncoding = Encoding::Utf8;

constexpr size_t kEncodingCount = 0 CPPUTIL_ENCODING_LIST(CPPUTIL_DETAIL_ENCODING_COUNT);

#undef CPPUTIL_DETAIL_ENCODING_ENUMERATOR
#undef CPPUTIL_DETAIL_ENCODING_COUNT

/**
 * @brief Python codec name of an encoding ("utf_8", "latin_1", ...)
 * @brief 编码的 Python 编解码器名称（"utf_8"、"latin_1" 等）
 */
std::string_view EncodingToString(Encoding encoding) noexcept;

/**
 * @brief Look up an encoding by its codec name
 * @brief 按编解码器名称查找编码
 *
 * Matching ignores case and treats '-' like '_', so "UTF-8" finds Utf8.
 * 匹配时忽略大小写，并将 '-' 视为 '_'，因此 "UTF-8" 可以找到 Utf8。
 */
std::optional<Encoding> StringToEncoding(std::string_view name) noexcept;

}  // namespace cpputil

namespace YAML {

template <>
struct convert<cpputil::Encoding> {
    static Node encode(const cpputil::Encoding& rhs);
    static bool decode(const Node& node, cpputil::Encoding& rhs);
};

}  // namespace YAML
