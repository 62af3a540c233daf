#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace PedVss::Crypto {

using Byte = std::byte;
using BytesSpan = std::span<const Byte>;
using Hash256 = std::array<Byte, 32>;

inline BytesSpan as_span(std::string_view s)
{
    return { reinterpret_cast<const Byte*>(s.data()), s.size() };
}

// blst / OpenSSL 接口都使用 uint8_t*
inline uint8_t* u8ptr(Byte* p) { return reinterpret_cast<uint8_t*>(p); }
inline const uint8_t* u8ptr(const Byte* p) { return reinterpret_cast<const uint8_t*>(p); }
inline const uint8_t* u8ptr(const char* p) { return reinterpret_cast<const uint8_t*>(p); }

namespace Utils {

    [[nodiscard]] Hash256 sha256(BytesSpan data);

    // 小写十六进制，无前缀
    [[nodiscard]] std::string to_hex(BytesSpan data);

    // 长度为奇数或含非法字符时返回空
    [[nodiscard]] std::vector<Byte> from_hex(std::string_view hex);

} // namespace Utils

} // namespace PedVss::Crypto
