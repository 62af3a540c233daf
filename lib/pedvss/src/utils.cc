#include "pedvss/common.hpp"

#include <openssl/sha.h>
#include <string>

namespace PedVss::Crypto::Utils {

Hash256 sha256(BytesSpan data)
{
    Hash256 hash {};
    SHA256(u8ptr(data.data()), data.size(), u8ptr(hash.data()));
    return hash;
}

std::string to_hex(BytesSpan data)
{
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (Byte b : data) {
        const auto v = std::to_integer<unsigned>(b);
        out.push_back(DIGITS[v >> 4]);
        out.push_back(DIGITS[v & 0x0F]);
    }
    return out;
}

std::vector<Byte> from_hex(std::string_view hex)
{
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    };

    if (hex.starts_with("0x") || hex.starts_with("0X"))
        hex.remove_prefix(2);
    if (hex.size() % 2 != 0)
        return {};

    std::vector<Byte> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0)
            return {};
        out.push_back(static_cast<Byte>((hi << 4) | lo));
    }
    return out;
}

} // namespace PedVss::Crypto::Utils
