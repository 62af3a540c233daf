#include <algorithm>
#include <array>
#include <bit>
#include <cstring>

extern "C" {
#include <blst.h>
}
#include "../impl_common.hpp"
#include "pedvss/bls/Scalar.hpp"
#include "pedvss/common.hpp"
#include "pedvss/error.hpp"
#include "pedvss/random.hpp"

namespace PedVss::Crypto::bls {
static_assert(sizeof(Scalar) == sizeof(blst_scalar), "Scalar size mismatch with blst_scalar");

using impl::to_native;

// blst_sk_*_n_check 的返回值只表示结果是否非零，输入总是已约简的，不存在失败路径。

Scalar& Scalar::operator+=(const Scalar& other)
{
    blst_sk_add_n_check(
        to_native<blst_scalar>(this),
        to_native<blst_scalar>(this),
        to_native<blst_scalar>(&other));
    return *this;
}

Scalar& Scalar::operator-=(const Scalar& other)
{
    blst_sk_sub_n_check(
        to_native<blst_scalar>(this),
        to_native<blst_scalar>(this),
        to_native<blst_scalar>(&other));
    return *this;
}

Scalar& Scalar::operator*=(const Scalar& other)
{
    blst_sk_mul_n_check(
        to_native<blst_scalar>(this),
        to_native<blst_scalar>(this),
        to_native<blst_scalar>(&other));
    return *this;
}

Scalar Scalar::operator-() const
{
    Scalar ret {};
    const Scalar zero {};
    blst_sk_sub_n_check(
        to_native<blst_scalar>(&ret),
        to_native<blst_scalar>(&zero),
        to_native<blst_scalar>(this));
    return ret;
}

Scalar Scalar::inverse() const
{
    Scalar r {};
    blst_sk_inverse(to_native<blst_scalar>(&r), to_native<blst_scalar>(this));
    return r;
}

bool Scalar::is_zero() const
{
    return std::ranges::all_of(limbs, [](uint64_t l) { return l == 0; });
}

Scalar Scalar::from_uint64(uint64_t v)
{
    if constexpr (std::endian::native == std::endian::little) {
        return Scalar { { v, 0, 0, 0 } };
    } else {
        Scalar s {};
        std::array<uint64_t, 4> tmp { v, 0, 0, 0 };
        blst_scalar_from_uint64(to_native<blst_scalar>(&s), tmp.data());
        return s;
    }
}

Scalar Scalar::from_be_bytes(BytesSpan bytes)
{
    Scalar s {};
    blst_scalar_from_be_bytes(
        to_native<blst_scalar>(&s),
        u8ptr(bytes.data()),
        bytes.size());
    return s;
}

auto Scalar::from_canonical_be_bytes(std::span<const Byte, BYTE_LENGTH> bytes)
    -> std::expected<Scalar, std::error_code>
{
    Scalar s {};
    blst_scalar_from_bendian(to_native<blst_scalar>(&s), u8ptr(bytes.data()));
    if (!blst_scalar_fr_check(to_native<blst_scalar>(&s))) {
        return std::unexpected(Error::InvalidEncoding);
    }
    return s;
}

auto Scalar::random(RandomSource& rng, const char* DST)
    -> std::expected<Scalar, std::error_code>
{
    std::array<Byte, 32> ikm {};
    if (auto filled = rng.fill(ikm); !filled) {
        return std::unexpected(filled.error());
    }

    // 扩展到 48 字节 (384 bits) 再模 r，消除模偏差
    std::array<uint8_t, 48> out {};
    blst_expand_message_xmd(out.data(), out.size(),
        u8ptr(ikm.data()), ikm.size(),
        u8ptr(DST), std::strlen(DST));

    Scalar s {};
    blst_scalar_from_be_bytes(to_native<blst_scalar>(&s), out.data(), out.size());
    return s;
}

auto Scalar::random_nonzero(RandomSource& rng, const char* DST)
    -> std::expected<Scalar, std::error_code>
{
    for (;;) {
        auto s = random(rng, DST);
        if (!s || !s->is_zero()) {
            return s;
        }
    }
}

void Scalar::to_be_bytes(std::span<Byte, BYTE_LENGTH> out) const
{
    blst_bendian_from_scalar(u8ptr(out.data()), to_native<blst_scalar>(this));
}

std::array<Byte, Scalar::BYTE_LENGTH> Scalar::to_be_bytes() const
{
    std::array<Byte, BYTE_LENGTH> buf {};
    to_be_bytes(buf);
    return buf;
}

} // namespace PedVss::Crypto::bls
