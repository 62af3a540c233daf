extern "C" {
#include <blst.h>
}

#include "../impl_common.hpp"
#include "pedvss/bls/P1.hpp"
#include "pedvss/bls/Scalar.hpp"
#include "pedvss/common.hpp"
#include "pedvss/error.hpp"
#include <array>
#include <cstddef>

namespace PedVss::Crypto::bls {
using impl::to_native;

static_assert(sizeof(P1) == sizeof(blst_p1), "P1 size mismatch");
static_assert(alignof(P1) >= alignof(blst_p1), "P1 alignment mismatch");

P1 P1::generator()
{
    P1 ret {};
    *to_native<blst_p1>(&ret) = *blst_p1_generator();
    return ret;
}

P1 P1::identity()
{
    // blst 中 Z == 0 即无穷远点，值初始化即为全零
    return P1 {};
}

P1 P1::from_hash(BytesSpan msg, BytesSpan dst)
{
    P1 ret {};
    blst_hash_to_g1(
        to_native<blst_p1>(&ret),
        u8ptr(msg.data()), msg.size(),
        u8ptr(dst.data()), dst.size(),
        nullptr, 0);
    return ret;
}

auto P1::from_bytes(BytesSpan in) -> std::expected<P1, std::error_code>
{
    if (in.empty()) {
        return std::unexpected(Error::InvalidEncoding);
    }
    // 最高位为压缩标志，必须与长度一致
    const bool compressed = (std::to_integer<uint8_t>(in[0]) & 0x80) != 0;
    if ((compressed && in.size() != COMPRESSED_SIZE) || (!compressed && in.size() != SERIALIZED_SIZE)) {
        return std::unexpected(Error::InvalidEncoding);
    }

    blst_p1_affine a;
    if (blst_p1_deserialize(&a, u8ptr(in.data())) != BLST_SUCCESS) {
        return std::unexpected(Error::InvalidEncoding);
    }
    if (!blst_p1_affine_in_g1(&a)) {
        return std::unexpected(Error::InvalidEncoding);
    }

    P1 ret {};
    blst_p1_from_affine(to_native<blst_p1>(&ret), &a);
    return ret;
}

bool P1::is_inf() const { return blst_p1_is_inf(to_native<blst_p1>(this)); }
bool P1::in_group() const { return blst_p1_in_g1(to_native<blst_p1>(this)); }

std::array<Byte, P1::COMPRESSED_SIZE> P1::compress() const
{
    std::array<Byte, COMPRESSED_SIZE> buf {};
    blst_p1_compress(u8ptr(buf.data()), to_native<blst_p1>(this));
    return buf;
}

std::array<Byte, P1::SERIALIZED_SIZE> P1::serialize() const
{
    std::array<Byte, SERIALIZED_SIZE> buf {};
    blst_p1_serialize(u8ptr(buf.data()), to_native<blst_p1>(this));
    return buf;
}

P1& P1::add(const P1& a)
{
    blst_p1_add_or_double(
        to_native<blst_p1>(this),
        to_native<blst_p1>(this),
        to_native<blst_p1>(&a));
    return *this;
}

P1& P1::mult(const Scalar& s)
{
    // blst_p1_mult 接收小端字节数组形式的标量
    blst_p1_mult(
        to_native<blst_p1>(this),
        to_native<blst_p1>(this),
        to_native<blst_scalar>(&s)->b,
        Scalar::BIT_LENGTH);
    return *this;
}

P1& P1::neg()
{
    blst_p1_cneg(to_native<blst_p1>(this), true);
    return *this;
}

P1 P1::operator-() const
{
    P1 ret = *this;
    ret.neg();
    return ret;
}

bool operator==(const P1& a, const P1& b)
{
    return blst_p1_is_equal(
        to_native<blst_p1>(&a),
        to_native<blst_p1>(&b));
}

} // namespace PedVss::Crypto::bls
