#pragma once

#include <memory>
#include <openssl/evp.h>

extern "C" {
#include <blst.h>
}

namespace PedVss::Crypto::impl {

// Scalar 和 P1 都是标准布局类型，且唯一成员就是与 blst 类型等大的数组，
// 因此可以把包装类型的指针直接当作 blst 类型的指针使用。
template <typename BlstT, typename WrapperT>
inline BlstT* to_native(WrapperT* w)
{
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return reinterpret_cast<BlstT*>(w);
}

template <typename BlstT, typename WrapperT>
inline const BlstT* to_native(const WrapperT* w)
{
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return reinterpret_cast<const BlstT*>(w);
}

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX,
    decltype([](EVP_MD_CTX* ctx) {
        EVP_MD_CTX_free(ctx);
    })>;

} // namespace PedVss::Crypto::impl
