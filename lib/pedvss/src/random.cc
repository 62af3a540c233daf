#include "pedvss/random.hpp"
#include "impl_common.hpp"
#include "pedvss/error.hpp"

#include <algorithm>
#include <array>
#include <climits>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace PedVss::Crypto {

auto SystemRandom::fill(std::span<Byte> out) -> std::expected<void, std::error_code>
{
    // RAND_bytes 的长度参数是 int，分块填充
    while (!out.empty()) {
        const size_t chunk = std::min<size_t>(out.size(), INT_MAX);
        if (RAND_bytes(u8ptr(out.data()), static_cast<int>(chunk)) != 1) {
            return std::unexpected(Error::RandomnessFailure);
        }
        out = out.subspan(chunk);
    }
    return {};
}

DeterministicRandom::DeterministicRandom(BytesSpan seed)
    : seed_(seed.begin(), seed.end())
{
}

DeterministicRandom::DeterministicRandom(uint64_t seed)
{
    seed_.reserve(sizeof(seed));
    for (int shift = 56; shift >= 0; shift -= 8) {
        seed_.push_back(static_cast<Byte>((seed >> shift) & 0xFF));
    }
}

auto DeterministicRandom::next_block() -> std::expected<void, std::error_code>
{
    std::array<Byte, 8> ctr {};
    for (size_t i = 0; i < ctr.size(); ++i) {
        ctr[i] = static_cast<Byte>((counter_ >> (56 - 8 * i)) & 0xFF);
    }

    impl::EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    unsigned int len = 0;
    if (!ctx
        || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(ctx.get(), seed_.data(), seed_.size()) != 1
        || EVP_DigestUpdate(ctx.get(), ctr.data(), ctr.size()) != 1
        || EVP_DigestFinal_ex(ctx.get(), u8ptr(block_.data()), &len) != 1) {
        return std::unexpected(Error::RandomnessFailure);
    }

    ++counter_;
    used_ = 0;
    return {};
}

auto DeterministicRandom::fill(std::span<Byte> out) -> std::expected<void, std::error_code>
{
    while (!out.empty()) {
        if (used_ == block_.size()) {
            if (auto ok = next_block(); !ok) {
                return ok;
            }
        }
        const size_t n = std::min(out.size(), block_.size() - used_);
        std::copy_n(block_.begin() + static_cast<std::ptrdiff_t>(used_), n, out.begin());
        used_ += n;
        out = out.subspan(n);
    }
    return {};
}

} // namespace PedVss::Crypto
