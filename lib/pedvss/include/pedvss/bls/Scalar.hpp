#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <system_error>

#include "pedvss/common.hpp"

namespace PedVss::Crypto {
class RandomSource;
}

namespace PedVss::Crypto::bls {

/**
 * @struct Scalar
 * @brief Element of the BLS12-381 scalar field Fr, layout-compatible with blst_scalar.
 *
 * Values are always kept reduced mod r, so equality is a plain memory comparison.
 */
struct Scalar {
    static constexpr size_t BIT_LENGTH = 255;
    static constexpr size_t BYTE_LENGTH = 32;

    // little-endian, 与 blst_scalar 的字节序一致
    std::array<uint64_t, 4> limbs {};

    /* ---------- factories ---------- */

    static Scalar from_uint64(uint64_t v);

    // 任意长度输入，按 mod r 约简
    static Scalar from_be_bytes(BytesSpan bytes);

    // 仅接受规范编码 (< r)
    static auto from_canonical_be_bytes(std::span<const Byte, BYTE_LENGTH> bytes)
        -> std::expected<Scalar, std::error_code>;

    static auto random(RandomSource& rng, const char* DST = "PEDVSS_SCALAR_XMD:SHA-256_")
        -> std::expected<Scalar, std::error_code>;

    static auto random_nonzero(RandomSource& rng, const char* DST = "PEDVSS_SCALAR_XMD:SHA-256_")
        -> std::expected<Scalar, std::error_code>;

    /* ---------- serialization ---------- */

    void to_be_bytes(std::span<Byte, BYTE_LENGTH> out) const;
    [[nodiscard]] std::array<Byte, BYTE_LENGTH> to_be_bytes() const;

    /* ---------- arithmetic ---------- */

    Scalar& operator+=(const Scalar& other);
    Scalar& operator-=(const Scalar& other);
    Scalar& operator*=(const Scalar& other);

    [[nodiscard]] friend Scalar operator+(Scalar a, const Scalar& b) { return a += b; }
    [[nodiscard]] friend Scalar operator-(Scalar a, const Scalar& b) { return a -= b; }
    [[nodiscard]] friend Scalar operator*(Scalar a, const Scalar& b) { return a *= b; }

    [[nodiscard]] Scalar operator-() const;

    // 零的逆元定义为零，调用方负责排除
    [[nodiscard]] Scalar inverse() const;

    [[nodiscard]] bool is_zero() const;

    bool operator==(const Scalar& other) const = default;
};

} // namespace PedVss::Crypto::bls
