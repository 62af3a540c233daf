#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <system_error>

#include "pedvss/bls/Scalar.hpp"
#include "pedvss/common.hpp"

namespace PedVss::Crypto::bls {

/**
 * @class P1
 * @brief BLS12-381 G1 point in Jacobian coordinates, layout-compatible with blst_p1.
 *
 * A default-constructed P1 is the point at infinity (Z = 0).
 */
class P1 {
public:
    static constexpr size_t COMPRESSED_SIZE = 48;
    static constexpr size_t SERIALIZED_SIZE = 96;

    P1() = default;

    /* ---------- factories ---------- */

    static P1 generator();
    static P1 identity();

    static P1 from_hash(BytesSpan msg, BytesSpan dst);

    // 接受 48 字节压缩或 96 字节非压缩编码，并做子群检查
    static auto from_bytes(BytesSpan in) -> std::expected<P1, std::error_code>;

    /* ---------- observers ---------- */

    [[nodiscard]] bool is_inf() const;
    [[nodiscard]] bool in_group() const;

    [[nodiscard]] std::array<Byte, COMPRESSED_SIZE> compress() const;
    [[nodiscard]] std::array<Byte, SERIALIZED_SIZE> serialize() const;

    /* ---------- mutators ---------- */

    P1& add(const P1& a);
    P1& mult(const Scalar& s);
    P1& neg();

    [[nodiscard]] P1 operator-() const;

    friend bool operator==(const P1& a, const P1& b);

private:
    // 3 * blst_fp (6 limbs each)
    std::array<uint64_t, 18> storage {};
};

} // namespace PedVss::Crypto::bls
