#pragma once

#include "pedvss/bls/P1.hpp"
#include "pedvss/common.hpp"
#include <expected>
#include <string_view>
#include <system_error>

namespace PedVss::Crypto::Vss {

namespace Constants {
    constexpr std::string_view DST_GENERATOR_H = "PEDVSS_BLS12381G1_XMD:SHA-256_SSWU_RO_GENERATOR_H_";
    constexpr std::string_view GENERATOR_H_SEED = "Pedersen VSS second generator";
    // 参与方数量上限，share 下标 1..n 均可用 int 表示
    constexpr int MAX_PARTICIPANTS = 65535;
}

/**
 * @struct Generators
 * @brief The two public bases g and h of a Pedersen commitment.
 *
 * Nobody may know log_g(h); otherwise commitments stop being binding.
 */
struct Generators {
    bls::P1 g;
    bls::P1 h;

    // g = 标准 G1 生成元, h = hash_to_g1(GENERATOR_H_SEED)，无人知道其离散对数
    [[nodiscard]] static Generators standard();

    // 从压缩 (48B) 或非压缩 (96B) 编码加载。做解码、子群与单位元检查，相等性由 PedersenVss::create 检查
    [[nodiscard]] static auto from_bytes(BytesSpan g_bytes, BytesSpan h_bytes)
        -> std::expected<Generators, std::error_code>;
};

} // namespace PedVss::Crypto::Vss
