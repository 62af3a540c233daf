#pragma once

#include "pedvss/bls/P1.hpp"
#include "pedvss/bls/Scalar.hpp"
#include "pedvss/vss/generators.hpp"
#include "pedvss/vss/types.hpp"
#include <expected>
#include <span>
#include <system_error>
#include <vector>

namespace PedVss::Crypto {
class RandomSource;
}

namespace PedVss::Crypto::Vss {

/**
 * @class PedersenVss
 * @brief Pedersen's non-interactive verifiable secret sharing over BLS12-381 G1.
 *
 * Pedersen, T. P. "Non-interactive and information-theoretic secure verifiable
 * secret sharing." CRYPTO 1991.
 *
 * The dealer picks f(x) with f(0) = secret and a blinding polynomial g(x), both of
 * degree t-1, and publishes C_i = g^{f_i} h^{g_i}. Participant i receives
 * (f(i), g(i)) and checks g^{f(i)} h^{g(i)} == prod_j C_j^{i^j}.
 *
 * An instance only holds the two public generators; it is immutable and may be
 * shared freely between threads.
 */
class PedersenVss {
public:
    /**
     * @brief Creates a sharing instance.
     * @return Error::EqualGenerators if g == h, Error::InvalidGenerator if either
     *         generator is the identity.
     */
    [[nodiscard]]
    static auto create(const P1& g, const P1& h)
        -> std::expected<PedersenVss, std::error_code>;

    [[nodiscard]]
    static auto create(const Generators& gens)
        -> std::expected<PedersenVss, std::error_code>
    {
        return create(gens.g, gens.h);
    }

    /**
     * @brief Splits a secret into n shares with reconstruction threshold t.
     *
     * All returned shares reference the same commitment vector of t elements.
     *
     * @param secret Non-zero scalar to share.
     * @param t Threshold, 1 <= t <= n.
     * @param n Number of participants, 1 <= n <= Constants::MAX_PARTICIPANTS;
     *          shares carry indices 1..n.
     * @param rng Source of the polynomial coefficients.
     * @return n shares, or Error::InvalidParticipantCount, Error::InvalidThreshold,
     *         Error::InvalidSecret, or the random source's error.
     */
    [[nodiscard]]
    auto share_secret(const Scalar& secret, int t, int n, RandomSource& rng) const
        -> std::expected<std::vector<Share>, std::error_code>;

    // 使用 OpenSSL CSPRNG
    [[nodiscard]]
    auto share_secret(const Scalar& secret, int t, int n) const
        -> std::expected<std::vector<Share>, std::error_code>;

    /**
     * @brief Checks g^{value1} h^{value2} == sum_i C_i * index^i.
     *
     * Shares without a commitment, with an empty commitment, or with index < 1
     * never verify.
     */
    [[nodiscard]]
    bool verify_share(const Share& share) const;

    // 返回验证失败的份额编号（按输入顺序）
    [[nodiscard]]
    std::vector<int> verify_shares(std::span<const Share> shares) const;

    /**
     * @brief Recovers f(0) by Lagrange interpolation over every supplied share.
     *
     * Shares are not verified here; run verify_share first when their origin is
     * untrusted.
     *
     * @return The secret, or Error::InvalidThreshold (t < 1),
     *         Error::InsufficientShares (fewer than t shares), Error::InvalidShareIndex,
     *         Error::DuplicateIndex.
     */
    [[nodiscard]]
    auto reconstruct(std::span<const Share> shares, int t) const
        -> std::expected<Scalar, std::error_code>;

    [[nodiscard]] const P1& g() const { return g_; }
    [[nodiscard]] const P1& h() const { return h_; }

private:
    PedersenVss(const P1& g, const P1& h);

    // g * a + h * b
    [[nodiscard]] P1 commit(const Scalar& a, const Scalar& b) const;

    P1 g_;
    P1 h_;
};

} // namespace PedVss::Crypto::Vss
