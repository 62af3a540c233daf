#include "pedvss/vss/pedersen_vss.hpp"
#include "pedvss/error.hpp"
#include "pedvss/polynomial.hpp"
#include "pedvss/random.hpp"

#include <memory>
#include <ranges>
#include <utility>

namespace PedVss::Crypto::Vss {

PedersenVss::PedersenVss(const P1& g, const P1& h)
    : g_(g)
    , h_(h)
{
}

auto PedersenVss::create(const P1& g, const P1& h)
    -> std::expected<PedersenVss, std::error_code>
{
    if (g == h)
        return std::unexpected(Error::EqualGenerators);
    if (g.is_inf() || h.is_inf())
        return std::unexpected(Error::InvalidGenerator);

    return PedersenVss(g, h);
}

P1 PedersenVss::commit(const Scalar& a, const Scalar& b) const
{
    P1 lhs = g_;
    lhs.mult(a);
    P1 rhs = h_;
    rhs.mult(b);
    return lhs.add(rhs);
}

auto PedersenVss::share_secret(const Scalar& secret, int t, int n, RandomSource& rng) const
    -> std::expected<std::vector<Share>, std::error_code>
{
    if (n < 1 || n > Constants::MAX_PARTICIPANTS)
        return std::unexpected(Error::InvalidParticipantCount);
    if (t < 1 || t > n)
        return std::unexpected(Error::InvalidThreshold);
    // 标准 Pedersen VSS 允许秘密为 0，这里沿用非零限制
    if (secret.is_zero())
        return std::unexpected(Error::InvalidSecret);

    const auto degree_plus_one = static_cast<size_t>(t);

    // f(0) = secret, 其余 t-1 个系数随机
    auto f_tail = Poly::random_poly(rng, degree_plus_one - 1);
    if (!f_tail)
        return std::unexpected(f_tail.error());

    std::vector<Scalar> f_coeffs;
    f_coeffs.reserve(degree_plus_one);
    f_coeffs.push_back(secret);
    f_coeffs.insert(f_coeffs.end(), f_tail->begin(), f_tail->end());

    // g(0) 只用于盲化，全部 t 个系数随机
    auto g_coeffs = Poly::random_poly(rng, degree_plus_one);
    if (!g_coeffs)
        return std::unexpected(g_coeffs.error());

    auto commitment = std::make_shared<Commitment>();
    commitment->reserve(degree_plus_one);
    for (size_t i = 0; i < degree_plus_one; ++i) {
        commitment->push_back(commit(f_coeffs[i], (*g_coeffs)[i]));
    }
    CommitmentHandle shared_commitment = std::move(commitment);

    std::vector<Share> shares;
    shares.reserve(static_cast<size_t>(n));
    for (int index = 1; index <= n; ++index) {
        const auto x = Scalar::from_uint64(static_cast<uint64_t>(index));
        shares.push_back({
            .index = index,
            .value1 = Poly::polynom_eval(x, f_coeffs),
            .value2 = Poly::polynom_eval(x, *g_coeffs),
            .commitment = shared_commitment,
        });
    }

    return shares;
}

auto PedersenVss::share_secret(const Scalar& secret, int t, int n) const
    -> std::expected<std::vector<Share>, std::error_code>
{
    SystemRandom rng;
    return share_secret(secret, t, n, rng);
}

bool PedersenVss::verify_share(const Share& share) const
{
    if (share.index < 1 || !share.commitment || share.commitment->empty())
        return false;

    // 左边: g^{f(i)} * h^{g(i)}
    const P1 lhs = commit(share.value1, share.value2);

    // 右边: prod_j C_j^{i^j}，在群上用 Horner 求值
    const auto x = Scalar::from_uint64(static_cast<uint64_t>(share.index));
    const P1 rhs = Poly::polynom_eval<P1>(x, *share.commitment);

    return lhs == rhs;
}

std::vector<int> PedersenVss::verify_shares(std::span<const Share> shares) const
{
    std::vector<int> failed;
    for (const auto& share : shares) {
        if (!verify_share(share))
            failed.push_back(share.index);
    }
    return failed;
}

auto PedersenVss::reconstruct(std::span<const Share> shares, int t) const
    -> std::expected<Scalar, std::error_code>
{
    if (t < 1)
        return std::unexpected(Error::InvalidThreshold);
    // 少于 t 个点时插值结果与秘密无关，必须在计算前拒绝
    if (shares.size() < static_cast<size_t>(t))
        return std::unexpected(Error::InsufficientShares);

    auto ids = shares
        | std::views::transform(&Share::index)
        | std::ranges::to<std::vector<int>>();

    auto lambdas = Poly::lagrange_coeffs_at_zero(ids);
    if (!lambdas)
        return std::unexpected(lambdas.error());

    // f(0) = sum_i f(x_i) * lambda_i
    Scalar secret {};
    for (const auto& [share, lambda] : std::views::zip(shares, *lambdas)) {
        secret += share.value1 * lambda;
    }
    return secret;
}

} // namespace PedVss::Crypto::Vss
