#include "pedvss/polynomial.hpp"
#include "pedvss/error.hpp"
#include "pedvss/random.hpp"

#include <unordered_set>

namespace PedVss::Crypto::Poly {

auto random_poly(RandomSource& rng, size_t count)
    -> std::expected<std::vector<Scalar>, std::error_code>
{
    std::vector<Scalar> coeffs;
    coeffs.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        auto c = Scalar::random(rng);
        if (!c)
            return std::unexpected(c.error());
        coeffs.push_back(*c);
    }
    return coeffs;
}

auto lagrange_coeffs_at_zero(std::span<const int> ids)
    -> std::expected<std::vector<Scalar>, std::error_code>
{
    const size_t k = ids.size();
    if (k == 0) {
        return std::unexpected(Error::InsufficientShares);
    }

    // --- 校验并提取插值点 x_i ---
    // 重复的 x 会让分母为零，必须在求逆之前拒绝
    std::vector<Scalar> xs;
    xs.reserve(k);
    std::unordered_set<int> seen_ids;
    for (int id : ids) {
        if (id < 1) {
            return std::unexpected(Error::InvalidShareIndex);
        }
        if (!seen_ids.insert(id).second) {
            return std::unexpected(Error::DuplicateIndex);
        }
        xs.push_back(Scalar::from_uint64(static_cast<uint64_t>(id)));
    }

    std::vector<Scalar> lambdas;
    lambdas.reserve(k);
    for (size_t i = 0; i < k; ++i) {
        auto numerator = Scalar::from_uint64(1);
        auto denominator = Scalar::from_uint64(1);
        for (size_t j = 0; j < k; ++j) {
            if (i == j)
                continue;
            numerator *= -xs[j];
            denominator *= (xs[i] - xs[j]);
        }
        lambdas.push_back(numerator * denominator.inverse());
    }
    return lambdas;
}

} // namespace PedVss::Crypto::Poly
