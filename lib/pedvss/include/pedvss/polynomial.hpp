#pragma once

#include "pedvss/bls/Scalar.hpp"
#include <concepts>
#include <cstddef>
#include <expected>
#include <span>
#include <system_error>
#include <vector>

namespace PedVss::Crypto {
class RandomSource;
}

namespace PedVss::Crypto::Poly {

using Scalar = bls::Scalar;

template <typename T>
concept IsGroupElement = requires(T a, const T& b, const Scalar& s) {
    { T::identity() } -> std::same_as<T>;
    { a.add(b) } -> std::same_as<T&>;
    { a.mult(s) } -> std::same_as<T&>;
};

// Horner's Rule:
// poly = a0 + a1*x + ... + an*x^n
//      = a0 + x(a1 + x(a2 + ...))
[[nodiscard]]
inline Scalar polynom_eval(const Scalar& x, std::span<const Scalar> coeffs)
{
    if (coeffs.empty())
        return Scalar::from_uint64(0);

    Scalar res = coeffs.back();
    for (auto it = coeffs.rbegin() + 1; it != coeffs.rend(); ++it) {
        res = res * x + (*it);
    }
    return res;
}

/**
 * @brief Evaluates a "polynomial in the exponent" whose coefficients are group elements.
 *
 * Returns sum_i C_i * x^i, computed with the same Horner fold as the scalar version.
 * Callers pass the template argument explicitly, e.g. polynom_eval<P1>(x, commitment).
 */
template <IsGroupElement T>
[[nodiscard]]
T polynom_eval(const Scalar& x, std::span<const T> coeffs)
{
    if (coeffs.empty())
        return T::identity();

    T res = coeffs.back();
    for (auto it = coeffs.rbegin() + 1; it != coeffs.rend(); ++it) {
        res.mult(x);
        res.add(*it);
    }
    return res;
}

// count 个独立均匀随机系数
[[nodiscard]]
auto random_poly(RandomSource& rng, size_t count)
    -> std::expected<std::vector<Scalar>, std::error_code>;

/**
 * @brief Lagrange basis coefficients at x = 0 for the given evaluation points.
 *
 * lambda_i = prod_{j != i} (0 - x_j) / (x_i - x_j)
 *
 * @param ids Participant indices x_i. Each must be >= 1 and pairwise distinct.
 * @return One coefficient per id, in the same order, or
 *         Error::InsufficientShares (empty input), Error::InvalidShareIndex,
 *         Error::DuplicateIndex.
 */
[[nodiscard]]
auto lagrange_coeffs_at_zero(std::span<const int> ids)
    -> std::expected<std::vector<Scalar>, std::error_code>;

} // namespace PedVss::Crypto::Poly
