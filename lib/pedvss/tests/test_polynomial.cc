#include <gtest/gtest.h>
#include <vector>

#include "pedvss/bls/P1.hpp"
#include "pedvss/bls/Scalar.hpp"
#include "pedvss/error.hpp"
#include "pedvss/polynomial.hpp"
#include "pedvss/random.hpp"
#include "vss_test_utils.hpp"

using namespace PedVss::Crypto;
using bls::P1;
using bls::Scalar;

namespace {

Scalar naive_eval(const Scalar& x, const std::vector<Scalar>& coeffs)
{
    Scalar result {};
    Scalar power = Scalar::from_uint64(1);
    for (const auto& c : coeffs) {
        result += c * power;
        power *= x;
    }
    return result;
}

} // namespace

TEST(PolynomialTest, HornerMatchesKnownValues)
{
    // 3 + 2x + x^2
    std::vector<Scalar> coeffs = { Scalar::from_uint64(3), Scalar::from_uint64(2), Scalar::from_uint64(1) };

    EXPECT_EQ(Poly::polynom_eval(Scalar::from_uint64(0), coeffs), Scalar::from_uint64(3));
    EXPECT_EQ(Poly::polynom_eval(Scalar::from_uint64(1), coeffs), Scalar::from_uint64(6));
    EXPECT_EQ(Poly::polynom_eval(Scalar::from_uint64(5), coeffs), Scalar::from_uint64(38));
}

TEST(PolynomialTest, HornerMatchesNaiveEvaluation)
{
    DeterministicRandom rng(7);
    auto coeffs = Poly::random_poly(rng, 6);
    ASSERT_TRUE(coeffs.has_value());
    ASSERT_EQ(coeffs->size(), 6u);

    for (uint64_t x : { 1u, 2u, 17u, 1000u }) {
        auto sx = Scalar::from_uint64(x);
        EXPECT_EQ(Poly::polynom_eval(sx, *coeffs), naive_eval(sx, *coeffs)) << "x = " << x;
    }
}

TEST(PolynomialTest, EmptyPolynomialIsZero)
{
    EXPECT_TRUE(Poly::polynom_eval(Scalar::from_uint64(9), std::vector<Scalar> {}).is_zero());
    EXPECT_TRUE(Poly::polynom_eval<P1>(Scalar::from_uint64(9), std::vector<P1> {}).is_inf());
}

TEST(PolynomialTest, GroupEvaluationMatchesExponentEvaluation)
{
    DeterministicRandom rng(11);
    auto coeffs = Poly::random_poly(rng, 4);
    ASSERT_TRUE(coeffs.has_value());

    std::vector<P1> lifted;
    for (const auto& c : *coeffs) {
        auto p = P1::generator();
        p.mult(c);
        lifted.push_back(p);
    }

    auto x = Scalar::from_uint64(4);
    auto expected = P1::generator();
    expected.mult(Poly::polynom_eval(x, *coeffs));

    EXPECT_EQ(Poly::polynom_eval<P1>(x, lifted), expected);
}

TEST(PolynomialTest, LagrangeCoefficientsSumToOne)
{
    std::vector<int> ids = { 1, 3, 4, 9 };
    auto lambdas = Poly::lagrange_coeffs_at_zero(ids);
    ASSERT_TRUE(lambdas.has_value());
    ASSERT_EQ(lambdas->size(), ids.size());

    Scalar sum {};
    for (const auto& l : *lambdas)
        sum += l;
    EXPECT_EQ(sum, Scalar::from_uint64(1));
}

TEST(PolynomialTest, LagrangeKnownValues)
{
    // ids {1,2}: lambda_1 = 2, lambda_2 = -1
    std::vector<int> ids = { 1, 2 };
    auto lambdas = Poly::lagrange_coeffs_at_zero(ids);
    ASSERT_TRUE(lambdas.has_value());
    EXPECT_EQ((*lambdas)[0], Scalar::from_uint64(2));
    EXPECT_EQ((*lambdas)[1], -Scalar::from_uint64(1));

    // 单点插值的系数为 1
    std::vector<int> single = { 5 };
    EXPECT_EQ(Poly::lagrange_coeffs_at_zero(single).value()[0], Scalar::from_uint64(1));
}

TEST(PolynomialTest, LagrangeRejectsBadIds)
{
    std::vector<int> dup = { 1, 2, 1 };
    EXPECT_EQ(Poly::lagrange_coeffs_at_zero(dup).error(), make_error_code(Error::DuplicateIndex));

    std::vector<int> zero = { 0, 1 };
    EXPECT_EQ(Poly::lagrange_coeffs_at_zero(zero).error(), make_error_code(Error::InvalidShareIndex));

    EXPECT_EQ(Poly::lagrange_coeffs_at_zero({}).error(), make_error_code(Error::InsufficientShares));
}
