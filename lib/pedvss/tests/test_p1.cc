#include <algorithm>
#include <array>
#include <gtest/gtest.h>
#include <string_view>

#include "pedvss/bls/P1.hpp"
#include "pedvss/bls/Scalar.hpp"
#include "pedvss/common.hpp"
#include "pedvss/error.hpp"
#include "vss_test_utils.hpp"

using namespace PedVss::Crypto;
using bls::P1;
using bls::Scalar;

namespace {
// 标准 BLS12-381 G1 生成元的压缩编码
constexpr std::string_view G1_GENERATOR_HEX = "97f1d3a73197d7942695638c4fa9ac0fc3688c4f9774b905a14e3a3f171bac586c55e83ff97a1aeffb3af00adb22c6bb";
}

TEST(P1Test, GeneratorCompressesToKnownEncoding)
{
    auto bytes = P1::generator().compress();
    EXPECT_EQ(Utils::to_hex(bytes), G1_GENERATOR_HEX);
}

TEST(P1Test, FromBytesAcceptsCompressedAndUncompressed)
{
    auto g = P1::generator();
    g.mult(Scalar::from_uint64(99));

    auto compressed = g.compress();
    auto decoded = P1::from_bytes(compressed);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, g);

    auto serialized = g.serialize();
    auto decoded2 = P1::from_bytes(serialized);
    ASSERT_TRUE(decoded2.has_value());
    EXPECT_EQ(*decoded2, g);
}

TEST(P1Test, FromBytesRejectsMalformedInput)
{
    EXPECT_EQ(P1::from_bytes({}).error(), make_error_code(Error::InvalidEncoding));

    // 长度与压缩标志不一致
    auto compressed = P1::generator().compress();
    std::array<Byte, 96> padded {};
    std::copy(compressed.begin(), compressed.end(), padded.begin());
    EXPECT_FALSE(P1::from_bytes(padded).has_value());
    EXPECT_FALSE(P1::from_bytes(BytesSpan(compressed).first(47)).has_value());

    // x >= p
    std::array<Byte, 48> bad {};
    bad.fill(Byte { 0xff });
    bad[0] = Byte { 0x9f };
    EXPECT_FALSE(P1::from_bytes(bad).has_value());
}

TEST(P1Test, FromBytesRejectsPointOffCurve)
{
    // x 合法，改动 y 后不再满足 y^2 = x^3 + 4
    auto serialized = P1::generator().serialize();
    serialized[P1::SERIALIZED_SIZE - 1] ^= Byte { 0x01 };
    auto decoded = P1::from_bytes(serialized);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), make_error_code(Error::InvalidEncoding));
}

TEST(P1Test, FromBytesRejectsPointOutsideG1)
{
    // (0, 2) 在曲线上 (2^2 = 0^3 + 4)，阶为 3，不属于 r 阶子群
    std::array<Byte, P1::SERIALIZED_SIZE> order_three {};
    order_three[P1::SERIALIZED_SIZE - 1] = Byte { 0x02 };
    auto decoded = P1::from_bytes(order_three);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), make_error_code(Error::InvalidEncoding));
}

TEST(P1Test, FromBytesAcceptsIdentityEncoding)
{
    std::array<Byte, P1::COMPRESSED_SIZE> identity {};
    identity[0] = Byte { 0xc0 };
    auto decoded = P1::from_bytes(identity);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->is_inf());
    EXPECT_EQ(*decoded, P1::identity());
}

TEST(P1Test, GroupLaw)
{
    auto g = P1::generator();

    auto two_g = g;
    two_g.add(g);
    auto g_times_two = g;
    g_times_two.mult(Scalar::from_uint64(2));
    EXPECT_EQ(two_g, g_times_two);

    auto sum = g;
    sum.add(-g);
    EXPECT_TRUE(sum.is_inf());
    EXPECT_EQ(sum, P1::identity());

    auto id = P1::identity();
    id.add(g);
    EXPECT_EQ(id, g);

    auto zero = g;
    zero.mult(Scalar::from_uint64(0));
    EXPECT_TRUE(zero.is_inf());
}

TEST(P1Test, HashToCurveIsDeterministicAndInGroup)
{
    auto dst = as_span("PEDVSS_TEST_DST");
    auto a = P1::from_hash(as_span("alpha"), dst);
    auto b = P1::from_hash(as_span("alpha"), dst);
    auto c = P1::from_hash(as_span("beta"), dst);

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_TRUE(a.in_group());
    EXPECT_FALSE(a.is_inf());
}
