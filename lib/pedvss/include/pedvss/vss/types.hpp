#pragma once

#include "pedvss/bls/P1.hpp"
#include "pedvss/bls/Scalar.hpp"
#include <memory>
#include <vector>

namespace PedVss::Crypto::Vss {

using Scalar = bls::Scalar;
using P1 = bls::P1;

// C_i = g * f_i + h * g_i, i = 0..t-1
using Commitment = std::vector<P1>;

// 同一次分发的所有份额共享同一个只读承诺向量
using CommitmentHandle = std::shared_ptr<const Commitment>;

/**
 * @struct Share
 * @brief One participant's share of a Pedersen sharing.
 */
struct Share {
    int index {}; // participant index, 1..n
    Scalar value1; // f(index)
    Scalar value2; // g(index), the blinding share
    CommitmentHandle commitment;
};

} // namespace PedVss::Crypto::Vss
