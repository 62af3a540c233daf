#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <system_error>
#include <vector>

#include "pedvss/common.hpp"

namespace PedVss::Crypto {

/**
 * @class RandomSource
 * @brief Source of uniformly random bytes consumed by scalar sampling.
 *
 * Production code uses SystemRandom. Tests inject DeterministicRandom to make
 * coefficient draws, and therefore every share, reproducible.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    [[nodiscard]]
    virtual auto fill(std::span<Byte> out) -> std::expected<void, std::error_code> = 0;
};

// OpenSSL CSPRNG (RAND_bytes)
class SystemRandom final : public RandomSource {
public:
    [[nodiscard]]
    auto fill(std::span<Byte> out) -> std::expected<void, std::error_code> override;
};

/**
 * @class DeterministicRandom
 * @brief SHA-256 counter-mode byte stream: block_i = SHA256(seed || be64(i)).
 *
 * Not for production use. Not thread-safe.
 */
class DeterministicRandom final : public RandomSource {
public:
    explicit DeterministicRandom(BytesSpan seed);
    explicit DeterministicRandom(uint64_t seed);

    [[nodiscard]]
    auto fill(std::span<Byte> out) -> std::expected<void, std::error_code> override;

private:
    auto next_block() -> std::expected<void, std::error_code>;

    std::vector<Byte> seed_;
    uint64_t counter_ = 0;
    Hash256 block_ {};
    size_t used_ = block_.size();
};

} // namespace PedVss::Crypto
