#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace PedVss::Crypto {

enum class Error : std::uint8_t {
    Success = 0,
    EqualGenerators, // g == h，承诺退化
    InvalidGenerator, // 生成元为无穷远点或不在 G1 子群中
    InvalidThreshold, // t 不在 [1, n] 内
    InvalidParticipantCount, // n < 1
    InvalidSecret, // 秘密为 0
    InsufficientShares, // 重构时份额数量不足 t
    DuplicateIndex, // 重构时出现重复的参与者编号
    InvalidShareIndex, // 参与者编号 < 1
    RandomnessFailure, // 随机源失败
    InvalidEncoding, // 字节串无法解码为标量或群元素
};

class VssErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "PedVss"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Error>(ev)) {
        case Error::Success:
            return "Success";
        case Error::EqualGenerators:
            return "Generators g and h must be different";
        case Error::InvalidGenerator:
            return "Generator must be a non-identity element of G1";
        case Error::InvalidThreshold:
            return "Threshold t must be between 1 and the number of participants";
        case Error::InvalidParticipantCount:
            return "Participant count must be positive";
        case Error::InvalidSecret:
            return "Secret must be a non-zero scalar";
        case Error::InsufficientShares:
            return "Not enough shares to reconstruct the secret";
        case Error::DuplicateIndex:
            return "Shares carry a duplicate participant index";
        case Error::InvalidShareIndex:
            return "Share index must be at least 1";
        case Error::RandomnessFailure:
            return "Random source failure";
        case Error::InvalidEncoding:
            return "Malformed scalar or point encoding";
        default:
            return "Unknown PedVss error";
        }
    }
};

inline const std::error_category& vss_category()
{
    static VssErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(Error e)
{
    return { static_cast<int>(e), vss_category() };
}

} // namespace PedVss::Crypto

namespace std {
template <>
struct is_error_code_enum<PedVss::Crypto::Error> : true_type { };
} // namespace std
