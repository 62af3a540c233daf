#include "pedvss/vss/generators.hpp"
#include "pedvss/error.hpp"

namespace PedVss::Crypto::Vss {

Generators Generators::standard()
{
    return {
        .g = bls::P1::generator(),
        .h = bls::P1::from_hash(as_span(Constants::GENERATOR_H_SEED), as_span(Constants::DST_GENERATOR_H)),
    };
}

auto Generators::from_bytes(BytesSpan g_bytes, BytesSpan h_bytes)
    -> std::expected<Generators, std::error_code>
{
    auto g = bls::P1::from_bytes(g_bytes);
    if (!g)
        return std::unexpected(g.error());

    auto h = bls::P1::from_bytes(h_bytes);
    if (!h)
        return std::unexpected(h.error());

    // 单位元可以合法编码，但不能作为生成元
    if (g->is_inf() || h->is_inf())
        return std::unexpected(Error::InvalidGenerator);

    return Generators { .g = *g, .h = *h };
}

} // namespace PedVss::Crypto::Vss
