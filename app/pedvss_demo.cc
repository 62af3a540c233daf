#include "pedvss/bls/Scalar.hpp"
#include "pedvss/common.hpp"
#include "pedvss/error.hpp"
#include "pedvss/random.hpp"
#include "pedvss/vss/generators.hpp"
#include "pedvss/vss/pedersen_vss.hpp"

#include <charconv>
#include <expected>
#include <iostream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

using namespace PedVss::Crypto;

namespace {

struct DemoOptions {
    int threshold = 3;
    int participants = 5;
    std::optional<std::vector<Byte>> seed; // 设置后使用确定性随机源
    std::optional<std::string> g_hex;
    std::optional<std::string> h_hex;
};

void print_usage(std::ostream& os)
{
    os << "usage: pedvss_demo [-t THRESHOLD] [-n PARTICIPANTS] [--seed HEX]\n"
          "                   [--g HEX --h HEX]\n"
          "  --g/--h  compressed (48 byte) or uncompressed (96 byte) G1 points;\n"
          "           defaults to the standard generator pair\n";
}

std::optional<int> parse_int(std::string_view s)
{
    int v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc {} || ptr != s.data() + s.size())
        return std::nullopt;
    return v;
}

auto parse_args(std::span<char*> args) -> std::expected<DemoOptions, std::string>
{
    DemoOptions opts;
    for (size_t i = 1; i < args.size(); ++i) {
        std::string_view arg = args[i];
        auto value = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= args.size())
                return std::nullopt;
            return std::string_view(args[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            return std::unexpected(std::string {});
        }
        auto v = value();
        if (!v) {
            return std::unexpected("missing value for " + std::string(arg));
        }

        if (arg == "-t" || arg == "-n") {
            auto n = parse_int(*v);
            if (!n)
                return std::unexpected("not an integer: " + std::string(*v));
            (arg == "-t" ? opts.threshold : opts.participants) = *n;
        } else if (arg == "--seed") {
            auto bytes = Utils::from_hex(*v);
            if (bytes.empty())
                return std::unexpected("seed must be non-empty hex");
            opts.seed = std::move(bytes);
        } else if (arg == "--g") {
            opts.g_hex = std::string(*v);
        } else if (arg == "--h") {
            opts.h_hex = std::string(*v);
        } else {
            return std::unexpected("unknown option: " + std::string(arg));
        }
    }
    if (opts.g_hex.has_value() != opts.h_hex.has_value()) {
        return std::unexpected(std::string("--g and --h must be given together"));
    }
    return opts;
}

auto load_generators(const DemoOptions& opts) -> std::expected<Vss::Generators, std::error_code>
{
    if (!opts.g_hex)
        return Vss::Generators::standard();

    auto g_bytes = Utils::from_hex(*opts.g_hex);
    auto h_bytes = Utils::from_hex(*opts.h_hex);
    return Vss::Generators::from_bytes(g_bytes, h_bytes);
}

std::string hex(const bls::Scalar& s)
{
    auto bytes = s.to_be_bytes();
    return Utils::to_hex(bytes);
}

std::string hex(const bls::P1& p)
{
    auto bytes = p.compress();
    return Utils::to_hex(bytes);
}

} // namespace

int main(int argc, char** argv)
{
    auto opts = parse_args(std::span(argv, static_cast<size_t>(argc)));
    if (!opts) {
        if (!opts.error().empty())
            std::cerr << "error: " << opts.error() << "\n";
        print_usage(opts.error().empty() ? std::cout : std::cerr);
        return opts.error().empty() ? 0 : 2;
    }

    auto gens = load_generators(*opts);
    if (!gens) {
        std::cerr << "error: cannot load generators: " << gens.error().message() << "\n";
        return 1;
    }

    auto vss = Vss::PedersenVss::create(*gens);
    if (!vss) {
        std::cerr << "error: " << vss.error().message() << "\n";
        return 1;
    }

    std::unique_ptr<RandomSource> rng;
    if (opts->seed)
        rng = std::make_unique<DeterministicRandom>(*opts->seed);
    else
        rng = std::make_unique<SystemRandom>();

    auto secret = bls::Scalar::random_nonzero(*rng);
    if (!secret) {
        std::cerr << "error: " << secret.error().message() << "\n";
        return 1;
    }

    const int t = opts->threshold;
    const int n = opts->participants;

    auto shares = vss->share_secret(*secret, t, n, *rng);
    if (!shares) {
        std::cerr << "error: share_secret(t=" << t << ", n=" << n << "): "
                  << shares.error().message() << "\n";
        return 1;
    }

    std::cout << "Generator g in G1: " << hex(vss->g()) << "\n";
    std::cout << "Generator h in G1: " << hex(vss->h()) << "\n";

    const auto& commitment = *shares->front().commitment;
    for (size_t i = 0; i < commitment.size(); ++i) {
        std::cout << "Commitment C_" << i << ": " << hex(commitment[i]) << "\n";
    }
    std::cout << "---------------------------\n";

    bool all_valid = true;
    for (const auto& share : *shares) {
        bool is_valid = vss->verify_share(share);
        all_valid = all_valid && is_valid;
        std::cout << "Share Index: " << share.index << "\n"
                  << "Value1 (f_x): " << hex(share.value1) << "\n"
                  << "Value2 (g_x): " << hex(share.value2) << "\n"
                  << "Validation Result: " << (is_valid ? "valid" : "invalid") << "\n"
                  << "---------------------------\n";
    }

    // 取前 t 个份额重构
    std::span<const Vss::Share> selected(shares->data(), static_cast<size_t>(t));
    auto reconstructed = vss->reconstruct(selected, t);
    if (!reconstructed) {
        std::cerr << "error: reconstruct: " << reconstructed.error().message() << "\n";
        return 1;
    }

    std::cout << "Original Secret: " << hex(*secret) << "\n";
    std::cout << "Reconstructed Secret: " << hex(*reconstructed) << "\n";

    const bool success = (*secret == *reconstructed);
    std::cout << "Secret reconstruction: " << (success ? "success" : "failure") << "\n";

    return (success && all_valid) ? 0 : 1;
}
