#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/codec/payload_codec.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/crypto/hashing.hpp"
#include "internal/crypto/merkle.hpp"
#include "internal/facilitator/payment_verifier.hpp"
#include "internal/network/networks.hpp"
#include "internal/observability/logging.hpp"
#include "internal/protocol/protocol.hpp"
#include "internal/util/exit_code.hpp"
#include "internal/util/hex.hpp"
#include "internal/util/time.hpp"

using namespace x402;

static void Usage() {
  std::cout << "Usage:\n"
            << "  x402ctl [--config <config.yaml>] <command>\n"
            << "\n"
            << "Commands:\n"
            << "  hash <data> [keccak256|sha256|sha3-256|double-keccak256]\n"
            << "  nonce\n"
            << "  decode <x-payment-base64>\n"
            << "  verify <x-payment-base64> <requirements-json> [now_unix_seconds]\n"
            << "  merkle-root <leaf-hex>...\n"
            << "  network list\n"
            << "  network info <name>\n"
            << "  network usdc <name>\n";
}

static std::optional<std::uint64_t> ParseU64(const std::string& s) {
  std::uint64_t value = 0;
  const auto*   end   = s.data() + s.size();
  const auto [ptr, ec] = std::from_chars(s.data(), end, value);
  if (s.empty() || ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

static void PrintNetwork(const network::NetworkInfo& info) {
  std::cout << "name=" << info.name << "\n";
  std::cout << "display_name=" << info.display_name << "\n";
  std::cout << "family=" << network::ToString(info.family) << "\n";
  std::cout << "caip2=" << network::ToCaip2(info) << "\n";
  if (info.family == network::NetworkFamily::kEvm) {
    std::cout << "chain_id=" << info.chain_id << "\n";
  } else {
    std::cout << "cluster=" << info.cluster << "\n";
  }
  std::cout << "rpc_url=" << info.rpc_url << "\n";
  std::cout << "explorer=" << info.explorer << "\n";
  std::cout << "currency=" << info.currency_symbol << " (" << info.currency_decimals << " decimals)\n";
  if (!info.usdc_address.empty()) {
    std::cout << "usdc=" << info.usdc_address << "\n";
  }
}

static int Run(const x402::runtime::config::RuntimeConfig& config, const std::vector<std::string>& args) {
  const std::string& cmd = args[0];

  // ------------------------------------------------------------

  if (cmd == "hash") {
    if (args.size() < 2 || args.size() > 3) return util::kExitUsage;

    const std::string algorithm = args.size() == 3 ? args[2] : "keccak256";
    std::cout << util::ToHex(crypto::Digest(algorithm, args[1])) << "\n";
    return util::kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "nonce") {
    std::cout << util::ToHex(protocol::GenerateNonce()) << "\n";
    return util::kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "decode") {
    if (args.size() != 2) return util::kExitUsage;

    const auto payload = codec::DecodePaymentFromBase64(args[1]);
    std::cout << codec::EncodeX402Payload(payload) << "\n";
    return util::kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "verify") {
    if (args.size() < 3 || args.size() > 4) return util::kExitUsage;

    std::uint64_t now = util::UnixNow();
    if (args.size() == 4) {
      auto parsed = ParseU64(args[3]);
      if (!parsed) {
        std::cerr << "invalid timestamp: " << args[3] << "\n";
        return util::kExitUsage;
      }
      now = *parsed;
    }

    const auto payload      = codec::DecodePaymentFromBase64(args[1]);
    const auto requirements = codec::DecodePaymentRequirements(args[2]);

    facilitator::PaymentVerifier verifier(config.verification());
    const auto                   result = verifier.Verify(payload, requirements, now);
    if (!result.valid) {
      std::cout << "invalid reason=" << result.reason << "\n";
      return util::kExitValidation;
    }
    std::cout << "valid payer=" << result.payer << "\n";
    return util::kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "merkle-root") {
    if (args.size() < 2) return util::kExitUsage;

    std::vector<crypto::Hash256> leaves(args.size() - 1);
    for (std::size_t i = 1; i < args.size(); ++i) {
      util::FromHexExact(args[i], leaves[i - 1].data(), leaves[i - 1].size());
    }
    std::cout << util::ToHex(crypto::ComputeMerkleRoot(leaves)) << "\n";
    return util::kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "network") {
    if (args.size() < 2) return util::kExitUsage;

    if (args[1] == "list") {
      for (const auto& info : network::ListNetworks()) {
        std::cout << info.name << " " << network::ToCaip2(info) << " " << info.display_name << "\n";
      }
      return util::kExitOk;
    }
    if (args[1] == "info" && args.size() == 3) {
      PrintNetwork(network::GetNetwork(args[2]));
      return util::kExitOk;
    }
    if (args[1] == "usdc" && args.size() == 3) {
      std::cout << network::UsdcAddress(args[2]) << "\n";
      return util::kExitOk;
    }
    return util::kExitUsage;
  }

  return util::kExitUsage;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (!args.empty() && args[0] == "--config") {
    if (args.size() < 2) {
      Usage();
      return util::kExitUsage;
    }
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.empty()) {
    Usage();
    return util::kExitUsage;
  }

  try {
    x402::runtime::config::RuntimeConfig runtime_config;
    if (!config_path.empty()) {
      runtime_config = config::ConfigLoader::LoadFromYaml(config_path);
    }
    observability::InitializeLogging(runtime_config);

    const int code = Run(runtime_config, args);
    if (code == util::kExitUsage) {
      Usage();
    }
    observability::ShutdownLogging();
    return code;
  } catch (const std::exception& e) {
    X402_LOG_ERROR("command failed", {observability::StringField("command", args[0]),
                                      observability::StringField("error", e.what())});
    observability::ShutdownLogging();
    return util::ToExitCode(e);
  }
}
