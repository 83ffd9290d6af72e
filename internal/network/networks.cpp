#include "networks.hpp"

#include <charconv>

#include "internal/util/errors.hpp"

namespace x402::network {

namespace {

constexpr std::string_view kEip155 = "eip155";
constexpr std::string_view kSolana = "solana";

std::vector<NetworkInfo> BuildTable() {
  return {
      {"base-mainnet", "Base Mainnet", NetworkFamily::kEvm, 8453, "", "https://mainnet.base.org", "https://basescan.org",
       "ETH", 18, "0x833589fCD6eDb6E08f4c7C32D4f71b54bdA02913"},
      {"base-sepolia", "Base Sepolia", NetworkFamily::kEvm, 84532, "", "https://sepolia.base.org",
       "https://sepolia.basescan.org", "ETH", 18, "0x036CbD53842c5426634e7929541eC2318f3dCF7e"},
      {"polygon", "Polygon", NetworkFamily::kEvm, 137, "", "https://polygon-rpc.com", "https://polygonscan.com", "MATIC",
       18, "0x2791Bca1f2de4661ED88A30C99A7a9449Aa84174"},
      {"bsc", "BNB Smart Chain", NetworkFamily::kEvm, 56, "", "https://bsc-dataseed.binance.org", "https://bscscan.com",
       "BNB", 18, "0x8AC76a51cc950d9822D68b83fE1Ad97B32Cd580d"},
      {"sei", "Sei Network", NetworkFamily::kEvm, 1329, "", "https://evm-rpc.sei-apis.com", "https://seitrace.com", "SEI",
       18, ""},
      {"peaq", "Peaq Network", NetworkFamily::kEvm, 3338, "", "https://peaq.api.onfinality.io/public",
       "https://peaq.subscan.io", "PEAQ", 18, ""},
      {"solana-mainnet", "Solana Mainnet", NetworkFamily::kSolana, 0, "mainnet", "https://api.mainnet-beta.solana.com",
       "https://explorer.solana.com", "SOL", 9, "EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v"},
      {"solana-devnet", "Solana Devnet", NetworkFamily::kSolana, 0, "devnet", "https://api.devnet.solana.com",
       "https://explorer.solana.com?cluster=devnet", "SOL", 9, "4zMMC9srt5Ri5X14GAgXhaHii3GnPAEERYPJgZJDncDU"},
  };
}

struct Caip2 {
  std::string_view ns;
  std::string_view reference;
};

std::optional<Caip2> SplitCaip2(std::string_view value) {
  const auto colon = value.find(':');
  if (colon == std::string_view::npos || value.find(':', colon + 1) != std::string_view::npos) {
    return std::nullopt;
  }
  return Caip2{value.substr(0, colon), value.substr(colon + 1)};
}

std::optional<std::uint64_t> ParseChainId(std::string_view reference) {
  if (reference.empty() || (reference.size() > 1 && reference[0] == '0')) {
    return std::nullopt;
  }

  std::uint64_t value = 0;
  const auto*   end   = reference.data() + reference.size();
  const auto [ptr, ec] = std::from_chars(reference.data(), end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

const NetworkInfo* FindByName(std::string_view name) {
  for (const auto& info : ListNetworks()) {
    if (info.name == name) {
      return &info;
    }
  }
  return nullptr;
}

} // namespace

const std::vector<NetworkInfo>& ListNetworks() {
  static const std::vector<NetworkInfo> table = BuildTable();
  return table;
}

std::optional<NetworkInfo> FindNetwork(std::string_view network) {
  if (const auto* info = FindByName(network)) {
    return *info;
  }
  if (auto name = FromCaip2(network)) {
    return *FindByName(*name);
  }
  return std::nullopt;
}

const NetworkInfo& GetNetwork(std::string_view name) {
  if (const auto* info = FindByName(name)) {
    return *info;
  }
  throw util::CryptoError(util::ErrorKind::kUnknownNetwork, "unknown network: " + std::string(name));
}

std::string ToCaip2(const NetworkInfo& info) {
  if (info.family == NetworkFamily::kEvm) {
    return std::string(kEip155) + ":" + std::to_string(info.chain_id);
  }
  return std::string(kSolana) + ":" + std::string(info.cluster);
}

std::string ToCaip2(std::string_view name) {
  return ToCaip2(GetNetwork(name));
}

std::optional<std::string_view> FromCaip2(std::string_view caip2) {
  const auto parts = SplitCaip2(caip2);
  if (!parts) {
    return std::nullopt;
  }

  if (parts->ns == kEip155) {
    const auto chain_id = ParseChainId(parts->reference);
    if (!chain_id) return std::nullopt;
    for (const auto& info : ListNetworks()) {
      if (info.family == NetworkFamily::kEvm && info.chain_id == *chain_id) return info.name;
    }
  } else if (parts->ns == kSolana) {
    for (const auto& info : ListNetworks()) {
      if (info.family == NetworkFamily::kSolana && info.cluster == parts->reference) return info.name;
    }
  }
  return std::nullopt;
}

std::string_view UsdcAddress(std::string_view name) {
  const auto& info = GetNetwork(name);
  if (info.usdc_address.empty()) {
    throw util::CryptoError(util::ErrorKind::kUnknownNetwork, "USDC not configured for network: " + std::string(name));
  }
  return info.usdc_address;
}

NetworkFamily FamilyOf(std::string_view network) {
  if (const auto* info = FindByName(network)) {
    return info->family;
  }

  const auto parts = SplitCaip2(network);
  if (!parts) return NetworkFamily::kUnspecified;
  if (parts->ns == kEip155) return NetworkFamily::kEvm;
  if (parts->ns == kSolana) return NetworkFamily::kSolana;
  return NetworkFamily::kUnspecified;
}

std::optional<std::uint64_t> ChainIdOf(std::string_view network) {
  if (const auto* info = FindByName(network)) {
    if (info->family != NetworkFamily::kEvm) return std::nullopt;
    return info->chain_id;
  }

  const auto parts = SplitCaip2(network);
  if (!parts || parts->ns != kEip155) {
    return std::nullopt;
  }
  return ParseChainId(parts->reference);
}

} // namespace x402::network
