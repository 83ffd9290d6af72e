#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/network/network_family.hpp"

namespace x402::network {

/*
  Static table of supported networks.

  A network is addressed either by registry name ("base-sepolia") or by its
  CAIP-2 identifier ("eip155:84532", "solana:devnet").
*/

struct NetworkInfo {
  std::string_view name;
  std::string_view display_name;
  NetworkFamily    family = NetworkFamily::kUnspecified;

  // EVM chain id; 0 for non-EVM networks.
  std::uint64_t chain_id = 0;

  // Solana cluster; empty for EVM networks.
  std::string_view cluster;

  std::string_view rpc_url;
  std::string_view explorer;

  std::string_view currency_symbol;
  std::uint32_t    currency_decimals = 0;

  // Empty when no USDC deployment is known.
  std::string_view usdc_address;
};

const std::vector<NetworkInfo>& ListNetworks();

// Lookup by registry name or CAIP-2 identifier.
std::optional<NetworkInfo> FindNetwork(std::string_view network);

// Throws CryptoError(kUnknownNetwork).
const NetworkInfo& GetNetwork(std::string_view name);

std::string ToCaip2(const NetworkInfo& info);
std::string ToCaip2(std::string_view name);

// Registry name for a CAIP-2 identifier; nullopt when not in the table.
std::optional<std::string_view> FromCaip2(std::string_view caip2);

// Throws CryptoError(kUnknownNetwork) when the network has no USDC entry.
std::string_view UsdcAddress(std::string_view name);

/*
  Family and chain id work for any well-formed CAIP-2 identifier, not only
  registry entries: "eip155:<n>" is EVM with chain id n, "solana:<ref>" is
  Solana.
*/
NetworkFamily                FamilyOf(std::string_view network);
std::optional<std::uint64_t> ChainIdOf(std::string_view network);

} // namespace x402::network
