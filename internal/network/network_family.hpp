#pragma once

#include <cstdint>
#include <string_view>

namespace x402::network {

enum class NetworkFamily : std::uint8_t {
  kUnspecified = 0,
  kEvm         = 1,
  kSolana      = 2,
};

constexpr std::string_view ToString(NetworkFamily family) {
  switch (family) {
    case NetworkFamily::kEvm:
      return "evm";
    case NetworkFamily::kSolana:
      return "solana";
    case NetworkFamily::kUnspecified:
    default:
      return "unspecified";
  }
}

} // namespace x402::network
