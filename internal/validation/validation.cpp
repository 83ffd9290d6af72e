#include "validation.hpp"

#include <algorithm>
#include <array>
#include <string>

#include "internal/core/constants.hpp"
#include "internal/network/networks.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"
#include "internal/util/uint256.hpp"

namespace x402::validation {

namespace {

using util::ErrorKind;
using util::ValidationError;

constexpr std::uint64_t kMaxSafeInteger = (1ULL << 53) - 1;

constexpr std::array<std::string_view, 3> kSchemes = {"exact", "upto", "subscription"};

constexpr std::string_view kBase58Alphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

bool IsAlnum(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool IsEvmAddress(std::string_view address) {
  if (address.size() != 42 || address[0] != '0' || (address[1] != 'x' && address[1] != 'X')) {
    return false;
  }
  return std::all_of(address.begin() + 2, address.end(), util::IsHexDigit);
}

bool IsSolanaAddress(std::string_view address) {
  if (address.size() < 32 || address.size() > 44) {
    return false;
  }
  return std::all_of(address.begin(), address.end(),
                     [](char c) { return kBase58Alphabet.find(c) != std::string_view::npos; });
}

} // namespace

bool ValidateChainId(std::uint64_t id) {
  return id > 0 && id < kMaxSafeInteger;
}

bool ValidateNetwork(std::string_view name) {
  if (network::FindNetwork(name)) {
    return true;
  }

  const auto colon = name.find(':');
  if (colon == std::string_view::npos) {
    return false;
  }
  const auto ns        = name.substr(0, colon);
  const auto reference = name.substr(colon + 1);

  if (ns == "eip155") {
    const auto chain_id = network::ChainIdOf(name);
    return chain_id && ValidateChainId(*chain_id);
  }
  if (ns == "solana") {
    return !reference.empty() && reference.size() <= 32 && std::all_of(reference.begin(), reference.end(), IsAlnum);
  }
  return false;
}

bool ValidateScheme(std::string_view name) {
  return std::find(kSchemes.begin(), kSchemes.end(), name) != kSchemes.end();
}

bool ValidateAddress(std::string_view address) {
  return IsEvmAddress(address) || IsSolanaAddress(address);
}

bool ValidateAddress(std::string_view address, network::NetworkFamily family) {
  switch (family) {
    case network::NetworkFamily::kEvm:
      return IsEvmAddress(address);
    case network::NetworkFamily::kSolana:
      return IsSolanaAddress(address);
    case network::NetworkFamily::kUnspecified:
    default:
      return ValidateAddress(address);
  }
}

bool ValidateAmount(std::string_view value) {
  return util::ParseUint256(value).has_value();
}

void ValidatePaymentData(const model::PaymentData& data) {
  if (!ValidateScheme(data.scheme)) {
    throw ValidationError(ErrorKind::kUnsupportedScheme, "unsupported scheme: " + data.scheme);
  }
  if (!ValidateNetwork(data.network)) {
    throw ValidationError(ErrorKind::kUnsupportedNetwork, "unsupported network: " + data.network);
  }

  const auto family = network::FamilyOf(data.network);
  if (!ValidateAddress(data.from, family)) {
    throw ValidationError(ErrorKind::kInvalidAddress, "invalid payer address: " + data.from);
  }
  if (!ValidateAddress(data.to, family)) {
    throw ValidationError(ErrorKind::kInvalidAddress, "invalid recipient address: " + data.to);
  }
  if (!ValidateAmount(data.amount)) {
    throw ValidationError(ErrorKind::kInvalidAmount, "invalid amount: " + data.amount);
  }
  if (data.valid_before < data.valid_after) {
    throw ValidationError(ErrorKind::kInvalidTimeWindow, "validBefore " + std::to_string(data.valid_before) +
                                                             " precedes validAfter " + std::to_string(data.valid_after));
  }
  if (!IsDeadlineWithinLimit(data.valid_before, data.valid_after)) {
    throw ValidationError(ErrorKind::kDeadlineTooFar, "deadline exceeds " + std::to_string(core::kMaxDeadlineSeconds) +
                                                          " seconds from validAfter");
  }
}

bool IsPaymentExpired(std::uint64_t deadline, std::uint64_t now) {
  return now > deadline;
}

bool IsPaymentValidNow(std::uint64_t deadline, std::uint64_t valid_after, std::uint64_t now) {
  return now >= valid_after && now <= deadline;
}

bool IsDeadlineWithinLimit(std::uint64_t deadline, std::uint64_t issued_at) {
  // deadline - issued_at without wrapping when deadline precedes issuance.
  return deadline <= issued_at || deadline - issued_at <= core::kMaxDeadlineSeconds;
}

} // namespace x402::validation
