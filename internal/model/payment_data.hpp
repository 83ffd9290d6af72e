#pragma once

#include <cstdint>
#include <string>

#include "internal/crypto/types.hpp"
#include "x402/core/v1/payment.pb.h"

namespace x402::model {

/*
  Everything needed to evaluate one payment: the envelope's scheme/network,
  the authorization fields and the asset from the requirements.
*/
struct PaymentData {
  std::string scheme;
  std::string network;

  std::string from;
  std::string to;
  std::string asset;

  // Smallest token unit, unsigned decimal.
  std::string amount;

  std::uint64_t valid_after  = 0;
  std::uint64_t valid_before = 0;

  crypto::Hash256 nonce{};
};

// Throws CryptoError(kInvalidHex) if the authorization nonce is not 32 bytes
// of hex and DecodingError(kMissingField) if the payload carries no EVM
// authorization.
PaymentData FromPayload(const x402::core::v1::PaymentPayload&      payload,
                        const x402::core::v1::PaymentRequirements& requirements);

} // namespace x402::model
