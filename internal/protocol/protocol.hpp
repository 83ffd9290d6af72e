#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/core/constants.hpp"
#include "internal/crypto/types.hpp"
#include "x402/core/v1/payment.pb.h"

namespace x402::protocol {

/*
  Payee-side helpers: building requirements and 402 bodies, and the payer-side
  values that go into an authorization (window, nonce, amounts).
*/

struct PaymentConfig {
  std::string price; // smallest unit, decimal
  std::string asset;
  std::string network;
  std::string pay_to;
  std::string resource;
  std::string description;

  std::string   scheme      = "exact";
  std::string   mime_type   = core::kDefaultMimeType;
  std::uint64_t timeout     = core::kDefaultTimeoutSeconds;
  std::string   token_name;    // EIP-712 domain name, copied into extra when set
  std::string   token_version; // EIP-712 domain version, copied into extra when set
};

struct ValidityWindow {
  std::uint64_t valid_after  = 0;
  std::uint64_t valid_before = 0;
};

x402::core::v1::PaymentRequirements CreatePaymentRequirements(const PaymentConfig& config);

x402::core::v1::PaymentRequiredResponse
CreatePaymentRequiredResponse(const std::vector<x402::core::v1::PaymentRequirements>& accepts,
                              const std::string&                                      error = {});

// [now - kDefaultValidityBufferSeconds, now + duration]; valid_after floors at 0.
ValidityWindow GetValidityWindow(std::uint64_t duration_seconds, std::uint64_t now);

// 32 bytes from the OpenSSL CSPRNG.
crypto::Hash256 GenerateNonce();

// "1500000", 6 -> "1.5". Always keeps one fractional digit ("1.0").
// Throws ValidationError(kInvalidAmount) for non-digit input.
std::string FormatPaymentAmount(std::string_view amount, std::uint32_t decimals = 6);

// "1.5", 6 -> "1500000". Throws ValidationError(kInvalidAmount) for malformed
// text or more fractional digits than `decimals`.
std::string ParsePaymentAmount(std::string_view text, std::uint32_t decimals = 6);

} // namespace x402::protocol
