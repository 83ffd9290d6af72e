#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"
#include "internal/crypto/eip712.hpp"
#include "x402/core/v1/payment.pb.h"

namespace x402::facilitator {

struct VerificationResult {
  bool        valid = false;
  std::string reason; // empty when valid
  std::string payer;  // recovered signer, EIP-55 encoded, set when valid
};

/*
  Checks a decoded X-PAYMENT envelope against the requirements it claims to
  satisfy, for the EVM "exact" scheme:

    1. x402Version, scheme and network match
    2. an EIP-3009 authorization is present
    3. authorization.to == payTo (case-insensitive)
    4. authorization.value >= maxAmountRequired
    5. validAfter <= now <= validBefore
    6. validBefore - validAfter within kMaxDeadlineSeconds, and
       validBefore - now within maxTimeoutSeconds when that is set
    7. the EIP-712 TransferWithAuthorization signature recovers `from`

  The EIP-712 domain is {extra.name, extra.version, chain id of the network,
  asset}; name and version fall back to the configured defaults.

  Verify never throws on malformed input. The first failed check becomes the
  result's reason.
*/
class PaymentVerifier {
 public:
  explicit PaymentVerifier(x402::runtime::config::VerificationConfig config = {});

  VerificationResult Verify(const x402::core::v1::PaymentPayload&      payload,
                            const x402::core::v1::PaymentRequirements& requirements,
                            std::uint64_t                              now) const;

  // Domain the payer is expected to have signed under. Throws CryptoError
  // when the network has no EVM chain id or the asset is not an address.
  crypto::Eip712Domain DomainFor(const x402::core::v1::PaymentRequirements& requirements) const;

 private:
  VerificationResult Check(const x402::core::v1::PaymentPayload&      payload,
                           const x402::core::v1::PaymentRequirements& requirements,
                           std::uint64_t                              now) const;

  std::string default_token_name_;
  std::string default_token_version_;
};

} // namespace x402::facilitator
