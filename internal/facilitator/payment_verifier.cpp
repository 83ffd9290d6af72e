#include "payment_verifier.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>
#include <utility>

#include "internal/core/constants.hpp"
#include "internal/crypto/signature.hpp"
#include "internal/network/networks.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uint256.hpp"
#include "internal/validation/validation.hpp"

namespace x402::facilitator {

namespace {

using x402::core::v1::PaymentPayload;
using x402::core::v1::PaymentRequirements;

constexpr char kFallbackTokenName[]    = "USD Coin";
constexpr char kFallbackTokenVersion[] = "2";

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
         });
}

std::string ExtraString(const PaymentRequirements& requirements, const std::string& key) {
  if (!requirements.has_extra()) {
    return {};
  }
  const auto& fields = requirements.extra().fields();
  const auto  it     = fields.find(key);
  if (it == fields.end() || !it->second.has_string_value()) {
    return {};
  }
  return it->second.string_value();
}

VerificationResult Reject(std::string reason) {
  VerificationResult result;
  result.reason = std::move(reason);
  return result;
}

} // namespace

PaymentVerifier::PaymentVerifier(x402::runtime::config::VerificationConfig config)
    : default_token_name_(config.default_token_name().empty() ? kFallbackTokenName : config.default_token_name()),
      default_token_version_(config.default_token_version().empty() ? kFallbackTokenVersion
                                                                    : config.default_token_version()) {
}

crypto::Eip712Domain PaymentVerifier::DomainFor(const PaymentRequirements& requirements) const {
  const auto chain_id = network::ChainIdOf(requirements.network());
  if (!chain_id) {
    throw util::CryptoError(util::ErrorKind::kUnsupportedNetwork,
                            "network has no EVM chain id: " + requirements.network());
  }

  crypto::Eip712Domain domain;
  domain.name               = ExtraString(requirements, "name");
  domain.version            = ExtraString(requirements, "version");
  domain.chain_id           = *chain_id;
  domain.verifying_contract = crypto::AddressFromHex(requirements.asset());

  if (domain.name.empty()) domain.name = default_token_name_;
  if (domain.version.empty()) domain.version = default_token_version_;
  return domain;
}

VerificationResult PaymentVerifier::Verify(const PaymentPayload&      payload,
                                           const PaymentRequirements& requirements,
                                           std::uint64_t              now) const {
  X402_LOG_DEBUG("verifying payment", {observability::StringField("scheme", payload.scheme()),
                                       observability::StringField("network", payload.network()),
                                       observability::IntField("now", static_cast<std::int64_t>(now))});

  VerificationResult result;
  try {
    result = Check(payload, requirements, now);
  } catch (const util::CryptoError& e) {
    result = Reject(std::string(util::ToString(e.kind())) + ": " + e.what());
  }

  if (result.valid) {
    X402_LOG_INFO("payment verified", {observability::StringField("payer", result.payer),
                                       observability::StringField("network", payload.network()),
                                       observability::StringField("resource", requirements.resource())});
  } else {
    X402_LOG_WARN("payment rejected", {observability::StringField("reason", result.reason),
                                       observability::StringField("network", payload.network()),
                                       observability::StringField("resource", requirements.resource())});
  }
  return result;
}

VerificationResult PaymentVerifier::Check(const PaymentPayload&      payload,
                                          const PaymentRequirements& requirements,
                                          std::uint64_t              now) const {
  if (payload.x402_version() != core::kX402Version) {
    return Reject("unsupported x402 version " + std::to_string(payload.x402_version()));
  }
  if (payload.scheme() != requirements.scheme()) {
    return Reject("scheme mismatch");
  }
  if (payload.network() != requirements.network()) {
    return Reject("network mismatch");
  }
  if (!payload.has_payload() || !payload.payload().has_authorization()) {
    return Reject("missing authorization");
  }

  const auto& auth = payload.payload().authorization();

  if (!EqualsIgnoreCase(auth.to(), requirements.pay_to())) {
    return Reject("invalid recipient");
  }

  const auto value    = util::ParseUint256(auth.value());
  const auto required = util::ParseUint256(requirements.max_amount_required());
  if (!value || !required) {
    return Reject("invalid amount");
  }
  if (*value < *required) {
    return Reject("insufficient amount");
  }

  if (now < auth.valid_after()) {
    return Reject("payment not yet valid");
  }
  if (validation::IsPaymentExpired(auth.valid_before(), now)) {
    return Reject("payment expired");
  }

  if (!validation::IsDeadlineWithinLimit(auth.valid_before(), auth.valid_after())) {
    return Reject("deadline too far");
  }
  if (requirements.max_timeout_seconds() > 0 && auth.valid_before() - now > requirements.max_timeout_seconds()) {
    return Reject("deadline exceeds maxTimeoutSeconds");
  }

  const auto digest    = crypto::TransferWithAuthorizationDigest(DomainFor(requirements), auth);
  const auto signature = crypto::SignatureComponents::FromHex(payload.payload().signature()).ToBytes();
  const auto signer    = crypto::RecoverDigestSigner(digest, signature);

  if (signer != crypto::AddressFromHex(auth.from())) {
    return Reject("invalid signature");
  }

  VerificationResult result;
  result.valid = true;
  result.payer = crypto::AddressToHex(signer);
  return result;
}

} // namespace x402::facilitator
