#include "internal/facilitator/payment_verifier.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/codec/payload_codec.hpp"
#include "internal/crypto/signature.hpp"
#include "internal/protocol/protocol.hpp"
#include "internal/util/hex.hpp"

namespace {

using namespace x402;
using x402::core::v1::PaymentPayload;
using x402::core::v1::PaymentRequirements;

constexpr std::uint64_t kNow       = 1700000100;
constexpr char          kPayTo[]   = "0x209693Bc6afc0C5328bA36FaF03C514EF312287C";
constexpr char          kAsset[]   = "0x036CbD53842c5426634e7929541eC2318f3dCF7e";
constexpr char          kNetwork[] = "eip155:84532";

crypto::PrivateKey PayerKey() {
  crypto::PrivateKey key{};
  key.fill(0x01);
  return key;
}

PaymentRequirements Requirements() {
  protocol::PaymentConfig config;
  config.price         = "10000";
  config.asset         = kAsset;
  config.network       = kNetwork;
  config.pay_to        = kPayTo;
  config.resource      = "/api/weather";
  config.description   = "weather report";
  config.token_name    = "USD Coin";
  config.token_version = "2";
  return protocol::CreatePaymentRequirements(config);
}

// Signs with `signing_domain` so tests can produce signatures the verifier
// must reject.
PaymentPayload SignedPayload(const crypto::Eip712Domain& signing_domain, const std::string& value = "10000") {
  PaymentPayload payload;
  payload.set_x402_version(1);
  payload.set_scheme("exact");
  payload.set_network(kNetwork);

  auto* auth = payload.mutable_payload()->mutable_authorization();
  auth->set_from(crypto::AddressToHex(crypto::AddressFromPrivateKey(PayerKey())));
  auth->set_to(kPayTo);
  auth->set_value(value);
  auth->set_valid_after(1700000000);
  auth->set_valid_before(1700000300);
  auth->set_nonce(util::ToHex(crypto::Hash256{0x11}));

  const auto digest    = crypto::TransferWithAuthorizationDigest(signing_domain, *auth);
  const auto signature = crypto::SignDigest(digest, PayerKey());
  payload.mutable_payload()->set_signature(util::ToHex(signature));
  return payload;
}

PaymentPayload SignedPayload() {
  facilitator::PaymentVerifier verifier;
  return SignedPayload(verifier.DomainFor(Requirements()));
}

// The high-s twin of a signature: s := n - s with the recovery id flipped.
crypto::Signature Malleate(const crypto::Signature& signature) {
  static constexpr std::uint8_t kCurveOrder[32] = {
      0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE,
      0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48, 0xA0, 0x3B, 0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41};

  auto components = crypto::SignatureComponents::FromBytes(signature);
  int  borrow     = 0;
  for (int i = 31; i >= 0; --i) {
    int diff = kCurveOrder[i] - components.s[i] - borrow;
    borrow   = diff < 0 ? 1 : 0;
    components.s[i] = static_cast<std::uint8_t>(diff + (borrow ? 256 : 0));
  }
  components.recovery_id ^= 1;
  return components.ToBytes();
}

std::string Reason(const PaymentPayload& payload, const PaymentRequirements& requirements, std::uint64_t now = kNow) {
  facilitator::PaymentVerifier verifier;
  const auto                   result = verifier.Verify(payload, requirements, now);
  assert(!result.valid);
  assert(result.payer.empty());
  return result.reason;
}

void TestValidPaymentThroughHeader() {
  const auto header  = codec::EncodePaymentToBase64(SignedPayload());
  const auto decoded = codec::DecodePaymentFromBase64(header);

  facilitator::PaymentVerifier verifier;
  const auto                   result = verifier.Verify(decoded, Requirements(), kNow);
  assert(result.valid);
  assert(result.reason.empty());
  assert(result.payer == "0x1a642f0E3c3aF545E7AcBD38b07251B3990914F1");
}

void TestDomainDefaultsFromConfig() {
  auto requirements = Requirements();
  requirements.clear_extra();

  x402::runtime::config::VerificationConfig config;
  config.set_default_token_name("USDC");
  config.set_default_token_version("1");
  facilitator::PaymentVerifier verifier(config);

  const auto domain = verifier.DomainFor(requirements);
  assert(domain.name == "USDC");
  assert(domain.version == "1");
  assert(domain.chain_id == 84532);

  facilitator::PaymentVerifier fallback;
  assert(fallback.DomainFor(requirements).name == "USD Coin");
  assert(fallback.DomainFor(requirements).version == "2");
}

void TestEnvelopeMismatches() {
  auto payload = SignedPayload();
  payload.set_x402_version(2);
  assert(Reason(payload, Requirements()).find("version") != std::string::npos);

  payload = SignedPayload();
  payload.set_scheme("upto");
  assert(Reason(payload, Requirements()) == "scheme mismatch");

  payload = SignedPayload();
  payload.set_network("eip155:8453");
  assert(Reason(payload, Requirements()) == "network mismatch");

  payload = SignedPayload();
  payload.mutable_payload()->clear_authorization();
  payload.mutable_payload()->set_transaction("AQID");
  assert(Reason(payload, Requirements()) == "missing authorization");
}

void TestRecipientComparedCaseInsensitively() {
  auto requirements = Requirements();
  requirements.set_pay_to("0x209693bc6afc0c5328ba36faf03c514ef312287c");

  facilitator::PaymentVerifier verifier;
  assert(verifier.Verify(SignedPayload(), requirements, kNow).valid);

  requirements.set_pay_to("0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
  assert(Reason(SignedPayload(), requirements) == "invalid recipient");
}

void TestAmountChecks() {
  facilitator::PaymentVerifier verifier;
  const auto                   domain = verifier.DomainFor(Requirements());

  assert(Reason(SignedPayload(domain, "9999"), Requirements()) == "insufficient amount");
  assert(verifier.Verify(SignedPayload(domain, "10001"), Requirements(), kNow).valid);

  auto payload = SignedPayload();
  payload.mutable_payload()->mutable_authorization()->set_value("lots");
  assert(Reason(payload, Requirements()) == "invalid amount");
}

void TestTimeWindow() {
  facilitator::PaymentVerifier verifier;
  const auto                   payload = SignedPayload();

  assert(Reason(payload, Requirements(), 1699999999) == "payment not yet valid");
  assert(verifier.Verify(payload, Requirements(), 1700000000).valid);
  assert(verifier.Verify(payload, Requirements(), 1700000300).valid);
  assert(Reason(payload, Requirements(), 1700000301) == "payment expired");
}

void TestDeadlineBoundedByTimeout() {
  auto requirements = Requirements();
  requirements.set_max_timeout_seconds(60);
  // validBefore is 200s after kNow.
  assert(Reason(SignedPayload(), requirements) == "deadline exceeds maxTimeoutSeconds");
}

void TestTamperedValueFailsSignature() {
  auto payload = SignedPayload();
  payload.mutable_payload()->mutable_authorization()->set_value("20000");
  assert(Reason(payload, Requirements()) == "invalid signature");
}

void TestWrongDomainFailsSignature() {
  facilitator::PaymentVerifier verifier;
  auto                         domain = verifier.DomainFor(Requirements());
  domain.chain_id                     = 8453;
  assert(Reason(SignedPayload(domain), Requirements()) == "invalid signature");
}

void TestMalformedSignatureBecomesReason() {
  auto payload = SignedPayload();
  payload.mutable_payload()->set_signature("0x1234");
  assert(Reason(payload, Requirements()).find("malformed_signature") == 0);
}

void TestHighSSignatureRejected() {
  auto       payload   = SignedPayload();
  const auto signature = crypto::SignatureComponents::FromHex(payload.payload().signature()).ToBytes();
  payload.mutable_payload()->set_signature(util::ToHex(Malleate(signature)));

  const auto reason = Reason(payload, Requirements());
  assert(reason.find("malformed_signature") == 0);
  assert(reason.find("lower half") != std::string::npos);
}

} // namespace

int main() {
  TestValidPaymentThroughHeader();
  TestDomainDefaultsFromConfig();
  TestEnvelopeMismatches();
  TestRecipientComparedCaseInsensitively();
  TestAmountChecks();
  TestTimeWindow();
  TestDeadlineBoundedByTimeout();
  TestTamperedValueFailsSignature();
  TestWrongDomainFailsSignature();
  TestMalformedSignatureBecomesReason();
  TestHighSSignatureRejected();

  std::cout << "x402_unit_payment_verifier: pass\n";
  return 0;
}
