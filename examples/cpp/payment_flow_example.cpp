#include <iostream>
#include <string>

#include "internal/codec/payload_codec.hpp"
#include "internal/crypto/signature.hpp"
#include "internal/facilitator/payment_verifier.hpp"
#include "internal/network/networks.hpp"
#include "internal/protocol/protocol.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"
#include "internal/util/time.hpp"

int main() {
  using namespace x402;

  try {
    // Payee: price a resource at 0.01 USDC on Base Sepolia.
    protocol::PaymentConfig config;
    config.price         = protocol::ParsePaymentAmount("0.01");
    config.network       = network::ToCaip2("base-sepolia");
    config.asset         = std::string(network::UsdcAddress("base-sepolia"));
    config.pay_to        = "0x209693Bc6afc0C5328bA36FaF03C514EF312287C";
    config.resource      = "/api/weather";
    config.description   = "Current weather";
    config.token_name    = "USDC";
    config.token_version = "2";

    const auto requirements = protocol::CreatePaymentRequirements(config);
    std::cout << "402 body: "
              << codec::EncodePaymentRequiredResponse(protocol::CreatePaymentRequiredResponse({requirements})) << '\n';

    // Payer: sign an EIP-3009 authorization for exactly the asked amount.
    crypto::PrivateKey key{};
    key.fill(0x01);

    const auto now    = util::UnixNow();
    const auto window = protocol::GetValidityWindow(requirements.max_timeout_seconds(), now);

    core::v1::PaymentPayload payload;
    payload.set_x402_version(core::kX402Version);
    payload.set_scheme(requirements.scheme());
    payload.set_network(requirements.network());

    auto* auth = payload.mutable_payload()->mutable_authorization();
    auth->set_from(crypto::AddressToHex(crypto::AddressFromPrivateKey(key)));
    auth->set_to(requirements.pay_to());
    auth->set_value(requirements.max_amount_required());
    auth->set_valid_after(window.valid_after);
    auth->set_valid_before(window.valid_before);
    auth->set_nonce(util::ToHex(protocol::GenerateNonce()));

    facilitator::PaymentVerifier verifier;
    const auto digest = crypto::TransferWithAuthorizationDigest(verifier.DomainFor(requirements), *auth);
    payload.mutable_payload()->set_signature(util::ToHex(crypto::SignDigest(digest, key)));

    const auto header = codec::EncodePaymentToBase64(payload);
    std::cout << "X-PAYMENT: " << header << '\n';

    // Facilitator: decode the header and check it against the requirements.
    const auto result = verifier.Verify(codec::DecodePaymentFromBase64(header), requirements, now);
    if (!result.valid) {
      std::cerr << "verification failed: " << result.reason << '\n';
      return 1;
    }
    std::cout << "verified payment of " << protocol::FormatPaymentAmount(auth->value()) << " USDC from " << result.payer
              << '\n';
  } catch (const util::CryptoError& e) {
    std::cerr << util::ToString(e.kind()) << ": " << e.what() << '\n';
    return 1;
  }

  return 0;
}
