#include "internal/protocol/protocol.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/codec/payload_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace x402;

bool ThrowsInvalidAmount(std::string_view text, std::uint32_t decimals, bool format) {
  try {
    if (format) {
      (void)protocol::FormatPaymentAmount(text, decimals);
    } else {
      (void)protocol::ParsePaymentAmount(text, decimals);
    }
  } catch (const util::ValidationError& e) {
    return e.kind() == util::ErrorKind::kInvalidAmount;
  }
  return false;
}

protocol::PaymentConfig SampleConfig() {
  protocol::PaymentConfig config;
  config.price       = "100000";
  config.asset       = "0x833589fCD6eDb6E08f4c7C32D4f71b54bdA02913";
  config.network     = "eip155:8453";
  config.pay_to      = "0x209693Bc6afc0C5328bA36FaF03C514EF312287C";
  config.resource    = "/api/ai/generate";
  config.description = "AI content generation";
  return config;
}

void TestRequirementsDefaults() {
  const auto requirements = protocol::CreatePaymentRequirements(SampleConfig());
  assert(requirements.scheme() == "exact");
  assert(requirements.mime_type() == "application/json");
  assert(requirements.max_timeout_seconds() == core::kDefaultTimeoutSeconds);
  assert(requirements.max_amount_required() == "100000");
  assert(!requirements.has_extra());

  // Builder output is accepted by the decoder.
  (void)codec::DecodePaymentRequirements(codec::EncodePaymentRequirements(requirements));
}

void TestRequirementsExtra() {
  auto config          = SampleConfig();
  config.token_name    = "USD Coin";
  config.token_version = "2";
  config.timeout       = 60;

  const auto requirements = protocol::CreatePaymentRequirements(config);
  assert(requirements.max_timeout_seconds() == 60);
  assert(requirements.extra().fields().at("name").string_value() == "USD Coin");
  assert(requirements.extra().fields().at("version").string_value() == "2");
}

void TestPaymentRequiredResponse() {
  const auto requirements = protocol::CreatePaymentRequirements(SampleConfig());

  const auto response = protocol::CreatePaymentRequiredResponse({requirements, requirements}, "payment required");
  assert(response.x402_version() == core::kX402Version);
  assert(response.accepts_size() == 2);
  assert(response.error() == "payment required");

  const auto json = codec::EncodePaymentRequiredResponse(protocol::CreatePaymentRequiredResponse({requirements}));
  assert(json.find("\"accepts\":[") != std::string::npos);
  assert(json.find("\"error\":\"\"") != std::string::npos);
  assert(json.find("\"maxTimeoutSeconds\":300") != std::string::npos);
}

void TestValidityWindow() {
  const auto window = protocol::GetValidityWindow(300, 1700000000);
  assert(window.valid_after == 1700000000 - core::kDefaultValidityBufferSeconds);
  assert(window.valid_before == 1700000300);

  const auto early = protocol::GetValidityWindow(10, 30);
  assert(early.valid_after == 0);
  assert(early.valid_before == 40);
}

void TestNonceIsRandom() {
  const auto a = protocol::GenerateNonce();
  const auto b = protocol::GenerateNonce();
  assert(a != b);
  assert(a != crypto::Hash256{});
}

void TestFormatAmount() {
  assert(protocol::FormatPaymentAmount("1500000") == "1.5");
  assert(protocol::FormatPaymentAmount("100000") == "0.1");
  assert(protocol::FormatPaymentAmount("1000000") == "1.0");
  assert(protocol::FormatPaymentAmount("1") == "0.000001");
  assert(protocol::FormatPaymentAmount("0") == "0.0");
  assert(protocol::FormatPaymentAmount("000123456789", 6) == "123.456789");
  assert(protocol::FormatPaymentAmount("15", 0) == "15.0");
  assert(protocol::FormatPaymentAmount("1000000000000000000", 18) == "1.0");

  assert(ThrowsInvalidAmount("", 6, true));
  assert(ThrowsInvalidAmount("1.5", 6, true));
  assert(ThrowsInvalidAmount("-1", 6, true));
}

void TestParseAmount() {
  assert(protocol::ParsePaymentAmount("1.5") == "1500000");
  assert(protocol::ParsePaymentAmount("0.1") == "100000");
  assert(protocol::ParsePaymentAmount("1") == "1000000");
  assert(protocol::ParsePaymentAmount(".5") == "500000");
  assert(protocol::ParsePaymentAmount("0") == "0");
  assert(protocol::ParsePaymentAmount("0.000001") == "1");
  assert(protocol::ParsePaymentAmount("1", 18) == "1000000000000000000");

  assert(ThrowsInvalidAmount("", 6, false));
  assert(ThrowsInvalidAmount(".", 6, false));
  assert(ThrowsInvalidAmount("0.0000001", 6, false));
  assert(ThrowsInvalidAmount("1.2.3", 6, false));
  assert(ThrowsInvalidAmount("-1", 6, false));
  assert(ThrowsInvalidAmount("1e6", 6, false));
}

} // namespace

int main() {
  TestRequirementsDefaults();
  TestRequirementsExtra();
  TestPaymentRequiredResponse();
  TestValidityWindow();
  TestNonceIsRandom();
  TestFormatAmount();
  TestParseAmount();

  std::cout << "x402_unit_protocol: pass\n";
  return 0;
}
