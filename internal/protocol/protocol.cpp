#include "protocol.hpp"

#include <openssl/rand.h>

#include <algorithm>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace x402::protocol {

namespace {

using util::ErrorKind;
using util::ValidationError;

bool IsDigits(std::string_view text) {
  return std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; });
}

std::string_view StripLeadingZeros(std::string_view digits) {
  const auto first = digits.find_first_not_of('0');
  return first == std::string_view::npos ? std::string_view{} : digits.substr(first);
}

[[noreturn]] void ThrowInvalidAmount(std::string_view text) {
  throw ValidationError(ErrorKind::kInvalidAmount, "invalid amount: " + std::string(text));
}

} // namespace

x402::core::v1::PaymentRequirements CreatePaymentRequirements(const PaymentConfig& config) {
  x402::core::v1::PaymentRequirements requirements;
  requirements.set_scheme(config.scheme);
  requirements.set_network(config.network);
  requirements.set_max_amount_required(config.price);
  requirements.set_resource(config.resource);
  requirements.set_description(config.description);
  requirements.set_mime_type(config.mime_type);
  requirements.set_pay_to(config.pay_to);
  requirements.set_max_timeout_seconds(config.timeout);
  requirements.set_asset(config.asset);

  if (!config.token_name.empty() || !config.token_version.empty()) {
    auto* fields = requirements.mutable_extra()->mutable_fields();
    if (!config.token_name.empty()) {
      (*fields)["name"].set_string_value(config.token_name);
    }
    if (!config.token_version.empty()) {
      (*fields)["version"].set_string_value(config.token_version);
    }
  }
  return requirements;
}

x402::core::v1::PaymentRequiredResponse
CreatePaymentRequiredResponse(const std::vector<x402::core::v1::PaymentRequirements>& accepts,
                              const std::string&                                      error) {
  x402::core::v1::PaymentRequiredResponse response;
  response.set_x402_version(core::kX402Version);
  for (const auto& requirements : accepts) {
    *response.add_accepts() = requirements;
  }
  if (!error.empty()) {
    response.set_error(error);
  }
  return response;
}

ValidityWindow GetValidityWindow(std::uint64_t duration_seconds, std::uint64_t now) {
  ValidityWindow window;
  window.valid_after  = now > core::kDefaultValidityBufferSeconds ? now - core::kDefaultValidityBufferSeconds : 0;
  window.valid_before = now + duration_seconds;
  return window;
}

crypto::Hash256 GenerateNonce() {
  crypto::Hash256 nonce{};
  if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return nonce;
}

std::string FormatPaymentAmount(std::string_view amount, std::uint32_t decimals) {
  if (amount.empty() || !IsDigits(amount)) {
    ThrowInvalidAmount(amount);
  }

  std::string digits(StripLeadingZeros(amount));
  if (digits.size() <= decimals) {
    digits.insert(0, decimals + 1 - digits.size(), '0');
  }

  const auto  split    = digits.size() - decimals;
  std::string whole    = digits.substr(0, split);
  std::string fraction = digits.substr(split);

  const auto last = fraction.find_last_not_of('0');
  fraction.erase(last == std::string::npos ? 0 : last + 1);
  if (fraction.empty()) {
    fraction = "0";
  }
  return whole + "." + fraction;
}

std::string ParsePaymentAmount(std::string_view text, std::uint32_t decimals) {
  const auto       dot      = text.find('.');
  std::string_view whole    = text.substr(0, dot);
  std::string_view fraction = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);

  if (whole.empty() && fraction.empty()) {
    ThrowInvalidAmount(text);
  }
  if (!IsDigits(whole) || !IsDigits(fraction) || fraction.size() > decimals) {
    ThrowInvalidAmount(text);
  }

  std::string digits(whole);
  digits.append(fraction);
  digits.append(decimals - fraction.size(), '0');

  const auto stripped = StripLeadingZeros(digits);
  return stripped.empty() ? "0" : std::string(stripped);
}

} // namespace x402::protocol
