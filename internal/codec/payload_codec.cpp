#include "payload_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>

#include "internal/codec/base64.hpp"
#include "internal/util/errors.hpp"
#include "internal/validation/validation.hpp"

namespace x402::codec {

namespace {

using util::DecodingError;
using util::ErrorKind;
using util::ValidationError;
using x402::core::v1::PaymentPayload;
using x402::core::v1::PaymentRequirements;

// 64-bit integers print as JSON strings; the wire carries these as numbers.
constexpr std::string_view kIntegerFields[] = {"validAfter", "validBefore", "maxTimeoutSeconds"};

void UnquoteIntegerFields(std::string* json) {
  for (const auto field : kIntegerFields) {
    const std::string key = "\"" + std::string(field) + "\":\"";
    for (auto pos = json->find(key); pos != std::string::npos; pos = json->find(key, pos)) {
      const auto open  = pos + key.size() - 1;
      const auto close = json->find('"', open + 1);
      if (close == std::string::npos) break;

      const bool digits = close > open + 1 && std::all_of(json->begin() + open + 1, json->begin() + close,
                                                          [](char c) { return c >= '0' && c <= '9'; });
      if (digits) {
        json->erase(close, 1);
        json->erase(open, 1);
      }
      pos = open;
    }
  }
}

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  UnquoteIntegerFields(&json);
  return json;
}

void FromJson(std::string_view json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), message, options);
  if (!status.ok()) {
    throw DecodingError(ErrorKind::kMalformedPayload,
                        "malformed " + message->GetDescriptor()->name() + ": " + std::string(status.message()));
  }
}

void RequireRecognized(const std::string& scheme, const std::string& network) {
  if (!validation::ValidateScheme(scheme)) {
    throw ValidationError(ErrorKind::kUnsupportedScheme, "unsupported scheme: " + scheme);
  }
  if (!validation::ValidateNetwork(network)) {
    throw ValidationError(ErrorKind::kUnsupportedNetwork, "unsupported network: " + network);
  }
}

} // namespace

std::string EncodeX402Payload(const PaymentPayload& payload) {
  return ToJson(payload);
}

PaymentPayload DecodeX402Payload(std::string_view json) {
  PaymentPayload payload;
  FromJson(json, &payload);

  if (payload.x402_version() == 0) throw DecodingError::MissingField("x402Version");
  if (payload.scheme().empty()) throw DecodingError::MissingField("scheme");
  if (payload.network().empty()) throw DecodingError::MissingField("network");
  if (!payload.has_payload()) throw DecodingError::MissingField("payload");

  const auto& inner = payload.payload();
  if (!inner.has_authorization() && inner.transaction().empty()) {
    throw DecodingError::MissingField("payload.authorization");
  }

  RequireRecognized(payload.scheme(), payload.network());
  return payload;
}

std::string EncodePaymentToBase64(const PaymentPayload& payload) {
  return Base64Encode(EncodeX402Payload(payload));
}

PaymentPayload DecodePaymentFromBase64(std::string_view header_value) {
  return DecodeX402Payload(Base64Decode(header_value));
}

std::string EncodePaymentRequirements(const PaymentRequirements& requirements) {
  return ToJson(requirements);
}

PaymentRequirements DecodePaymentRequirements(std::string_view json) {
  PaymentRequirements requirements;
  FromJson(json, &requirements);

  if (requirements.scheme().empty()) throw DecodingError::MissingField("scheme");
  if (requirements.network().empty()) throw DecodingError::MissingField("network");
  if (requirements.max_amount_required().empty()) throw DecodingError::MissingField("maxAmountRequired");
  if (requirements.pay_to().empty()) throw DecodingError::MissingField("payTo");
  if (requirements.asset().empty()) throw DecodingError::MissingField("asset");

  RequireRecognized(requirements.scheme(), requirements.network());
  return requirements;
}

std::string EncodePaymentRequiredResponse(const x402::core::v1::PaymentRequiredResponse& response) {
  return ToJson(response);
}

} // namespace x402::codec
