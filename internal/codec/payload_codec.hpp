#pragma once

#include <string>
#include <string_view>

#include "x402/core/v1/payment.pb.h"

namespace x402::codec {

/*
  X-PAYMENT envelope codec.

  The envelope is the PaymentPayload message in protobuf JSON form
  (lowerCamelCase keys, default-valued fields omitted), base64-encoded for
  header transport. Decoding checks structure only, then delegates scheme
  and network recognition to the validation engine:

    invalid base64                      -> DecodingError(kInvalidBase64)
    not a PaymentPayload JSON object    -> DecodingError(kMalformedPayload)
    x402Version / scheme / network /
    payload missing                     -> DecodingError(kMissingField)
    unrecognized scheme or network      -> ValidationError(kUnsupportedScheme /
                                           kUnsupportedNetwork)

  Unknown JSON keys are ignored.
*/

std::string                     EncodeX402Payload(const x402::core::v1::PaymentPayload& payload);
x402::core::v1::PaymentPayload DecodeX402Payload(std::string_view json);

std::string                     EncodePaymentToBase64(const x402::core::v1::PaymentPayload& payload);
x402::core::v1::PaymentPayload DecodePaymentFromBase64(std::string_view header_value);

// Requirements travel as plain JSON. Required on decode: scheme, network,
// maxAmountRequired, payTo, asset.
std::string                          EncodePaymentRequirements(const x402::core::v1::PaymentRequirements& requirements);
x402::core::v1::PaymentRequirements DecodePaymentRequirements(std::string_view json);

std::string EncodePaymentRequiredResponse(const x402::core::v1::PaymentRequiredResponse& response);

} // namespace x402::codec
