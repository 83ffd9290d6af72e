#include "payment_data.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace x402::model {

PaymentData FromPayload(const x402::core::v1::PaymentPayload&      payload,
                        const x402::core::v1::PaymentRequirements& requirements) {
  if (!payload.has_payload() || !payload.payload().has_authorization()) {
    throw util::DecodingError::MissingField("payload.authorization");
  }

  const auto& auth = payload.payload().authorization();

  PaymentData data;
  data.scheme       = payload.scheme();
  data.network      = payload.network();
  data.from         = auth.from();
  data.to           = auth.to();
  data.asset        = requirements.asset();
  data.amount       = auth.value();
  data.valid_after  = auth.valid_after();
  data.valid_before = auth.valid_before();
  util::FromHexExact(auth.nonce(), data.nonce.data(), data.nonce.size());
  return data;
}

} // namespace x402::model
