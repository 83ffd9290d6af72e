#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "internal/crypto/types.hpp"
#include "internal/model/payment_data.hpp"

namespace x402::crypto {

/*
  Hashing engine.

  Pure functions, no error conditions: every input length (including zero)
  hashes. Byte input is accepted as pointer + size or as a string_view over
  raw bytes.
*/

Hash256 Keccak256(const std::uint8_t* data, std::size_t size);
Hash256 Sha256(const std::uint8_t* data, std::size_t size);
Hash256 Sha3_256(const std::uint8_t* data, std::size_t size);

inline Hash256 Keccak256(std::string_view data) {
  return Keccak256(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
}
inline Hash256 Sha256(std::string_view data) {
  return Sha256(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
}
inline Hash256 Sha3_256(std::string_view data) {
  return Sha3_256(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
}

// keccak256(keccak256(data)), for derived identifiers.
Hash256 DoubleKeccak256(std::string_view data);

// keccak256(a || b). Positional: callers that need a commutative pairing
// (the merkle engine) order the operands first.
Hash256 HashConcat(const Hash256& a, const Hash256& b);

// keccak256 of the UTF-8 bytes.
Hash256 HashString(std::string_view str);

/*
  Canonical payment hash: keccak256 over nine 32-byte words

    HashString(scheme) | HashString(network) | HashString(from) |
    HashString(to) | HashString(asset) | uint256(amount) |
    uint256(valid_after) | uint256(valid_before) | nonce

  Integers are big-endian. An amount that is not a valid uint256 decimal is
  encoded as zero; ValidatePaymentData rejects such data beforehand.
*/
Hash256 HashPaymentData(const model::PaymentData& data);

/*
  Digest by algorithm tag: "keccak256", "sha256", "sha3-256",
  "double-keccak256". Unknown tags throw CryptoError(kUnsupportedAlgorithm).
*/
Hash256 Digest(std::string_view algorithm, std::string_view data);

} // namespace x402::crypto
