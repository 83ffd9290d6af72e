#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/crypto/types.hpp"

namespace x402::crypto {

/*
  r, s and recovery id of a 65-byte recoverable ECDSA signature.

  The recovery id is stored normalized to {0, 1}. Input may use either
  {0, 1} or the legacy {27, 28}; ToBytes() always writes {0, 1}.
*/
struct SignatureComponents {
  Hash256      r{};
  Hash256      s{};
  std::uint8_t recovery_id = 0;

  // Throws SignatureError(kMalformedSignature) for a recovery id outside
  // {0, 1, 27, 28}.
  static SignatureComponents FromBytes(const Signature& signature);

  // 0x-prefixed 130 hex digits. Throws SignatureError(kMalformedSignature)
  // on bad hex or length.
  static SignatureComponents FromHex(std::string_view hex);

  Signature   ToBytes() const;
  std::string ToHex() const;
};

/*
  secp256k1 recoverable ECDSA with deterministic (RFC 6979) nonces and low-s
  normalization. Messages are hashed with keccak256 before signing.

  Failures throw SignatureError; nothing here aborts on caller input.
*/

// Throws SignatureError(kInvalidPrivateKey) if the key is zero or not below
// the curve order.
Signature SignPayment(std::string_view message, const PrivateKey& private_key);
Signature SignDigest(const Hash256& digest, const PrivateKey& private_key);

// Throws SignatureError(kMalformedSignature) if the signature cannot be
// parsed or has a high s, SignatureError(kRecoveryFailed) if no public key
// recovers.
Address RecoverSigner(std::string_view message, const Signature& signature);
Address RecoverDigestSigner(const Hash256& digest, const Signature& signature);

// False for a well-formed signature by anyone other than expected_address.
bool VerifySignature(std::string_view message, const Signature& signature, const Address& expected_address);

Address AddressFromPrivateKey(const PrivateKey& private_key);

// EIP-55 mixed-case checksum encoding, 0x-prefixed.
std::string AddressToHex(const Address& address);

// Accepts any case. Throws CryptoError(kInvalidAddress).
Address AddressFromHex(std::string_view hex);

} // namespace x402::crypto
