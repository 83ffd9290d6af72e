#include "signature.hpp"

#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include <algorithm>
#include <memory>

#include "internal/crypto/hashing.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace x402::crypto {

namespace {

using util::ErrorKind;
using util::SignatureError;

const secp256k1_context* Context() {
  thread_local std::unique_ptr<secp256k1_context, decltype(&secp256k1_context_destroy)> const context(
      secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY), &secp256k1_context_destroy);
  return context.get();
}

Address AddressFromPubkey(const secp256k1_pubkey& pubkey) {
  std::uint8_t serialized[65];
  std::size_t  len = sizeof(serialized);
  secp256k1_ec_pubkey_serialize(Context(), serialized, &len, &pubkey, SECP256K1_EC_UNCOMPRESSED);

  // Skip the 0x04 prefix; the address is the low 20 bytes of the hash.
  const auto hash = Keccak256(serialized + 1, len - 1);

  Address address{};
  std::copy(hash.end() - address.size(), hash.end(), address.begin());
  return address;
}

} // namespace

SignatureComponents SignatureComponents::FromBytes(const Signature& signature) {
  SignatureComponents c;
  std::copy(signature.begin(), signature.begin() + 32, c.r.begin());
  std::copy(signature.begin() + 32, signature.begin() + 64, c.s.begin());

  const std::uint8_t v = signature[64];
  if (v == 0 || v == 1) {
    c.recovery_id = v;
  } else if (v == 27 || v == 28) {
    c.recovery_id = static_cast<std::uint8_t>(v - 27);
  } else {
    throw SignatureError(ErrorKind::kMalformedSignature, "invalid recovery id " + std::to_string(v));
  }
  return c;
}

SignatureComponents SignatureComponents::FromHex(std::string_view hex) {
  Signature signature{};
  try {
    util::FromHexExact(hex, signature.data(), signature.size());
  } catch (const util::CryptoError& e) {
    throw SignatureError(ErrorKind::kMalformedSignature, std::string("malformed signature: ") + e.what());
  }
  return FromBytes(signature);
}

Signature SignatureComponents::ToBytes() const {
  Signature out{};
  std::copy(r.begin(), r.end(), out.begin());
  std::copy(s.begin(), s.end(), out.begin() + 32);
  out[64] = recovery_id;
  return out;
}

std::string SignatureComponents::ToHex() const {
  return util::ToHex(ToBytes());
}

Signature SignDigest(const Hash256& digest, const PrivateKey& private_key) {
  if (secp256k1_ec_seckey_verify(Context(), private_key.data()) != 1) {
    throw SignatureError(ErrorKind::kInvalidPrivateKey, "private key is not a valid secp256k1 scalar");
  }

  // nullptr nonce function selects RFC 6979.
  secp256k1_ecdsa_recoverable_signature sig;
  if (secp256k1_ecdsa_sign_recoverable(Context(), &sig, digest.data(), private_key.data(), nullptr, nullptr) != 1) {
    throw SignatureError(ErrorKind::kInvalidPrivateKey, "signing failed");
  }

  SignatureComponents c;
  std::uint8_t        compact[64];
  int                 recid = 0;
  secp256k1_ecdsa_recoverable_signature_serialize_compact(Context(), compact, &recid, &sig);

  std::copy(compact, compact + 32, c.r.begin());
  std::copy(compact + 32, compact + 64, c.s.begin());
  c.recovery_id = static_cast<std::uint8_t>(recid);
  return c.ToBytes();
}

Signature SignPayment(std::string_view message, const PrivateKey& private_key) {
  return SignDigest(Keccak256(message), private_key);
}

Address RecoverDigestSigner(const Hash256& digest, const Signature& signature) {
  const auto c = SignatureComponents::FromBytes(signature);

  std::uint8_t compact[64];
  std::copy(c.r.begin(), c.r.end(), compact);
  std::copy(c.s.begin(), c.s.end(), compact + 32);

  secp256k1_ecdsa_recoverable_signature sig;
  if (secp256k1_ecdsa_recoverable_signature_parse_compact(Context(), &sig, compact, c.recovery_id) != 1) {
    throw SignatureError(ErrorKind::kMalformedSignature, "signature r/s out of range");
  }

  // EIP-2: s must be in the lower half of the curve order. Token contracts
  // revert on the malleated high-s twin of a valid signature.
  secp256k1_ecdsa_signature plain;
  secp256k1_ecdsa_recoverable_signature_convert(Context(), &plain, &sig);
  if (secp256k1_ecdsa_signature_normalize(Context(), nullptr, &plain) == 1) {
    throw SignatureError(ErrorKind::kMalformedSignature, "signature s is not in the lower half of the curve order");
  }

  secp256k1_pubkey pubkey;
  if (secp256k1_ecdsa_recover(Context(), &pubkey, &sig, digest.data()) != 1) {
    throw SignatureError(ErrorKind::kRecoveryFailed, "public key recovery failed");
  }

  return AddressFromPubkey(pubkey);
}

Address RecoverSigner(std::string_view message, const Signature& signature) {
  return RecoverDigestSigner(Keccak256(message), signature);
}

bool VerifySignature(std::string_view message, const Signature& signature, const Address& expected_address) {
  return RecoverSigner(message, signature) == expected_address;
}

Address AddressFromPrivateKey(const PrivateKey& private_key) {
  secp256k1_pubkey pubkey;
  if (secp256k1_ec_pubkey_create(Context(), &pubkey, private_key.data()) != 1) {
    throw SignatureError(ErrorKind::kInvalidPrivateKey, "private key is not a valid secp256k1 scalar");
  }
  return AddressFromPubkey(pubkey);
}

std::string AddressToHex(const Address& address) {
  std::string hex = util::ToHex(address, false);

  // EIP-55: uppercase a letter when the matching nibble of
  // keccak256(lowercase hex) is >= 8.
  const auto hash = HashString(hex);
  for (std::size_t i = 0; i < hex.size(); ++i) {
    const std::uint8_t nibble = (i % 2 == 0) ? (hash[i / 2] >> 4) : (hash[i / 2] & 0x0F);
    if (hex[i] >= 'a' && hex[i] <= 'f' && nibble >= 8) {
      hex[i] = static_cast<char>(hex[i] - 'a' + 'A');
    }
  }
  return "0x" + hex;
}

Address AddressFromHex(std::string_view hex) {
  if (hex.size() != 42 || hex[0] != '0' || (hex[1] != 'x' && hex[1] != 'X')) {
    throw util::CryptoError(ErrorKind::kInvalidAddress, "address must be 0x followed by 40 hex digits");
  }

  Address address{};
  try {
    util::FromHexExact(hex, address.data(), address.size());
  } catch (const util::CryptoError&) {
    throw util::CryptoError(ErrorKind::kInvalidAddress, "address must be 0x followed by 40 hex digits");
  }
  return address;
}

} // namespace x402::crypto
