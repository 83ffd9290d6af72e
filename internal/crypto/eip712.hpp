#pragma once

#include <cstdint>
#include <string>

#include "internal/crypto/types.hpp"
#include "x402/core/v1/payment.pb.h"

namespace x402::crypto {

/*
  EIP-712 typed data for EIP-3009 transferWithAuthorization, the message a
  payer signs in the "exact" EVM scheme.
*/

struct Eip712Domain {
  std::string   name;
  std::string   version;
  std::uint64_t chain_id = 0;
  Address       verifying_contract{};
};

Hash256 DomainSeparator(const Eip712Domain& domain);

// hashStruct(TransferWithAuthorization). Throws CryptoError(kInvalidAddress)
// for malformed from/to, ValidationError(kInvalidAmount) for a bad value and
// CryptoError(kInvalidHex) for a nonce that is not 32 bytes of hex.
Hash256 TransferWithAuthorizationHash(const x402::core::v1::EIP3009Authorization& authorization);

// keccak256(0x19 0x01 || DomainSeparator(domain) || hashStruct(authorization))
Hash256 TransferWithAuthorizationDigest(const Eip712Domain&                         domain,
                                        const x402::core::v1::EIP3009Authorization& authorization);

} // namespace x402::crypto
