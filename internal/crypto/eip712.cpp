#include "eip712.hpp"

#include <algorithm>
#include <string_view>

#include "internal/crypto/hashing.hpp"
#include "internal/crypto/signature.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"
#include "internal/util/uint256.hpp"

namespace x402::crypto {

namespace {

constexpr std::string_view kDomainType =
    "EIP712Domain(string name,string version,uint256 chainId,address verifyingContract)";

constexpr std::string_view kTransferWithAuthorizationType =
    "TransferWithAuthorization(address from,address to,uint256 value,uint256 validAfter,uint256 validBefore,bytes32 "
    "nonce)";

class Encoder {
 public:
  void Word(const Hash256& word) {
    buf_.append(reinterpret_cast<const char*>(word.data()), word.size());
  }

  void AddressWord(const crypto::Address& address) {
    Hash256 word{};
    std::copy(address.begin(), address.end(), word.end() - address.size());
    Word(word);
  }

  Hash256 Finish() const {
    return Keccak256(buf_);
  }

 private:
  std::string buf_;
};

} // namespace

Hash256 DomainSeparator(const Eip712Domain& domain) {
  Encoder enc;
  enc.Word(HashString(kDomainType));
  enc.Word(HashString(domain.name));
  enc.Word(HashString(domain.version));
  enc.Word(util::Uint256FromU64(domain.chain_id));
  enc.AddressWord(domain.verifying_contract);
  return enc.Finish();
}

Hash256 TransferWithAuthorizationHash(const x402::core::v1::EIP3009Authorization& authorization) {
  const auto value = util::ParseUint256(authorization.value());
  if (!value) {
    throw util::ValidationError(util::ErrorKind::kInvalidAmount, "invalid authorization value: " + authorization.value());
  }

  Hash256 nonce{};
  util::FromHexExact(authorization.nonce(), nonce.data(), nonce.size());

  Encoder enc;
  enc.Word(HashString(kTransferWithAuthorizationType));
  enc.AddressWord(AddressFromHex(authorization.from()));
  enc.AddressWord(AddressFromHex(authorization.to()));
  enc.Word(*value);
  enc.Word(util::Uint256FromU64(authorization.valid_after()));
  enc.Word(util::Uint256FromU64(authorization.valid_before()));
  enc.Word(nonce);
  return enc.Finish();
}

Hash256 TransferWithAuthorizationDigest(const Eip712Domain&                         domain,
                                        const x402::core::v1::EIP3009Authorization& authorization) {
  const auto separator   = DomainSeparator(domain);
  const auto struct_hash = TransferWithAuthorizationHash(authorization);

  std::string buf = "\x19\x01";
  buf.append(reinterpret_cast<const char*>(separator.data()), separator.size());
  buf.append(reinterpret_cast<const char*>(struct_hash.data()), struct_hash.size());
  return Keccak256(buf);
}

} // namespace x402::crypto
