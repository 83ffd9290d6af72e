#include "hashing.hpp"

#include <ethash/keccak.hpp>
#include <openssl/evp.h>

#include <algorithm>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/uint256.hpp"

namespace x402::crypto {

namespace {

Hash256 EvpDigest(const EVP_MD* md, const std::uint8_t* data, std::size_t size) {
  Hash256      out{};
  unsigned int out_len = 0;
  if (EVP_Digest(data, size, out.data(), &out_len, md, nullptr) != 1 || out_len != out.size()) {
    throw std::runtime_error("EVP_Digest failed");
  }
  return out;
}

void AppendWord(std::string& buf, const std::array<std::uint8_t, 32>& word) {
  buf.append(reinterpret_cast<const char*>(word.data()), word.size());
}

} // namespace

Hash256 Keccak256(const std::uint8_t* data, std::size_t size) {
  const auto h = ethash::keccak256(data, size);

  Hash256 out{};
  std::copy(std::begin(h.bytes), std::end(h.bytes), out.begin());
  return out;
}

Hash256 Sha256(const std::uint8_t* data, std::size_t size) {
  return EvpDigest(EVP_sha256(), data, size);
}

Hash256 Sha3_256(const std::uint8_t* data, std::size_t size) {
  return EvpDigest(EVP_sha3_256(), data, size);
}

Hash256 DoubleKeccak256(std::string_view data) {
  const auto first = Keccak256(data);
  return Keccak256(first.data(), first.size());
}

Hash256 HashConcat(const Hash256& a, const Hash256& b) {
  std::array<std::uint8_t, 64> combined{};
  std::copy(a.begin(), a.end(), combined.begin());
  std::copy(b.begin(), b.end(), combined.begin() + a.size());
  return Keccak256(combined.data(), combined.size());
}

Hash256 HashString(std::string_view str) {
  return Keccak256(str);
}

Hash256 HashPaymentData(const model::PaymentData& data) {
  std::string buf;
  buf.reserve(9 * 32);

  AppendWord(buf, HashString(data.scheme));
  AppendWord(buf, HashString(data.network));
  AppendWord(buf, HashString(data.from));
  AppendWord(buf, HashString(data.to));
  AppendWord(buf, HashString(data.asset));
  AppendWord(buf, util::ParseUint256(data.amount).value_or(util::Uint256{}));
  AppendWord(buf, util::Uint256FromU64(data.valid_after));
  AppendWord(buf, util::Uint256FromU64(data.valid_before));
  AppendWord(buf, data.nonce);

  return Keccak256(buf);
}

Hash256 Digest(std::string_view algorithm, std::string_view data) {
  if (algorithm == "keccak256") {
    return Keccak256(data);
  }
  if (algorithm == "sha256") {
    return Sha256(data);
  }
  if (algorithm == "sha3-256") {
    return Sha3_256(data);
  }
  if (algorithm == "double-keccak256") {
    return DoubleKeccak256(data);
  }

  throw util::CryptoError(util::ErrorKind::kUnsupportedAlgorithm, "unsupported hash algorithm: " + std::string(algorithm));
}

} // namespace x402::crypto
