#include "base64.hpp"

#include <openssl/evp.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace x402::codec {

namespace {

bool IsBase64Char(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

[[noreturn]] void ThrowInvalid(const std::string& reason) {
  throw util::DecodingError(util::ErrorKind::kInvalidBase64, "invalid base64: " + reason);
}

} // namespace

std::string Base64Encode(std::string_view bytes) {
  std::string out(4 * ((bytes.size() + 2) / 3), '\0');
  if (out.empty()) {
    return out;
  }

  const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                      reinterpret_cast<const unsigned char*>(bytes.data()), static_cast<int>(bytes.size()));
  if (written < 0) {
    throw std::runtime_error("EVP_EncodeBlock failed");
  }
  out.resize(static_cast<std::size_t>(written));
  return out;
}

std::string Base64Decode(std::string_view text) {
  if (text.empty()) {
    return {};
  }
  if (text.size() % 4 != 0) {
    ThrowInvalid("length is not a multiple of 4");
  }

  std::size_t padding = 0;
  if (text.back() == '=') {
    padding = text[text.size() - 2] == '=' ? 2 : 1;
  }

  for (std::size_t i = 0; i < text.size() - padding; ++i) {
    if (!IsBase64Char(text[i])) {
      ThrowInvalid("unexpected character at offset " + std::to_string(i));
    }
  }

  // EVP_DecodeBlock decodes padding as zero bits; trim them afterwards.
  std::string out(3 * (text.size() / 4), '\0');
  const int   n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(text.data()), static_cast<int>(text.size()));
  if (n < 0) {
    ThrowInvalid("rejected by decoder");
  }
  out.resize(static_cast<std::size_t>(n) - padding);
  return out;
}

} // namespace x402::codec
