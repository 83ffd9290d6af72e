#include "hex.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace x402::util {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

std::string_view StripPrefix(std::string_view text) {
  if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    text.remove_prefix(2);
  }
  return text;
}

} // namespace

bool IsHexDigit(char c) {
  return HexNibble(c) >= 0;
}

std::string ToHex(const std::uint8_t* data, std::size_t size, bool prefix) {
  static constexpr char kHex[] = "0123456789abcdef";

  std::string out;
  out.reserve(size * 2 + 2);
  if (prefix) out += "0x";
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kHex[data[i] >> 4]);
    out.push_back(kHex[data[i] & 0x0F]);
  }
  return out;
}

std::vector<std::uint8_t> FromHex(std::string_view text) {
  const auto hex = StripPrefix(text);
  if (hex.size() % 2 != 0) {
    throw CryptoError(ErrorKind::kInvalidHex, "invalid hex: odd number of digits");
  }

  std::vector<std::uint8_t> out(hex.size() / 2);
  for (std::size_t i = 0; i < out.size(); ++i) {
    const int hi = HexNibble(hex[2 * i]);
    const int lo = HexNibble(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      throw CryptoError(ErrorKind::kInvalidHex, "invalid hex: non-hex character");
    }
    out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return out;
}

void FromHexExact(std::string_view text, std::uint8_t* out, std::size_t size) {
  const auto bytes = FromHex(text);
  if (bytes.size() != size) {
    throw CryptoError(ErrorKind::kInvalidHex,
                      "invalid hex: expected " + std::to_string(size) + " bytes, got " + std::to_string(bytes.size()));
  }
  std::copy(bytes.begin(), bytes.end(), out);
}

} // namespace x402::util
