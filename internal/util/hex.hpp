#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace x402::util {

/*
  Hex helpers

  Encoded text is lowercase and 0x-prefixed. Decoding accepts an optional
  0x/0X prefix and either case.
*/

std::string ToHex(const std::uint8_t* data, std::size_t size, bool prefix = true);

template <typename Container>
std::string ToHex(const Container& bytes, bool prefix = true) {
  return ToHex(reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size(), prefix);
}

// Throws CryptoError(kInvalidHex) on odd length or non-hex characters.
std::vector<std::uint8_t> FromHex(std::string_view text);

// As FromHex, but the decoded length must be exactly `size`.
void FromHexExact(std::string_view text, std::uint8_t* out, std::size_t size);

bool IsHexDigit(char c);

} // namespace x402::util
