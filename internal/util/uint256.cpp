#include "uint256.hpp"

namespace x402::util {

std::optional<Uint256> ParseUint256(std::string_view decimal) {
  if (decimal.empty()) {
    return std::nullopt;
  }

  Uint256 value{};
  for (char c : decimal) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }

    // value = value * 10 + digit
    unsigned carry = static_cast<unsigned>(c - '0');
    for (std::size_t i = value.size(); i-- > 0;) {
      const unsigned cur = value[i] * 10U + carry;
      value[i]           = static_cast<std::uint8_t>(cur & 0xFF);
      carry              = cur >> 8;
    }
    if (carry != 0) {
      return std::nullopt;
    }
  }
  return value;
}

Uint256 Uint256FromU64(std::uint64_t value) {
  Uint256 out{};
  for (std::size_t i = 0; i < 8; ++i) {
    out[out.size() - 1 - i] = static_cast<std::uint8_t>(value >> (8 * i));
  }
  return out;
}

} // namespace x402::util
