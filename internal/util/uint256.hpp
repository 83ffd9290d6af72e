#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace x402::util {

/*
  Unsigned 256-bit integers as 32 big-endian bytes, the way EVM words are
  laid out. Byte-wise comparison of two words is numeric comparison.
*/

using Uint256 = std::array<std::uint8_t, 32>;

// Parses an unsigned decimal integer. nullopt on empty input, any non-digit
// character (including signs and blanks) or overflow past 2^256 - 1.
std::optional<Uint256> ParseUint256(std::string_view decimal);

Uint256 Uint256FromU64(std::uint64_t value);

} // namespace x402::util
