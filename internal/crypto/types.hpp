#pragma once

#include <array>
#include <cstdint>
#include <vector>

namespace x402::crypto {

using Hash256    = std::array<std::uint8_t, 32>;
using Address    = std::array<std::uint8_t, 20>;
using PrivateKey = std::array<std::uint8_t, 32>;

// r (32) || s (32) || recovery id (1)
using Signature = std::array<std::uint8_t, 65>;

using MerkleProof = std::vector<Hash256>;

} // namespace x402::crypto
