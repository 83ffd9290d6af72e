#pragma once

#include <cstdint>

namespace x402::core {

// x402 protocol version carried in every envelope.
inline constexpr std::uint32_t kX402Version = 1;

// Longest allowed distance between issuance and deadline (30 days).
inline constexpr std::uint64_t kMaxDeadlineSeconds = 30ULL * 24 * 60 * 60;

inline constexpr std::uint64_t kDefaultTimeoutSeconds = 300;

// validAfter is backdated by this much to absorb clock skew.
inline constexpr std::uint64_t kDefaultValidityBufferSeconds = 60;

inline constexpr char kDefaultMimeType[] = "application/json";

} // namespace x402::core
