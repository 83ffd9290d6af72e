#pragma once

#include <cstdint>
#include <string_view>

#include "internal/model/payment_data.hpp"
#include "internal/network/network_family.hpp"

namespace x402::validation {

/*
  Stateless predicates over decoded payment data. No I/O; time-dependent
  checks take `now` (unix seconds) from the caller.
*/

// 0 < id < 2^53 - 1
bool ValidateChainId(std::uint64_t id);

// "eip155:<chain id>", "solana:<1-32 alphanumerics>" or a registry name such
// as "base-sepolia".
bool ValidateNetwork(std::string_view name);

// "exact", "upto" or "subscription".
bool ValidateScheme(std::string_view name);

// EVM "0x" + 40 hex digits, or a 32-44 character base58 Solana key.
bool ValidateAddress(std::string_view address);
bool ValidateAddress(std::string_view address, network::NetworkFamily family);

// Unsigned decimal that fits in 256 bits. Zero is allowed.
bool ValidateAmount(std::string_view value);

// Throws ValidationError for the first violated constraint, checked in the
// order scheme, network, from, to, amount, window order, deadline span.
void ValidatePaymentData(const model::PaymentData& data);

// Expired strictly after the deadline: now == deadline is still valid.
bool IsPaymentExpired(std::uint64_t deadline, std::uint64_t now);

// valid_after <= now <= deadline
bool IsPaymentValidNow(std::uint64_t deadline, std::uint64_t valid_after, std::uint64_t now);

// deadline <= issued_at + kMaxDeadlineSeconds
bool IsDeadlineWithinLimit(std::uint64_t deadline, std::uint64_t issued_at);

} // namespace x402::validation
