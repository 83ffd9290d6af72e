#include "errors.hpp"

namespace x402::util {

std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kUnsupportedAlgorithm:
      return "unsupported_algorithm";
    case ErrorKind::kInvalidHex:
      return "invalid_hex";
    case ErrorKind::kMerkleEmptyTree:
      return "merkle_empty_tree";
    case ErrorKind::kMerkleIndexOutOfRange:
      return "merkle_index_out_of_range";
    case ErrorKind::kInvalidPrivateKey:
      return "invalid_private_key";
    case ErrorKind::kMalformedSignature:
      return "malformed_signature";
    case ErrorKind::kRecoveryFailed:
      return "recovery_failed";
    case ErrorKind::kInvalidBase64:
      return "invalid_base64";
    case ErrorKind::kMalformedPayload:
      return "malformed_payload";
    case ErrorKind::kMissingField:
      return "missing_field";
    case ErrorKind::kUnsupportedScheme:
      return "unsupported_scheme";
    case ErrorKind::kUnsupportedNetwork:
      return "unsupported_network";
    case ErrorKind::kUnknownNetwork:
      return "unknown_network";
    case ErrorKind::kInvalidAddress:
      return "invalid_address";
    case ErrorKind::kInvalidAmount:
      return "invalid_amount";
    case ErrorKind::kInvalidTimeWindow:
      return "invalid_time_window";
    case ErrorKind::kDeadlineTooFar:
      return "deadline_too_far";
  }
  return "unknown";
}

MerkleError MerkleError::EmptyTree() {
  return MerkleError(ErrorKind::kMerkleEmptyTree, "cannot build a merkle tree with no leaves", 0, 0);
}

MerkleError MerkleError::IndexOutOfRange(std::size_t index, std::size_t leaf_count) {
  return MerkleError(ErrorKind::kMerkleIndexOutOfRange,
                     "index " + std::to_string(index) + " out of bounds for " + std::to_string(leaf_count) + " leaves", index,
                     leaf_count);
}

} // namespace x402::util
