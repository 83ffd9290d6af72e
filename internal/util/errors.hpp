#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace x402::util {

/*
  Central error types.

  Every fallible core operation throws a CryptoError subclass. Callers branch
  on kind(), never on the message text. ToExitCode() maps them for the CLI.
*/

enum class ErrorKind : std::uint8_t {
  kUnsupportedAlgorithm,
  kInvalidHex,

  kMerkleEmptyTree,
  kMerkleIndexOutOfRange,

  kInvalidPrivateKey,
  kMalformedSignature,
  kRecoveryFailed,

  kInvalidBase64,
  kMalformedPayload,
  kMissingField,

  kUnsupportedScheme,
  kUnsupportedNetwork,
  kUnknownNetwork,
  kInvalidAddress,
  kInvalidAmount,
  kInvalidTimeWindow,
  kDeadlineTooFar,
};

std::string_view ToString(ErrorKind kind);

class CryptoError : public std::runtime_error {
 public:
  CryptoError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ErrorKind kind() const {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

class MerkleError : public CryptoError {
 public:
  static MerkleError EmptyTree();
  static MerkleError IndexOutOfRange(std::size_t index, std::size_t leaf_count);

  std::size_t index() const {
    return index_;
  }
  std::size_t bound() const {
    return bound_;
  }

 private:
  MerkleError(ErrorKind kind, const std::string& msg, std::size_t index, std::size_t bound)
      : CryptoError(kind, msg), index_(index), bound_(bound) {
  }

  std::size_t index_;
  std::size_t bound_;
};

class SignatureError : public CryptoError {
 public:
  SignatureError(ErrorKind kind, const std::string& msg) : CryptoError(kind, msg) {
  }
};

class DecodingError : public CryptoError {
 public:
  DecodingError(ErrorKind kind, const std::string& msg, std::string field = {})
      : CryptoError(kind, msg), field_(std::move(field)) {
  }

  static DecodingError MissingField(const std::string& field) {
    return DecodingError(ErrorKind::kMissingField, "missing required field: " + field, field);
  }

  // Empty unless kind() == kMissingField.
  const std::string& field() const {
    return field_;
  }

 private:
  std::string field_;
};

class ValidationError : public CryptoError {
 public:
  ValidationError(ErrorKind kind, const std::string& msg) : CryptoError(kind, msg) {
  }
};

} // namespace x402::util
