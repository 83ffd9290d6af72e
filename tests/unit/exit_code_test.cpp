#include "internal/util/exit_code.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace {

using namespace x402::util;

void TestDecodingErrorsMapToDecoding() {
  assert(ToExitCode(DecodingError(ErrorKind::kInvalidBase64, "bad")) == kExitDecoding);
  assert(ToExitCode(DecodingError::MissingField("scheme")) == kExitDecoding);
}

void TestSignatureErrorsMapToSignature() {
  assert(ToExitCode(SignatureError(ErrorKind::kMalformedSignature, "bad")) == kExitSignature);
  assert(ToExitCode(SignatureError(ErrorKind::kInvalidPrivateKey, "bad")) == kExitSignature);
}

void TestValidationErrorsMapToValidation() {
  assert(ToExitCode(ValidationError(ErrorKind::kDeadlineTooFar, "far")) == kExitValidation);
}

void TestMerkleErrorsMapToMerkle() {
  assert(ToExitCode(MerkleError::EmptyTree()) == kExitMerkle);
  assert(ToExitCode(MerkleError::IndexOutOfRange(3, 2)) == kExitMerkle);
}

void TestPlainCryptoErrorMapsToInput() {
  assert(ToExitCode(CryptoError(ErrorKind::kInvalidHex, "odd")) == kExitInput);
  assert(ToExitCode(CryptoError(ErrorKind::kUnknownNetwork, "nope")) == kExitInput);
}

void TestUnknownExceptionsAreInternal() {
  assert(ToExitCode(std::runtime_error("boom")) == kExitInternal);
  assert(ToExitCode(std::logic_error("bug")) == kExitInternal);
}

void TestErrorKindNames() {
  assert(ToString(ErrorKind::kMerkleIndexOutOfRange) == "merkle_index_out_of_range");
  assert(ToString(ErrorKind::kMissingField) == "missing_field");

  const auto err = MerkleError::IndexOutOfRange(7, 4);
  assert(err.index() == 7);
  assert(err.bound() == 4);
}

} // namespace

int main() {
  TestDecodingErrorsMapToDecoding();
  TestSignatureErrorsMapToSignature();
  TestValidationErrorsMapToValidation();
  TestMerkleErrorsMapToMerkle();
  TestPlainCryptoErrorMapsToInput();
  TestUnknownExceptionsAreInternal();
  TestErrorKindNames();

  std::cout << "x402_unit_exit_code: pass\n";
  return 0;
}
