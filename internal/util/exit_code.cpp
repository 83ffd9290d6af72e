#include "exit_code.hpp"

namespace x402::util {

int ToExitCode(const std::exception& e) {
  if (dynamic_cast<const DecodingError*>(&e)) {
    return kExitDecoding;
  }
  if (dynamic_cast<const SignatureError*>(&e)) {
    return kExitSignature;
  }
  if (dynamic_cast<const ValidationError*>(&e)) {
    return kExitValidation;
  }
  if (dynamic_cast<const MerkleError*>(&e)) {
    return kExitMerkle;
  }
  if (dynamic_cast<const CryptoError*>(&e)) {
    return kExitInput;
  }

  return kExitInternal;
}

} // namespace x402::util
