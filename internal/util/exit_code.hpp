#pragma once

#include <exception>

#include "internal/util/errors.hpp"

namespace x402::util {

/*
  Converts core exceptions into process exit codes.
*/

enum ExitCode : int {
  kExitOk         = 0,
  kExitUsage      = 1,
  kExitDecoding   = 2,
  kExitSignature  = 3,
  kExitValidation = 4,
  kExitMerkle     = 5,
  kExitInput      = 6,
  kExitInternal   = 10,
};

int ToExitCode(const std::exception& e);

} // namespace x402::util
