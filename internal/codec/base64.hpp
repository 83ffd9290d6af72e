#pragma once

#include <string>
#include <string_view>

namespace x402::codec {

// Standard alphabet with '=' padding.
std::string Base64Encode(std::string_view bytes);

// Strict: length must be a multiple of 4, only alphabet characters, and '='
// only as one or two trailing pad characters. Throws
// DecodingError(kInvalidBase64).
std::string Base64Decode(std::string_view text);

} // namespace x402::codec
