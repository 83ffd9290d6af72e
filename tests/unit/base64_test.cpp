#include "internal/codec/base64.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using namespace x402;

bool RejectsAsInvalid(const std::string& text) {
  try {
    (void)codec::Base64Decode(text);
  } catch (const util::DecodingError& e) {
    return e.kind() == util::ErrorKind::kInvalidBase64;
  }
  return false;
}

void TestRfc4648Vectors() {
  assert(codec::Base64Encode("") == "");
  assert(codec::Base64Encode("f") == "Zg==");
  assert(codec::Base64Encode("fo") == "Zm8=");
  assert(codec::Base64Encode("foo") == "Zm9v");
  assert(codec::Base64Encode("foob") == "Zm9vYg==");
  assert(codec::Base64Encode("fooba") == "Zm9vYmE=");
  assert(codec::Base64Encode("foobar") == "Zm9vYmFy");

  assert(codec::Base64Decode("") == "");
  assert(codec::Base64Decode("Zg==") == "f");
  assert(codec::Base64Decode("Zm8=") == "fo");
  assert(codec::Base64Decode("Zm9vYmFy") == "foobar");
}

void TestBinaryPreserved() {
  std::string bytes;
  for (int i = 0; i < 256; ++i) {
    bytes.push_back(static_cast<char>(i));
  }
  assert(codec::Base64Decode(codec::Base64Encode(bytes)) == bytes);
}

void TestStrictDecoding() {
  assert(RejectsAsInvalid("Zg="));       // length
  assert(RejectsAsInvalid("Zm9v!mFy"));  // alphabet
  assert(RejectsAsInvalid("Zm=vYmFy"));  // padding mid-stream
  assert(RejectsAsInvalid("Z==="));      // too much padding
  assert(RejectsAsInvalid("Zm9v YmFy")); // whitespace
  assert(RejectsAsInvalid("Zm9v-mFy"));  // url-safe alphabet
}

} // namespace

int main() {
  TestRfc4648Vectors();
  TestBinaryPreserved();
  TestStrictDecoding();

  std::cout << "x402_unit_base64: pass\n";
  return 0;
}
