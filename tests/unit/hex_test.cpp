#include "internal/util/hex.hpp"

#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using namespace x402::util;

bool ThrowsInvalidHex(std::string_view text) {
  try {
    (void)FromHex(text);
  } catch (const CryptoError& e) {
    return e.kind() == ErrorKind::kInvalidHex;
  }
  return false;
}

void TestEncode() {
  const std::array<std::uint8_t, 4> bytes = {0x00, 0xAB, 0x10, 0xFF};
  assert(ToHex(bytes) == "0x00ab10ff");
  assert(ToHex(bytes, false) == "00ab10ff");
  assert(ToHex(std::vector<std::uint8_t>{}) == "0x");
}

void TestDecodeAcceptsPrefixAndCase() {
  const std::vector<std::uint8_t> expected = {0x00, 0xAB, 0x10, 0xFF};
  assert(FromHex("0x00ab10ff") == expected);
  assert(FromHex("0X00AB10FF") == expected);
  assert(FromHex("00Ab10fF") == expected);
  assert(FromHex("").empty());
  assert(FromHex("0x").empty());
}

void TestDecodeRejects() {
  assert(ThrowsInvalidHex("0x123"));
  assert(ThrowsInvalidHex("zz"));
  assert(ThrowsInvalidHex("0x 1"));
}

void TestExactLength() {
  std::array<std::uint8_t, 2> out{};
  FromHexExact("0xbeef", out.data(), out.size());
  assert(out[0] == 0xBE && out[1] == 0xEF);

  bool threw = false;
  try {
    FromHexExact("0xbeefee", out.data(), out.size());
  } catch (const CryptoError& e) {
    threw = e.kind() == ErrorKind::kInvalidHex;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEncode();
  TestDecodeAcceptsPrefixAndCase();
  TestDecodeRejects();
  TestExactLength();

  std::cout << "x402_unit_hex: pass\n";
  return 0;
}
