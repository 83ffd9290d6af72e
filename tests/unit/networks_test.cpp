#include "internal/network/networks.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/validation/validation.hpp"

namespace {

using namespace x402;

template <typename Fn>
bool ThrowsUnknownNetwork(Fn&& fn) {
  try {
    fn();
  } catch (const util::CryptoError& e) {
    return e.kind() == util::ErrorKind::kUnknownNetwork;
  }
  return false;
}

void TestRegistryEntriesAreConsistent() {
  std::set<std::string> names;
  for (const auto& info : network::ListNetworks()) {
    assert(names.insert(std::string(info.name)).second && "network names are unique");

    // Every entry round-trips through its CAIP-2 id and passes validation.
    const auto caip2 = network::ToCaip2(info);
    assert(network::FromCaip2(caip2) == info.name);
    assert(validation::ValidateNetwork(caip2));
    assert(validation::ValidateNetwork(info.name));

    if (info.family == network::NetworkFamily::kEvm) {
      assert(validation::ValidateChainId(info.chain_id));
      assert(network::ChainIdOf(info.name) == info.chain_id);
    } else {
      assert(!network::ChainIdOf(info.name));
    }
  }
  assert(names.count("base-mainnet") == 1);
  assert(names.count("solana-devnet") == 1);
}

void TestCaip2Conversions() {
  assert(network::ToCaip2("base-mainnet") == "eip155:8453");
  assert(network::ToCaip2("base-sepolia") == "eip155:84532");
  assert(network::ToCaip2("solana-mainnet") == "solana:mainnet");

  assert(network::FromCaip2("eip155:137") == "polygon");
  assert(network::FromCaip2("solana:devnet") == "solana-devnet");
  assert(!network::FromCaip2("eip155:1"));
  assert(!network::FromCaip2("eip155:08453"));
  assert(!network::FromCaip2("base-mainnet"));
}

void TestLookup() {
  const auto by_name  = network::FindNetwork("bsc");
  const auto by_caip2 = network::FindNetwork("eip155:56");
  assert(by_name && by_caip2);
  assert(by_name->name == by_caip2->name);
  assert(by_name->currency_symbol == "BNB");
  assert(!network::FindNetwork("eip155:1"));

  assert(network::GetNetwork("solana-devnet").cluster == "devnet");
  assert(ThrowsUnknownNetwork([] { (void)network::GetNetwork("eip155:8453"); }));
  assert(ThrowsUnknownNetwork([] { (void)network::ToCaip2("mainnet"); }));
}

void TestFamilyAndChainIdForUnlistedIds() {
  assert(network::FamilyOf("eip155:1") == network::NetworkFamily::kEvm);
  assert(network::FamilyOf("solana:testnet") == network::NetworkFamily::kSolana);
  assert(network::FamilyOf("cosmos:hub") == network::NetworkFamily::kUnspecified);
  assert(network::FamilyOf("peaq") == network::NetworkFamily::kEvm);

  assert(network::ChainIdOf("eip155:1") == 1U);
  assert(!network::ChainIdOf("solana:testnet"));
  assert(!network::ChainIdOf("eip155:x"));
}

void TestUsdc() {
  assert(network::UsdcAddress("base-mainnet") == "0x833589fCD6eDb6E08f4c7C32D4f71b54bdA02913");
  assert(network::UsdcAddress("solana-mainnet") == "EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v");
  assert(ThrowsUnknownNetwork([] { (void)network::UsdcAddress("sei"); }));
  assert(ThrowsUnknownNetwork([] { (void)network::UsdcAddress("ethereum"); }));

  for (const auto& info : network::ListNetworks()) {
    if (!info.usdc_address.empty()) {
      assert(validation::ValidateAddress(info.usdc_address, info.family));
    }
  }
}

} // namespace

int main() {
  TestRegistryEntriesAreConsistent();
  TestCaip2Conversions();
  TestLookup();
  TestFamilyAndChainIdForUnlistedIds();
  TestUsdc();

  std::cout << "x402_unit_networks: pass\n";
  return 0;
}
