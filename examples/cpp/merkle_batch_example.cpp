#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "internal/crypto/hashing.hpp"
#include "internal/crypto/merkle.hpp"
#include "internal/util/hex.hpp"

int main() {
  using namespace x402;

  // Commit to a batch of settled payments with one root, then prove that a
  // single payment is part of it.
  std::vector<model::PaymentData> batch;
  for (int i = 0; i < 5; ++i) {
    model::PaymentData data;
    data.scheme       = "exact";
    data.network      = "eip155:8453";
    data.from         = "0x1a642f0E3c3aF545E7AcBD38b07251B3990914F1";
    data.to           = "0x209693Bc6afc0C5328bA36FaF03C514EF312287C";
    data.asset        = "0x833589fCD6eDb6E08f4c7C32D4f71b54bdA02913";
    data.amount       = std::to_string(10000 * (i + 1));
    data.valid_after  = 1700000000;
    data.valid_before = 1700000300;
    data.nonce.fill(static_cast<std::uint8_t>(i));
    batch.push_back(data);
  }

  std::vector<crypto::Hash256> leaves;
  for (const auto& data : batch) {
    leaves.push_back(crypto::HashPaymentData(data));
  }

  const crypto::MerkleTree tree(leaves);
  std::cout << "batch root: " << util::ToHex(tree.Root()) << '\n';

  const std::size_t index = 4;
  const auto        proof = tree.GenerateProof(index);
  std::cout << "proof for payment " << index << " (" << proof.size() << " siblings):\n";
  for (const auto& sibling : proof) {
    std::cout << "  " << util::ToHex(sibling) << '\n';
  }

  const bool ok = crypto::VerifyMerkleProof(leaves[index], proof, tree.Root(), index);
  std::cout << "proof " << (ok ? "verifies" : "does not verify") << '\n';
  return ok ? 0 : 1;
}
