#pragma once

#include <cstddef>
#include <vector>

#include "internal/crypto/types.hpp"

namespace x402::crypto {

/*
  Binary keccak256 merkle tree over an ordered list of 32-byte leaves.

  Pairing rule: the two children are sorted by numeric value (smaller first)
  before HashConcat, so sibling order never matters inside a pair. The tree
  is still order-sensitive across pairs: it commits to the leaf sequence, not
  to an unordered set.

  An odd trailing node is promoted to the next layer unchanged. Proofs omit
  the sibling entry for every layer where the walked node was promoted, so a
  proof can be shorter than ceil(log2(n)).

  All layers live in one arena; layer l occupies
  nodes_[offsets_[l], offsets_[l + 1]). Immutable after construction.
*/
class MerkleTree {
 public:
  // Throws MerkleError(kMerkleEmptyTree) if `leaves` is empty.
  explicit MerkleTree(const std::vector<Hash256>& leaves);

  const Hash256& Root() const;

  std::size_t LeafCount() const;

  // Sibling hashes from the leaf layer up. Throws
  // MerkleError(kMerkleIndexOutOfRange) if index >= LeafCount().
  MerkleProof GenerateProof(std::size_t index) const;

  bool VerifyProof(const Hash256& leaf, const MerkleProof& proof, std::size_t index) const;

 private:
  std::size_t LayerCount() const;
  std::size_t LayerSize(std::size_t layer) const;
  const Hash256& Node(std::size_t layer, std::size_t position) const;

  std::vector<Hash256>     nodes_;
  std::vector<std::size_t> offsets_;
};

// Sorted-pair hash used at every tree level.
Hash256 HashPair(const Hash256& a, const Hash256& b);

bool VerifyMerkleProof(const Hash256& leaf, const MerkleProof& proof, const Hash256& root, std::size_t index);

// A single leaf is its own root. Throws MerkleError on empty input.
Hash256 ComputeMerkleRoot(const std::vector<Hash256>& leaves);

MerkleProof GenerateMerkleProof(const std::vector<Hash256>& leaves, std::size_t index);

} // namespace x402::crypto
