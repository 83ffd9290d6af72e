#include "merkle.hpp"

#include <stdexcept>
#include <utility>

#include "internal/crypto/hashing.hpp"
#include "internal/util/errors.hpp"

namespace x402::crypto {

Hash256 HashPair(const Hash256& a, const Hash256& b) {
  // std::array compares lexicographically, i.e. as big-endian integers.
  if (b < a) {
    return HashConcat(b, a);
  }
  return HashConcat(a, b);
}

MerkleTree::MerkleTree(const std::vector<Hash256>& leaves) {
  if (leaves.empty()) {
    throw util::MerkleError::EmptyTree();
  }

  // Size the arena up front: each layer has ceil(len / 2) nodes.
  offsets_.push_back(0);
  std::size_t total = 0;
  for (std::size_t len = leaves.size();; len = (len + 1) / 2) {
    total += len;
    offsets_.push_back(total);
    if (len == 1) break;
  }

  nodes_.reserve(total);
  nodes_.insert(nodes_.end(), leaves.begin(), leaves.end());

  for (std::size_t layer = 0; layer + 1 < LayerCount(); ++layer) {
    const std::size_t size = LayerSize(layer);
    for (std::size_t i = 0; i < size; i += 2) {
      if (i + 1 < size) {
        nodes_.push_back(HashPair(Node(layer, i), Node(layer, i + 1)));
      } else {
        nodes_.push_back(Node(layer, i));
      }
    }
  }

  if (nodes_.size() != total) {
    throw std::logic_error("merkle arena size mismatch");
  }
}

std::size_t MerkleTree::LayerCount() const {
  return offsets_.size() - 1;
}

std::size_t MerkleTree::LayerSize(std::size_t layer) const {
  return offsets_[layer + 1] - offsets_[layer];
}

const Hash256& MerkleTree::Node(std::size_t layer, std::size_t position) const {
  return nodes_[offsets_[layer] + position];
}

const Hash256& MerkleTree::Root() const {
  return nodes_.back();
}

std::size_t MerkleTree::LeafCount() const {
  return LayerSize(0);
}

MerkleProof MerkleTree::GenerateProof(std::size_t index) const {
  if (index >= LeafCount()) {
    throw util::MerkleError::IndexOutOfRange(index, LeafCount());
  }

  MerkleProof proof;
  std::size_t current = index;
  for (std::size_t layer = 0; layer + 1 < LayerCount(); ++layer) {
    const std::size_t sibling = current ^ 1U;
    if (sibling < LayerSize(layer)) {
      proof.push_back(Node(layer, sibling));
    }
    current /= 2;
  }
  return proof;
}

bool MerkleTree::VerifyProof(const Hash256& leaf, const MerkleProof& proof, std::size_t index) const {
  return VerifyMerkleProof(leaf, proof, Root(), index);
}

bool VerifyMerkleProof(const Hash256& leaf, const MerkleProof& proof, const Hash256& root, std::size_t index) {
  Hash256     computed = leaf;
  std::size_t current  = index;

  for (const auto& sibling : proof) {
    Hash256 left  = computed;
    Hash256 right = sibling;
    if (current % 2 != 0) {
      std::swap(left, right);
    }
    computed = HashPair(left, right);
    current /= 2;
  }

  return computed == root;
}

Hash256 ComputeMerkleRoot(const std::vector<Hash256>& leaves) {
  if (leaves.empty()) {
    throw util::MerkleError::EmptyTree();
  }
  if (leaves.size() == 1) {
    return leaves.front();
  }
  return MerkleTree(leaves).Root();
}

MerkleProof GenerateMerkleProof(const std::vector<Hash256>& leaves, std::size_t index) {
  return MerkleTree(leaves).GenerateProof(index);
}

} // namespace x402::crypto
