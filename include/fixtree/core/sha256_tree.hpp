#pragma once
#include <string>
#include <utility>
#include <vector>

#include <fixtree/core/hash.hpp>
#include <fixtree/core/merkle_tree.hpp>

namespace fixtree::core {

  struct Sha256Combine {
    Hash256 operator()(const Hash256& left, const Hash256& right) const { return hash_pair(left, right); }
  };

  using Sha256MerkleTree = MerkleTree<Hash256, Sha256Combine>;
  using Sha256Proof = Sha256MerkleTree::proof_type;

  extern template class MerkleTree<Hash256, Sha256Combine>;

  Sha256MerkleTree make_sha256_tree(const TreeConfig& config, std::vector<Hash256> leaves = {},
                                    const Hash256& zero_element = Hash256{});

  inline Sha256MerkleTree make_sha256_tree(size_t levels, std::vector<Hash256> leaves = {},
                                           const Hash256& zero_element = Hash256{}) {
    return make_sha256_tree(TreeConfig{levels}, std::move(leaves), zero_element);
  }

  // Leaf value committed for an arbitrary string payload.
  Hash256 leaf_hash(const std::string& payload);
}
