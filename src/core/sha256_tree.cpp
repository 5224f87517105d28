#include "fixtree/core/sha256_tree.hpp"

#include <utility>

namespace fixtree::core {

  template class MerkleTree<Hash256, Sha256Combine>;

  Sha256MerkleTree make_sha256_tree(const TreeConfig& config, std::vector<Hash256> leaves,
                                    const Hash256& zero_element) {
    return Sha256MerkleTree(config, std::move(leaves), Sha256Combine{}, zero_element);
  }

  Hash256 leaf_hash(const std::string& payload) {
    return sha256(payload);
  }
}
