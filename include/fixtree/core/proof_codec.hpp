#pragma once
#include <cstdint>
#include <span>
#include <vector>

#include <fixtree/core/sha256_tree.hpp>

namespace fixtree::core {

  // Layout: u32 depth, then per level u8 path index followed by the 32-byte sibling.
  std::vector<uint8_t> encode_proof(const Sha256Proof& proof);

  // Throws SerializeError on truncated input, trailing bytes or a path index other than 0/1.
  Sha256Proof decode_proof(std::span<const uint8_t> bytes);
}
