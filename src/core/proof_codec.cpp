#include "fixtree/core/proof_codec.hpp"
#include "fixtree/core/serializer.hpp"

#include <string>

namespace fixtree::core {

  namespace {
    constexpr size_t kEncodedStepSize = 1 + sizeof(Hash256);
  }

  std::vector<uint8_t> encode_proof(const Sha256Proof& proof) {
    if (proof.path_elements.size() != proof.path_index.size()) {
      throw SerializeError("encode_proof: path_elements and path_index differ in length");
    }
    ByteWriter writer;
    writer.write_u32(static_cast<uint32_t>(proof.path_elements.size()));
    for (size_t level = 0; level < proof.path_elements.size(); ++level) {
      const auto& sibling = proof.path_elements[level];
      writer.write_u8(proof.path_index[level]);
      writer.write_raw(std::span<const uint8_t>(sibling.data(), sibling.size()));
    }
    return writer.take();
  }

  Sha256Proof decode_proof(std::span<const uint8_t> bytes) {
    ByteReader reader(bytes);
    const uint32_t depth = reader.read_u32();
    if (depth > reader.remaining_bytes() / kEncodedStepSize) {
      throw SerializeError("decode_proof: depth " + std::to_string(depth) + " exceeds buffer");
    }

    Sha256Proof proof;
    proof.path_elements.reserve(depth);
    proof.path_index.reserve(depth);
    for (uint32_t level = 0; level < depth; ++level) {
      const uint8_t side = reader.read_u8();
      if (side > 1) throw SerializeError("decode_proof: invalid path index at level " + std::to_string(level));
      Hash256 sibling{};
      reader.read_raw(std::span<uint8_t>(sibling.data(), sibling.size()));
      proof.path_index.push_back(side);
      proof.path_elements.push_back(sibling);
    }
    if (reader.remaining_bytes() != 0) throw SerializeError("decode_proof: trailing bytes");
    return proof;
  }
}
