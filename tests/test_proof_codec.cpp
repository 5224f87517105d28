#include <gtest/gtest.h>
#include <algorithm>
#include "fixtree/core/proof_codec.hpp"
#include "fixtree/core/serializer.hpp"

using namespace fixtree::core;

static Sha256Proof sample_proof() {
  auto tree = make_sha256_tree(3, {leaf_hash("a"), leaf_hash("b"), leaf_hash("c")});
  return tree.proof(2);
}

TEST(ProofCodec, EncodedLayout) {
  auto proof = sample_proof();
  auto bytes = encode_proof(proof);
  ASSERT_EQ(bytes.size(), 4u + 3u * 33u);

  // depth, little endian
  EXPECT_EQ(bytes[0], 3);
  EXPECT_EQ(bytes[1], 0);
  EXPECT_EQ(bytes[2], 0);
  EXPECT_EQ(bytes[3], 0);
  // second level: path index then sibling bytes
  EXPECT_EQ(bytes[4 + 33], 1);
  EXPECT_TRUE(std::equal(proof.path_elements[1].begin(), proof.path_elements[1].end(), bytes.begin() + 4 + 33 + 1));
}

TEST(ProofCodec, DecodeRestoresProof) {
  auto proof = sample_proof();
  auto bytes = encode_proof(proof);
  auto decoded = decode_proof(bytes);
  EXPECT_EQ(decoded.path_index, proof.path_index);
  EXPECT_EQ(decoded.path_elements, proof.path_elements);
}

TEST(ProofCodec, EmptyProofForZeroLevelTree) {
  auto tree = make_sha256_tree(0, {leaf_hash("only")});
  auto bytes = encode_proof(tree.proof(0));
  EXPECT_EQ(bytes, (std::vector<uint8_t>{0, 0, 0, 0}));
  EXPECT_TRUE(decode_proof(bytes).path_elements.empty());
}

TEST(ProofCodec, RejectsMalformedInput) {
  auto bytes = encode_proof(sample_proof());

  auto truncated = bytes;
  truncated.pop_back();
  EXPECT_THROW(decode_proof(truncated), SerializeError);

  auto trailing = bytes;
  trailing.push_back(0);
  EXPECT_THROW(decode_proof(trailing), SerializeError);

  auto bad_side = bytes;
  bad_side[4] = 2;
  EXPECT_THROW(decode_proof(bad_side), SerializeError);

  std::vector<uint8_t> huge_depth{0xFF, 0xFF, 0xFF, 0xFF};
  EXPECT_THROW(decode_proof(huge_depth), SerializeError);

  EXPECT_THROW(decode_proof(std::vector<uint8_t>{0x01}), SerializeError);
}

TEST(ProofCodec, EncodeRejectsMismatchedPaths) {
  auto proof = sample_proof();
  proof.path_index.pop_back();
  EXPECT_THROW(encode_proof(proof), SerializeError);
}
