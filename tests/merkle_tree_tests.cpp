#include <gtest/gtest.h>
#include "test_data_utils.hpp"
#include "upload/streaming_merkle_tree.hpp"
#include "utilities/digest.hpp"
#include "utilities/errors.hpp"

#include <vector>

using namespace chunkseal;

namespace {

std::vector<uint8_t> bytesOf(const std::string &s) {
  return std::vector<uint8_t>(s.begin(), s.end());
}

Digest expectedLeaf(uint32_t index, const std::vector<uint8_t> &data) {
  std::vector<uint8_t> input = {0x00, static_cast<uint8_t>(index),
                                static_cast<uint8_t>(index >> 8),
                                static_cast<uint8_t>(index >> 16),
                                static_cast<uint8_t>(index >> 24)};
  input.insert(input.end(), data.begin(), data.end());
  return sha256(input);
}

Digest expectedNode(uint8_t level, const Digest &l, const Digest &r) {
  std::vector<uint8_t> input = {0x01, level};
  input.insert(input.end(), l.begin(), l.end());
  input.insert(input.end(), r.begin(), r.end());
  return sha256(input);
}

} // namespace

TEST(StreamingMerkleTree, EmptyRoot) {
  StreamingMerkleTree tree;
  const std::vector<uint8_t> zero = {0x00};
  EXPECT_EQ(tree.rootHash(), sha256(zero));
  EXPECT_EQ(tree.rootHash(), StreamingMerkleTree::emptyRoot());
  EXPECT_EQ(tree.leafCount(), 0);
  EXPECT_EQ(tree.stackDepth(), 0u);
}

TEST(StreamingMerkleTree, SingleLeafRootIsLeafHash) {
  StreamingMerkleTree tree;
  auto d = bytesOf("chunk zero");
  EXPECT_EQ(tree.appendLeaf(d), 0);
  EXPECT_EQ(tree.rootHash(), expectedLeaf(0, d));
  EXPECT_EQ(tree.rootHash(), StreamingMerkleTree::leafHash(0, d.data(), d.size()));
}

TEST(StreamingMerkleTree, TwoLeaves) {
  auto d0 = bytesOf("D0");
  auto d1 = bytesOf("D1");
  StreamingMerkleTree tree;
  tree.appendLeaf(d0);
  tree.appendLeaf(d1);
  EXPECT_EQ(tree.rootHash(),
            expectedNode(0, expectedLeaf(0, d0), expectedLeaf(1, d1)));
  EXPECT_EQ(tree.stackDepth(), 1u);

  StreamingMerkleTree swapped;
  swapped.appendLeaf(d1);
  swapped.appendLeaf(d0);
  EXPECT_NE(swapped.rootHash(), tree.rootHash());
}

TEST(StreamingMerkleTree, IdenticalLeavesAtDifferentIndicesDiffer) {
  auto d = bytesOf("same");
  EXPECT_NE(StreamingMerkleTree::leafHash(0, d.data(), d.size()),
            StreamingMerkleTree::leafHash(1, d.data(), d.size()));
}

TEST(StreamingMerkleTree, ThreeLeavesFoldUnbalanced) {
  auto d0 = bytesOf("a");
  auto d1 = bytesOf("b");
  auto d2 = bytesOf("c");
  StreamingMerkleTree tree;
  tree.appendLeaf(d0);
  tree.appendLeaf(d1);
  tree.appendLeaf(d2);
  EXPECT_EQ(tree.stackDepth(), 2u);

  Digest left = expectedNode(0, expectedLeaf(0, d0), expectedLeaf(1, d1));
  EXPECT_EQ(tree.rootHash(), expectedNode(1, left, expectedLeaf(2, d2)));
}

TEST(StreamingMerkleTree, SevenLeavesFold) {
  std::vector<std::vector<uint8_t>> d;
  std::vector<Digest> leaves;
  StreamingMerkleTree tree;
  for (uint32_t i = 0; i < 7; ++i) {
    d.push_back(generate_pseudo_random_data(16, i));
    leaves.push_back(expectedLeaf(i, d.back()));
    tree.appendLeaf(d.back());
  }
  // Stack: [0..3] level 2, [4..5] level 1, [6] level 0.
  EXPECT_EQ(tree.stackDepth(), 3u);
  Digest a = expectedNode(1, expectedNode(0, leaves[0], leaves[1]),
                          expectedNode(0, leaves[2], leaves[3]));
  Digest b = expectedNode(0, leaves[4], leaves[5]);
  Digest acc = expectedNode(1, b, leaves[6]);
  acc = expectedNode(2, a, acc);
  EXPECT_EQ(tree.rootHash(), acc);
}

TEST(StreamingMerkleTree, StackDepthTracksSetBits) {
  StreamingMerkleTree tree;
  for (int i = 1; i <= 300; ++i) {
    tree.appendLeaf(generate_pseudo_random_data(4, i));
    size_t bits = 0;
    for (int v = i; v; v >>= 1) {
      bits += v & 1;
    }
    ASSERT_EQ(tree.stackDepth(), bits) << "after " << i << " leaves";
  }
  EXPECT_EQ(tree.leafCount(), 300);
}

TEST(StreamingMerkleTree, AppendChunkUsesRawDigestBytes) {
  const std::vector<uint8_t> data = {0x01, 0x02, 0x03};
  const Digest chunkHash = sha256(data);
  ChunkBoundary boundary{0, 3, toHex(chunkHash), 0};

  StreamingMerkleTree tree;
  tree.appendChunk(boundary);
  std::vector<uint8_t> raw(chunkHash.begin(), chunkHash.end());
  EXPECT_EQ(tree.rootHash(), expectedLeaf(0, raw));
}

TEST(StreamingMerkleTree, AppendChunkRejectsMalformedHash) {
  StreamingMerkleTree tree;
  ChunkBoundary boundary{0, 3, "not-a-hash", 0};
  EXPECT_THROW(tree.appendChunk(boundary), ContractViolation);
  EXPECT_EQ(tree.leafCount(), 0);
}

TEST(StreamingMerkleTree, LeafHashAt) {
  StreamingMerkleTree tree;
  auto d = bytesOf("x");
  tree.appendLeaf(d);
  ASSERT_TRUE(tree.leafHashAt(0).has_value());
  EXPECT_EQ(*tree.leafHashAt(0), expectedLeaf(0, d));
  EXPECT_FALSE(tree.leafHashAt(1).has_value());
  EXPECT_FALSE(tree.leafHashAt(-1).has_value());
}
