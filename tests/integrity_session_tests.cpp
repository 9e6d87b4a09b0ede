#include <gtest/gtest.h>
#include "test_data_utils.hpp"
#include "upload/content_defined_chunker.hpp"
#include "upload/integrity_session.hpp"
#include "utilities/digest.hpp"
#include "utilities/errors.hpp"

#include <cstdio>
#include <string>
#include <vector>

using namespace chunkseal;

TEST(IntegritySession, ThreeByteFileScenario) {
  const std::vector<uint8_t> data = {0x01, 0x02, 0x03};
  std::string path = write_temp_file("session_three_bytes.bin", data);
  auto boundaries = ContentDefinedChunker().chunkFile(path);
  std::remove(path.c_str());

  ASSERT_EQ(boundaries.size(), 1u);
  EXPECT_EQ(boundaries[0].offset, 0);
  EXPECT_EQ(boundaries[0].size, 3);
  const Digest chunkHash = sha256(data);
  EXPECT_EQ(boundaries[0].sha256Hex, toHex(chunkHash));

  IntegritySession session("s1");
  session.ingestAll(boundaries);

  const Digest genesis = sha256(std::string("Aether3D_CC_GENESIS") + "s1");
  std::string input("CCv1\0", 5);
  input.append(chunkHash.begin(), chunkHash.end());
  input.append(genesis.begin(), genesis.end());
  EXPECT_EQ(session.latestCommitment(), toHex(sha256(input)));

  // The leaf is the raw chunk digest at index 0.
  std::vector<uint8_t> leafInput = {0x00, 0x00, 0x00, 0x00, 0x00};
  leafInput.insert(leafInput.end(), chunkHash.begin(), chunkHash.end());
  EXPECT_EQ(session.merkleRoot(), sha256(leafInput));

  SessionManifest m = session.manifest();
  EXPECT_EQ(m.sessionId, "s1");
  EXPECT_EQ(m.chunkCount, 1);
  EXPECT_EQ(m.totalBytes, 3);
  EXPECT_EQ(m.merkleRootHex, toHex(session.merkleRoot()));
  EXPECT_EQ(m.latestCommitmentHex, session.latestCommitment());
  ASSERT_EQ(m.jumpEntries.size(), 1u);
  EXPECT_EQ(m.jumpEntries.begin()->first, 0);
}

TEST(IntegritySession, TreeAndChainStayInStep) {
  ChunkerConfig cfg;
  cfg.minChunkSize = 64;
  cfg.avgChunkSize = 256;
  cfg.maxChunkSize = 1024;
  auto data = generate_pseudo_random_data(50000, 8);
  auto boundaries =
      ContentDefinedChunker(cfg).chunkBuffer(data.data(), data.size());

  IntegritySession session("in-step");
  session.ingestAll(boundaries);
  EXPECT_EQ(session.tree().leafCount(),
            static_cast<int64_t>(boundaries.size()));
  EXPECT_EQ(session.chain().chunkCount(),
            static_cast<int64_t>(boundaries.size()));
  EXPECT_EQ(session.totalBytes(), 50000);

  std::vector<std::string> hashes;
  for (const auto &b : boundaries) {
    hashes.push_back(b.sha256Hex);
  }
  EXPECT_TRUE(session.chain().verifyForwardChain(hashes));

  const Digest root = session.merkleRoot();
  for (int64_t i = 0; i < static_cast<int64_t>(boundaries.size()); i += 13) {
    auto proof = session.proofFor(i);
    ASSERT_TRUE(proof.has_value());
    EXPECT_TRUE(StreamingMerkleTree::verifyProof(
        *session.tree().leafHashAt(i), *proof, root, i,
        static_cast<int64_t>(boundaries.size())));
  }
}

TEST(IntegritySession, RejectsGapsOverlapsAndBadHashes) {
  const std::string h = toHex(sha256(std::string("chunk")));
  IntegritySession session("strict");
  EXPECT_THROW(session.ingest(ChunkBoundary{5, 10, h, 0}), ContractViolation);
  session.ingest(ChunkBoundary{0, 10, h, 0});
  EXPECT_THROW(session.ingest(ChunkBoundary{5, 10, h, 0}), ContractViolation);
  EXPECT_THROW(session.ingest(ChunkBoundary{11, 10, h, 0}), ContractViolation);
  EXPECT_THROW(session.ingest(ChunkBoundary{10, 0, h, 0}), ContractViolation);
  EXPECT_THROW(session.ingest(ChunkBoundary{10, 4, "bad", 0}),
               ContractViolation);

  // Nothing was appended by the rejected calls.
  EXPECT_EQ(session.tree().leafCount(), 1);
  EXPECT_EQ(session.chain().chunkCount(), 1);
  session.ingest(ChunkBoundary{10, 4, h, 0});
  EXPECT_EQ(session.totalBytes(), 14);
}
