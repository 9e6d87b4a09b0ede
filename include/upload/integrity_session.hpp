#ifndef CHUNKSEAL_INTEGRITY_SESSION_HPP
#define CHUNKSEAL_INTEGRITY_SESSION_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "upload/chunk_commitment_chain.hpp"
#include "upload/content_defined_chunker.hpp"
#include "upload/streaming_merkle_tree.hpp"

namespace chunkseal {

/// Summary of a finished session, as handed to the upload collaborator.
struct SessionManifest {
  std::string sessionId;
  int64_t chunkCount = 0;
  int64_t totalBytes = 0;
  std::string merkleRootHex;
  std::string latestCommitmentHex;
  std::map<int64_t, std::string> jumpEntries;
};

/**
 * @brief Feeds one file's chunk boundaries into a Merkle tree and a
 * commitment chain in lockstep.
 *
 * Boundaries must arrive in file order: the first at offset 0 and each
 * following one where the previous ended.
 */
class IntegritySession {
public:
  explicit IntegritySession(std::string sessionId);

  /**
   * @brief Append one boundary to both structures.
   * @throws ContractViolation for a gap, an overlap, an empty chunk or a
   *         malformed hash. Neither structure is touched in that case.
   */
  void ingest(const ChunkBoundary &boundary);
  void ingestAll(const std::vector<ChunkBoundary> &boundaries);

  Digest merkleRoot() const;
  std::string latestCommitment() const;
  std::optional<std::vector<Digest>> proofFor(int64_t index) const;
  int64_t totalBytes() const;
  SessionManifest manifest() const;

  const StreamingMerkleTree &tree() const { return tree_; }
  const ChunkCommitmentChain &chain() const { return chain_; }

private:
  mutable std::mutex mutex_;
  StreamingMerkleTree tree_;
  ChunkCommitmentChain chain_;
  int64_t nextOffset_ = 0;
};

} // namespace chunkseal

#endif // CHUNKSEAL_INTEGRITY_SESSION_HPP
