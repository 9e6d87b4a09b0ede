#ifndef CHUNKSEAL_CHUNK_COMMITMENT_CHAIN_HPP
#define CHUNKSEAL_CHUNK_COMMITMENT_CHAIN_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "utilities/digest.hpp"

namespace chunkseal {

/// State an external resume store persists for a chain.
struct ChainSnapshot {
  std::string sessionId;
  int64_t chunkCount = 0;
  std::string latestCommitmentHex;
  std::map<int64_t, std::string> jumpEntries; ///< index -> jump hash hex
};

/// Trusted commitment of the chunk at @c index.
struct ChainCheckpoint {
  int64_t index = 0;
  std::string commitmentHex;
};

/**
 * @brief Session-bound hash chain over a sequence of chunk hashes.
 *
 * Each chunk hash is folded into the previous commitment, starting from a
 * genesis value derived from the session id:
 *
 *   genesis      = SHA-256("Aether3D_CC_GENESIS" || sessionId)
 *   commitment_i = SHA-256("CCv1\0" || chunkHash_i || commitment_{i-1})
 *   jump_i       = SHA-256("CCv1_JUMP\0" || commitment_i)
 *
 * A sparse jump table samples the chain about every sqrt(n) chunks so a
 * cheap first-pass check can run before a full or partial replay. The chain
 * is append-only and all members serialize on one mutex.
 */
class ChunkCommitmentChain {
public:
  explicit ChunkCommitmentChain(std::string sessionId);
  ChunkCommitmentChain(const ChunkCommitmentChain &) = delete;
  ChunkCommitmentChain &operator=(const ChunkCommitmentChain &) = delete;

  /**
   * @brief Append the next chunk hash.
   * @param chunkHashHex 64 hex characters.
   * @return The new latest commitment as lowercase hex.
   * @throws ContractViolation for malformed hex; the chain is unchanged.
   */
  std::string appendChunk(const std::string &chunkHashHex);

  /// Latest commitment, or the genesis value while the chain is empty.
  std::string getLatestCommitment() const;
  std::string genesisHex() const;
  int64_t chunkCount() const;
  const std::string &sessionId() const { return sessionId_; }

  /**
   * @brief Replay the whole chain from genesis.
   * @return true only if @p hashes has exactly chunkCount() well-formed
   *         entries that reproduce every recorded commitment.
   */
  bool verifyForwardChain(const std::vector<std::string> &hashes) const;

  /**
   * @brief Replay a suffix starting at @p startIndex, trusting the
   * commitment just before it.
   *
   * @return nullopt if every supplied hash is consistent with the recorded
   *         chain, otherwise the absolute index of the first malformed or
   *         diverging entry. A hash supplied past the recorded end diverges
   *         at chunkCount(). When @p startIndex is at or past the end of the
   *         chain, @p startIndex itself is returned.
   * @throws ContractViolation if @p startIndex is negative.
   */
  std::optional<int64_t>
  verifyReverseChain(int64_t startIndex,
                     const std::vector<std::string> &hashes) const;

  /**
   * @brief Recompute every recorded jump entry from its commitment.
   *
   * An empty chain passes. A non-empty chain without jump entries fails.
   */
  bool verifyJumpChain() const;

  /**
   * @brief Check an externally persisted jump table against this chain.
   *
   * Every entry must name an index this chain recorded and carry the
   * matching hash. An empty table passes only for an empty chain.
   */
  bool verifyJumpTable(const std::map<int64_t, std::string> &table) const;

  std::map<int64_t, std::string> jumpEntries() const;
  ChainSnapshot snapshot() const;

  /**
   * @throws ContractViolation if @p index is not a recorded chunk.
   */
  ChainCheckpoint checkpoint(int64_t index) const;

  /**
   * @brief Replay @p suffix from a trusted checkpoint.
   *
   * @p suffix holds the chunk hashes that follow the checkpointed chunk.
   * Returns true iff every entry is well formed and the replay ends at
   * @p expectedLatestHex.
   */
  static bool verifyFromCheckpoint(const ChainCheckpoint &checkpoint,
                                   const std::vector<std::string> &suffix,
                                   const std::string &expectedLatestHex);

  static Digest genesis(const std::string &sessionId);
  static Digest commitment(const Digest &chunkHash, const Digest &previous);
  static Digest jumpHash(const Digest &commitment);

  /// Jump spacing in force when the chunk at @p index is appended.
  static int64_t jumpStride(int64_t index);

private:
  const Digest &previousLocked(int64_t index) const;

  const std::string sessionId_;
  const Digest genesis_;

  mutable std::mutex mutex_;
  std::vector<Digest> commitments_;
  std::map<int64_t, Digest> jumpEntries_;
};

} // namespace chunkseal

#endif // CHUNKSEAL_CHUNK_COMMITMENT_CHAIN_HPP
