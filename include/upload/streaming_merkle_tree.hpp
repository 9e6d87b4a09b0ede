#ifndef CHUNKSEAL_STREAMING_MERKLE_TREE_HPP
#define CHUNKSEAL_STREAMING_MERKLE_TREE_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "upload/content_defined_chunker.hpp"
#include "utilities/digest.hpp"

namespace chunkseal {

/// A completed subtree waiting on the carry stack.
struct MerkleStackEntry {
  Digest hash;
  int level = 0; ///< Height of the subtree; a leaf is level 0
};

/**
 * @brief Append-only Merkle tree built with a binary carry stack.
 *
 * Leaves are pushed as level 0 entries and equal-level neighbours are merged
 * immediately, so the stack holds one perfect subtree per set bit of the
 * leaf count. The root folds the stack from the newest subtree down, which
 * handles any leaf count without rebalancing.
 *
 * Leaf hashes: SHA-256(0x00 || LE32(index) || data).
 * Node hashes: SHA-256(0x01 || level || left || right).
 * Empty tree:  SHA-256(0x00).
 *
 * Leaf hashes and the internal nodes of completed subtrees are retained
 * (about 64 bytes per leaf) so an inclusion proof for any index is a
 * lookup of O(log n) stored hashes. All members serialize on one mutex.
 */
class StreamingMerkleTree {
public:
  StreamingMerkleTree() = default;
  StreamingMerkleTree(const StreamingMerkleTree &) = delete;
  StreamingMerkleTree &operator=(const StreamingMerkleTree &) = delete;

  /**
   * @brief Append a leaf over arbitrary bytes.
   * @return Index assigned to the leaf.
   * @throws ContractViolation once the tree holds UINT32_MAX leaves.
   */
  int64_t appendLeaf(const uint8_t *data, size_t size);
  int64_t appendLeaf(const std::vector<uint8_t> &data);

  /**
   * @brief Append the leaf for one chunk.
   *
   * The leaf data is the 32 raw bytes of the chunk's SHA-256, so a tree
   * built from a manifest never needs the chunk contents.
   * @throws ContractViolation if boundary.sha256Hex is not a valid digest.
   */
  int64_t appendChunk(const ChunkBoundary &boundary);

  /// Current root; emptyRoot() while no leaf was appended.
  Digest rootHash() const;
  std::string rootHex() const;

  /// Leaf hash stored at @p index, or nullopt when out of range.
  std::optional<Digest> leafHashAt(int64_t index) const;

  /**
   * @brief Sibling path for the leaf at @p index.
   *
   * Layout: siblings inside the leaf's perfect subtree (bottom-up), then
   * the folded root of all newer subtrees if any, then the roots of the
   * older subtrees from newest to oldest.
   * @return nullopt for a negative or out-of-range index or an empty tree.
   */
  std::optional<std::vector<Digest>> generateProof(int64_t index) const;

  /**
   * @brief Check an inclusion proof without a tree instance.
   *
   * Fails when the proof length is not exactly the one expected for
   * (@p index, @p totalLeaves), when the index is out of range, or when the
   * recomputed root differs from @p root.
   */
  static bool verifyProof(const Digest &leaf, const std::vector<Digest> &proof,
                          const Digest &root, int64_t index,
                          int64_t totalLeaves);

  static Digest leafHash(uint32_t index, const uint8_t *data, size_t size);
  static Digest nodeHash(uint8_t level, const Digest &left,
                         const Digest &right);
  static Digest emptyRoot();

  int64_t leafCount() const;
  size_t stackDepth() const;

private:
  int64_t appendLeafHashLocked(const Digest &leaf);
  Digest subtreeRootLocked(int64_t start, int level) const;

  mutable std::mutex mutex_;
  std::vector<MerkleStackEntry> stack_; // oldest (largest) subtree first
  std::vector<Digest> leaves_;
  // nodes_[k] holds the roots of completed subtrees of height k + 1, in
  // leaf order.
  std::vector<std::vector<Digest>> nodes_;
};

} // namespace chunkseal

#endif // CHUNKSEAL_STREAMING_MERKLE_TREE_HPP
