#include "upload/streaming_merkle_tree.hpp"
#include "upload/upload_constants.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <limits>

namespace chunkseal {

namespace {

constexpr int64_t MAX_LEAVES = std::numeric_limits<uint32_t>::max();

// One perfect subtree of a tree with a given leaf count.
struct SubtreeSpan {
  int64_t start;
  int height;
};

// Perfect subtrees of an n-leaf carry tree, oldest (largest) first. This is
// the binary expansion of n and mirrors the carry stack exactly.
std::vector<SubtreeSpan> decompose(int64_t totalLeaves) {
  std::vector<SubtreeSpan> spans;
  int64_t start = 0;
  for (int bit = 32; bit >= 0; --bit) {
    const int64_t size = int64_t{1} << bit;
    if (totalLeaves & size) {
      spans.push_back({start, bit});
      start += size;
    }
  }
  return spans;
}

size_t findSpan(const std::vector<SubtreeSpan> &spans, int64_t index) {
  for (size_t j = 0; j < spans.size(); ++j) {
    if (index < spans[j].start + (int64_t{1} << spans[j].height)) {
      return j;
    }
  }
  return spans.size();
}

} // namespace

Digest StreamingMerkleTree::leafHash(uint32_t index, const uint8_t *data,
                                     size_t size) {
  const uint8_t indexLE[4] = {
      static_cast<uint8_t>(index), static_cast<uint8_t>(index >> 8),
      static_cast<uint8_t>(index >> 16), static_cast<uint8_t>(index >> 24)};
  Sha256Builder builder;
  builder.updateByte(constants::MERKLE_LEAF_PREFIX)
      .update(indexLE, sizeof(indexLE))
      .update(data, size);
  return builder.finalize();
}

Digest StreamingMerkleTree::nodeHash(uint8_t level, const Digest &left,
                                     const Digest &right) {
  Sha256Builder builder;
  builder.updateByte(constants::MERKLE_NODE_PREFIX)
      .updateByte(level)
      .update(left)
      .update(right);
  return builder.finalize();
}

Digest StreamingMerkleTree::emptyRoot() {
  const uint8_t tag = constants::MERKLE_LEAF_PREFIX;
  return sha256(&tag, 1);
}

int64_t StreamingMerkleTree::appendLeaf(const uint8_t *data, size_t size) {
  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t index = static_cast<int64_t>(leaves_.size());
  if (index >= MAX_LEAVES) {
    raiseContractViolation("Merkle tree is full (" +
                           std::to_string(MAX_LEAVES) + " leaves)");
  }
  return appendLeafHashLocked(
      leafHash(static_cast<uint32_t>(index), data, size));
}

int64_t StreamingMerkleTree::appendLeaf(const std::vector<uint8_t> &data) {
  return appendLeaf(data.data(), data.size());
}

int64_t StreamingMerkleTree::appendChunk(const ChunkBoundary &boundary) {
  const Digest digest = digestFromHex(boundary.sha256Hex);
  return appendLeaf(digest.data(), digest.size());
}

int64_t StreamingMerkleTree::appendLeafHashLocked(const Digest &leaf) {
  const int64_t index = static_cast<int64_t>(leaves_.size());
  leaves_.push_back(leaf);
  stack_.push_back({leaf, 0});

  // Carry: merge while the two newest subtrees have the same height.
  while (stack_.size() >= 2 &&
         stack_[stack_.size() - 1].level == stack_[stack_.size() - 2].level) {
    MerkleStackEntry newer = stack_.back();
    stack_.pop_back();
    MerkleStackEntry older = stack_.back();
    stack_.pop_back();
    const int level = older.level + 1;
    const Digest node =
        nodeHash(static_cast<uint8_t>(older.level), older.hash, newer.hash);
    // Completed subtrees of one height finish left to right.
    if (static_cast<int>(nodes_.size()) < level) {
      nodes_.emplace_back();
    }
    nodes_[static_cast<size_t>(level - 1)].push_back(node);
    stack_.push_back({node, level});
  }

  Logger::trace("merkle leaf %lld appended, stack depth %zu",
                static_cast<long long>(index), stack_.size());
  return index;
}

Digest StreamingMerkleTree::rootHash() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stack_.empty()) {
    return emptyRoot();
  }
  Digest acc = stack_.back().hash;
  for (size_t i = stack_.size() - 1; i-- > 0;) {
    acc = nodeHash(static_cast<uint8_t>(stack_[i].level), stack_[i].hash, acc);
  }
  return acc;
}

std::string StreamingMerkleTree::rootHex() const { return toHex(rootHash()); }

std::optional<Digest> StreamingMerkleTree::leafHashAt(int64_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index < 0 || index >= static_cast<int64_t>(leaves_.size())) {
    return std::nullopt;
  }
  return leaves_[static_cast<size_t>(index)];
}

Digest StreamingMerkleTree::subtreeRootLocked(int64_t start, int level) const {
  if (level == 0) {
    return leaves_[static_cast<size_t>(start)];
  }
  return nodes_[static_cast<size_t>(level - 1)]
               [static_cast<size_t>(start >> level)];
}

std::optional<std::vector<Digest>>
StreamingMerkleTree::generateProof(int64_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t total = static_cast<int64_t>(leaves_.size());
  if (index < 0 || index >= total) {
    return std::nullopt;
  }

  const std::vector<SubtreeSpan> spans = decompose(total);
  const size_t j = findSpan(spans, index);
  const SubtreeSpan &span = spans[j];
  const int64_t offset = index - span.start;

  std::vector<Digest> proof;
  proof.reserve(static_cast<size_t>(span.height) + spans.size());

  for (int level = 0; level < span.height; ++level) {
    const int64_t siblingStart = span.start + (((offset >> level) ^ 1) << level);
    proof.push_back(subtreeRootLocked(siblingStart, level));
  }

  // stack_ holds exactly one entry per span, in the same order.
  if (j + 1 < stack_.size()) {
    Digest acc = stack_.back().hash;
    for (size_t t = stack_.size() - 1; t-- > j + 1;) {
      acc = nodeHash(static_cast<uint8_t>(stack_[t].level), stack_[t].hash,
                     acc);
    }
    proof.push_back(acc);
  }
  for (size_t t = j; t-- > 0;) {
    proof.push_back(stack_[t].hash);
  }
  return proof;
}

bool StreamingMerkleTree::verifyProof(const Digest &leaf,
                                      const std::vector<Digest> &proof,
                                      const Digest &root, int64_t index,
                                      int64_t totalLeaves) {
  if (totalLeaves <= 0 || totalLeaves > MAX_LEAVES || index < 0 ||
      index >= totalLeaves) {
    return false;
  }

  const std::vector<SubtreeSpan> spans = decompose(totalLeaves);
  const size_t j = findSpan(spans, index);
  const SubtreeSpan &span = spans[j];
  const bool hasNewer = j + 1 < spans.size();
  const size_t expected =
      static_cast<size_t>(span.height) + (hasNewer ? 1 : 0) + j;
  if (proof.size() != expected) {
    return false;
  }

  const int64_t offset = index - span.start;
  Digest current = leaf;
  size_t pos = 0;
  for (int level = 0; level < span.height; ++level, ++pos) {
    if (((offset >> level) & 1) == 0) {
      current = nodeHash(static_cast<uint8_t>(level), current, proof[pos]);
    } else {
      current = nodeHash(static_cast<uint8_t>(level), proof[pos], current);
    }
  }
  if (hasNewer) {
    current =
        nodeHash(static_cast<uint8_t>(span.height), current, proof[pos++]);
  }
  for (size_t t = j; t-- > 0; ++pos) {
    current =
        nodeHash(static_cast<uint8_t>(spans[t].height), proof[pos], current);
  }
  return digestEquals(current, root);
}

int64_t StreamingMerkleTree::leafCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int64_t>(leaves_.size());
}

size_t StreamingMerkleTree::stackDepth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stack_.size();
}

} // namespace chunkseal
