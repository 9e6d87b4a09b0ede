#include "upload/chunk_commitment_chain.hpp"
#include "upload/upload_constants.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <cmath>
#include <utility>

namespace chunkseal {

Digest ChunkCommitmentChain::genesis(const std::string &sessionId) {
  Sha256Builder builder;
  builder.update(constants::COMMITMENT_CHAIN_GENESIS_PREFIX).update(sessionId);
  return builder.finalize();
}

Digest ChunkCommitmentChain::commitment(const Digest &chunkHash,
                                        const Digest &previous) {
  Sha256Builder builder;
  builder.update(constants::COMMITMENT_CHAIN_DOMAIN)
      .update(chunkHash)
      .update(previous);
  return builder.finalize();
}

Digest ChunkCommitmentChain::jumpHash(const Digest &commitment) {
  Sha256Builder builder;
  builder.update(constants::COMMITMENT_CHAIN_JUMP_DOMAIN).update(commitment);
  return builder.finalize();
}

int64_t ChunkCommitmentChain::jumpStride(int64_t index) {
  if (index <= 0) {
    return 1;
  }
  // Integer ceil(sqrt(index)); the floating estimate is corrected both ways.
  int64_t root = static_cast<int64_t>(std::sqrt(static_cast<double>(index)));
  while (root * root > index) {
    --root;
  }
  while (root * root < index) {
    ++root;
  }
  return root + 1;
}

ChunkCommitmentChain::ChunkCommitmentChain(std::string sessionId)
    : sessionId_(std::move(sessionId)), genesis_(genesis(sessionId_)) {
  Logger::getInstance().log(LogLevel::DEBUG,
                            "Commitment chain opened for session " +
                                sessionId_ + ", genesis " + toHex(genesis_));
}

const Digest &ChunkCommitmentChain::previousLocked(int64_t index) const {
  return index == 0 ? genesis_ : commitments_[static_cast<size_t>(index - 1)];
}

std::string ChunkCommitmentChain::appendChunk(const std::string &chunkHashHex) {
  const Digest chunkHash = digestFromHex(chunkHashHex);

  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t index = static_cast<int64_t>(commitments_.size());
  const Digest next = commitment(chunkHash, previousLocked(index));
  commitments_.push_back(next);
  if (index % jumpStride(index) == 0) {
    jumpEntries_.emplace(index, jumpHash(next));
  }
  Logger::trace("chain %s: commitment %lld", sessionId_.c_str(),
                static_cast<long long>(index));
  return toHex(next);
}

std::string ChunkCommitmentChain::getLatestCommitment() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return toHex(commitments_.empty() ? genesis_ : commitments_.back());
}

std::string ChunkCommitmentChain::genesisHex() const { return toHex(genesis_); }

int64_t ChunkCommitmentChain::chunkCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int64_t>(commitments_.size());
}

bool ChunkCommitmentChain::verifyForwardChain(
    const std::vector<std::string> &hashes) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (hashes.size() != commitments_.size()) {
    Logger::getInstance().log(
        LogLevel::WARN, "Forward verification of session " + sessionId_ +
                            " failed: expected " +
                            std::to_string(commitments_.size()) +
                            " hashes, got " + std::to_string(hashes.size()));
    return false;
  }

  Digest current = genesis_;
  for (size_t i = 0; i < hashes.size(); ++i) {
    if (!isDigestHex(hashes[i])) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Forward verification of session " +
                                    sessionId_ + " failed: malformed hash at " +
                                    std::to_string(i));
      return false;
    }
    current = commitment(digestFromHex(hashes[i]), current);
    if (!digestEquals(current, commitments_[i])) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Forward verification of session " +
                                    sessionId_ + " diverges at " +
                                    std::to_string(i));
      return false;
    }
  }
  return true;
}

std::optional<int64_t> ChunkCommitmentChain::verifyReverseChain(
    int64_t startIndex, const std::vector<std::string> &hashes) const {
  if (startIndex < 0) {
    raiseContractViolation("Reverse verification start index must not be "
                           "negative, got " +
                           std::to_string(startIndex));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t count = static_cast<int64_t>(commitments_.size());
  if (startIndex >= count) {
    return startIndex;
  }

  Digest current = previousLocked(startIndex);
  for (size_t k = 0; k < hashes.size(); ++k) {
    const int64_t index = startIndex + static_cast<int64_t>(k);
    if (index >= count) {
      return count;
    }
    if (!isDigestHex(hashes[k])) {
      return index;
    }
    current = commitment(digestFromHex(hashes[k]), current);
    if (!digestEquals(current, commitments_[static_cast<size_t>(index)])) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Reverse verification of session " +
                                    sessionId_ + " diverges at " +
                                    std::to_string(index));
      return index;
    }
  }
  return std::nullopt;
}

bool ChunkCommitmentChain::verifyJumpChain() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (commitments_.empty()) {
    return true;
  }
  if (jumpEntries_.empty()) {
    return false;
  }
  for (const auto &[index, hash] : jumpEntries_) {
    if (index >= static_cast<int64_t>(commitments_.size()) ||
        !digestEquals(hash,
                      jumpHash(commitments_[static_cast<size_t>(index)]))) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Jump entry " + std::to_string(index) +
                                    " of session " + sessionId_ +
                                    " does not match its commitment");
      return false;
    }
  }
  return true;
}

bool ChunkCommitmentChain::verifyJumpTable(
    const std::map<int64_t, std::string> &table) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (table.empty()) {
    return commitments_.empty();
  }
  for (const auto &[index, hex] : table) {
    auto it = jumpEntries_.find(index);
    if (it == jumpEntries_.end() || !isDigestHex(hex)) {
      return false;
    }
    if (!digestEquals(digestFromHex(hex),
                      jumpHash(commitments_[static_cast<size_t>(index)]))) {
      return false;
    }
  }
  return true;
}

std::map<int64_t, std::string> ChunkCommitmentChain::jumpEntries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<int64_t, std::string> out;
  for (const auto &[index, hash] : jumpEntries_) {
    out.emplace(index, toHex(hash));
  }
  return out;
}

ChainSnapshot ChunkCommitmentChain::snapshot() const {
  ChainSnapshot snap;
  snap.sessionId = sessionId_;

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &[index, hash] : jumpEntries_) {
    snap.jumpEntries.emplace(index, toHex(hash));
  }
  snap.chunkCount = static_cast<int64_t>(commitments_.size());
  snap.latestCommitmentHex =
      toHex(commitments_.empty() ? genesis_ : commitments_.back());
  return snap;
}

ChainCheckpoint ChunkCommitmentChain::checkpoint(int64_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index < 0 || index >= static_cast<int64_t>(commitments_.size())) {
    raiseContractViolation("Checkpoint index " + std::to_string(index) +
                           " is outside a chain of " +
                           std::to_string(commitments_.size()) + " chunks");
  }
  return ChainCheckpoint{index,
                         toHex(commitments_[static_cast<size_t>(index)])};
}

bool ChunkCommitmentChain::verifyFromCheckpoint(
    const ChainCheckpoint &checkpoint, const std::vector<std::string> &suffix,
    const std::string &expectedLatestHex) {
  if (checkpoint.index < 0 || !isDigestHex(checkpoint.commitmentHex) ||
      !isDigestHex(expectedLatestHex)) {
    return false;
  }
  Digest current = digestFromHex(checkpoint.commitmentHex);
  for (const auto &hex : suffix) {
    if (!isDigestHex(hex)) {
      return false;
    }
    current = commitment(digestFromHex(hex), current);
  }
  return digestEquals(current, digestFromHex(expectedLatestHex));
}

} // namespace chunkseal
