#include "upload/integrity_session.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <utility>

namespace chunkseal {

IntegritySession::IntegritySession(std::string sessionId)
    : chain_(std::move(sessionId)) {}

void IntegritySession::ingest(const ChunkBoundary &boundary) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (boundary.offset != nextOffset_) {
    raiseContractViolation("Chunk at offset " +
                           std::to_string(boundary.offset) +
                           " does not follow the previous chunk, expected " +
                           std::to_string(nextOffset_));
  }
  if (boundary.size <= 0) {
    raiseContractViolation("Chunk at offset " +
                           std::to_string(boundary.offset) + " is empty");
  }
  if (!isDigestHex(boundary.sha256Hex)) {
    raiseContractViolation("Chunk at offset " +
                           std::to_string(boundary.offset) +
                           " has a malformed hash");
  }

  tree_.appendChunk(boundary);
  chain_.appendChunk(boundary.sha256Hex);
  nextOffset_ += boundary.size;
}

void IntegritySession::ingestAll(const std::vector<ChunkBoundary> &boundaries) {
  for (const auto &boundary : boundaries) {
    ingest(boundary);
  }
  Logger::getInstance().log(LogLevel::DEBUG,
                            "Session " + chain_.sessionId() + " ingested " +
                                std::to_string(boundaries.size()) +
                                " chunks");
}

Digest IntegritySession::merkleRoot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tree_.rootHash();
}

std::string IntegritySession::latestCommitment() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chain_.getLatestCommitment();
}

std::optional<std::vector<Digest>>
IntegritySession::proofFor(int64_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tree_.generateProof(index);
}

int64_t IntegritySession::totalBytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return nextOffset_;
}

SessionManifest IntegritySession::manifest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  SessionManifest m;
  m.sessionId = chain_.sessionId();
  m.chunkCount = chain_.chunkCount();
  m.totalBytes = nextOffset_;
  m.merkleRootHex = tree_.rootHex();
  m.latestCommitmentHex = chain_.getLatestCommitment();
  m.jumpEntries = chain_.jumpEntries();
  return m;
}

} // namespace chunkseal
