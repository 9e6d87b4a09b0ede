#include "upload/coverage_verifier.hpp"
#include "upload/streaming_merkle_tree.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <sodium.h>
#include <stdexcept>

namespace chunkseal {

CoverageVerifier::CoverageVerifier(double threshold) : threshold_(threshold) {
  if (!(threshold > 0.0 && threshold <= 1.0)) {
    raiseContractViolation("Coverage threshold must be in (0, 1], got " +
                           std::to_string(threshold));
  }
}

CoverageReport
CoverageVerifier::verify(const Digest &localRoot, int64_t totalLeaves,
                         const std::map<int64_t, ServerProof> &proofs) const {
  CoverageReport report;
  report.total = std::max<int64_t>(totalLeaves, 0);

  for (int64_t i = 0; i < report.total; ++i) {
    auto it = proofs.find(i);
    if (it == proofs.end()) {
      ++report.missing;
      continue;
    }
    if (StreamingMerkleTree::verifyProof(it->second.leafHash,
                                         it->second.siblings, localRoot, i,
                                         totalLeaves)) {
      ++report.valid;
    } else {
      ++report.invalid;
    }
  }

  if (report.total > 0) {
    report.coverage =
        static_cast<double>(report.valid) / static_cast<double>(report.total);
    report.passed = report.coverage >= threshold_;
  }

  Logger::getInstance().log(
      report.passed ? LogLevel::INFO : LogLevel::WARN,
      "Coverage " + std::to_string(report.valid) + "/" +
          std::to_string(report.total) + " (invalid " +
          std::to_string(report.invalid) + ", missing " +
          std::to_string(report.missing) + "): " +
          (report.passed ? "passed" : "failed"));
  return report;
}

bool CoverageVerifier::verifyChallenges(
    const Digest &localRoot, int64_t totalLeaves,
    const std::vector<int64_t> &challenges,
    const std::map<int64_t, ServerProof> &responses) const {
  if (challenges.empty()) {
    return false;
  }
  for (int64_t index : challenges) {
    auto it = responses.find(index);
    if (it == responses.end()) {
      Logger::getInstance().log(LogLevel::WARN,
                                "No response to possession challenge " +
                                    std::to_string(index));
      return false;
    }
    if (!StreamingMerkleTree::verifyProof(it->second.leafHash,
                                          it->second.siblings, localRoot,
                                          index, totalLeaves)) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Invalid proof for possession challenge " +
                                    std::to_string(index));
      return false;
    }
  }
  return true;
}

int CoverageVerifier::challengeCount(int64_t fileSizeBytes) {
  if (fileSizeBytes >= constants::POP_LARGE_FILE_BYTES) {
    return constants::POP_LARGE_CHALLENGES;
  }
  if (fileSizeBytes >= constants::POP_MEDIUM_FILE_BYTES) {
    return constants::POP_MEDIUM_CHALLENGES;
  }
  return constants::POP_SMALL_CHALLENGES;
}

int64_t CoverageVerifier::sampleCount(int64_t totalChunks) {
  if (totalChunks <= 0) {
    return 0;
  }
  int64_t log2Ceil = 0;
  while ((int64_t{1} << log2Ceil) < totalChunks) {
    ++log2Ceil;
  }
  const auto sqrtTerm = static_cast<int64_t>(
      std::ceil(std::sqrt(static_cast<double>(totalChunks) / 10.0)));
  const int64_t wanted = std::max({int64_t{1}, log2Ceil, sqrtTerm});
  return std::min(wanted, totalChunks);
}

std::vector<int64_t> CoverageVerifier::selectChallenges(int64_t totalChunks,
                                                        int64_t count) {
  if (count < 0 || totalChunks < 0 || count > totalChunks) {
    raiseContractViolation("Cannot select " + std::to_string(count) +
                           " challenges from " + std::to_string(totalChunks) +
                           " chunks");
  }
  if (totalChunks > std::numeric_limits<uint32_t>::max()) {
    raiseContractViolation("Too many chunks to challenge: " +
                           std::to_string(totalChunks));
  }
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }

  std::vector<int64_t> pool(static_cast<size_t>(totalChunks));
  std::iota(pool.begin(), pool.end(), int64_t{0});

  // Partial Fisher-Yates: the first count slots end up a uniform sample.
  for (int64_t i = 0; i < count; ++i) {
    const auto remaining = static_cast<uint32_t>(totalChunks - i);
    const int64_t j = i + randombytes_uniform(remaining);
    std::swap(pool[static_cast<size_t>(i)], pool[static_cast<size_t>(j)]);
  }

  std::vector<int64_t> picked(pool.begin(), pool.begin() + count);
  std::sort(picked.begin(), picked.end());
  return picked;
}

} // namespace chunkseal
