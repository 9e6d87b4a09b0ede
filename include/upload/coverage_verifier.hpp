#ifndef CHUNKSEAL_COVERAGE_VERIFIER_HPP
#define CHUNKSEAL_COVERAGE_VERIFIER_HPP

#include <cstdint>
#include <map>
#include <vector>

#include "upload/upload_constants.hpp"
#include "utilities/digest.hpp"

namespace chunkseal {

/// Inclusion proof returned by a server for one chunk.
struct ServerProof {
  Digest leafHash;
  std::vector<Digest> siblings;
};

struct CoverageReport {
  int64_t total = 0;
  int64_t valid = 0;
  int64_t invalid = 0;
  int64_t missing = 0;
  double coverage = 0.0;
  bool passed = false;
};

/**
 * @brief Checks server-supplied Merkle proofs against the locally computed
 * root.
 *
 * Missing evidence counts against coverage and an empty upload never
 * passes.
 */
class CoverageVerifier {
public:
  /**
   * @throws ContractViolation unless 0 < threshold <= 1.
   */
  explicit CoverageVerifier(
      double threshold = constants::DEFAULT_COVERAGE_THRESHOLD);

  double threshold() const { return threshold_; }

  /**
   * @brief Verify one proof per leaf.
   * @param proofs Server proofs keyed by leaf index. Keys outside
   *        [0, totalLeaves) are ignored.
   */
  CoverageReport verify(const Digest &localRoot, int64_t totalLeaves,
                        const std::map<int64_t, ServerProof> &proofs) const;

  /**
   * @brief Proof-of-possession check over a set of challenged indices.
   * @return true only if @p challenges is non-empty and every challenged
   *         index has a response that verifies.
   */
  bool verifyChallenges(const Digest &localRoot, int64_t totalLeaves,
                        const std::vector<int64_t> &challenges,
                        const std::map<int64_t, ServerProof> &responses) const;

  /// Number of possession challenges to issue for a file of this size.
  static int challengeCount(int64_t fileSizeBytes);

  /// Spot-check sample size for @p totalChunks chunks.
  static int64_t sampleCount(int64_t totalChunks);

  /**
   * @brief Pick @p count distinct chunk indices uniformly at random.
   * @return Sorted indices.
   * @throws ContractViolation if @p count is negative or exceeds
   *         @p totalChunks.
   */
  static std::vector<int64_t> selectChallenges(int64_t totalChunks,
                                               int64_t count);

private:
  double threshold_;
};

} // namespace chunkseal

#endif // CHUNKSEAL_COVERAGE_VERIFIER_HPP
